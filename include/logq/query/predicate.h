// =============================================================================
// logq - Predicate
// =============================================================================
// Compiled conjunction of field conditions, evaluated against a FieldSet.
//
// Conditions are compiled once against the schema: operands are parsed to the
// field's declared type, comparators checked against it, and the list ordered
// by estimated evaluation cost (stable for equal cost). Evaluation stops at
// the first failing condition and depends on nothing but the FieldSet.
// =============================================================================

#ifndef LOGQ_QUERY_PREDICATE_H
#define LOGQ_QUERY_PREDICATE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "logq/common/error.h"
#include "logq/common/hash.h"
#include "logq/parse/field_value.h"
#include "logq/parse/schema.h"
#include "logq/query/matchers.h"

namespace logq::query {

// =============================================================================
// Comparators
// =============================================================================

/// @brief Condition operator.
enum class Comparator : std::uint8_t {
    kEq = 0,
    kNe,
    kLt,
    kLe,
    kGt,
    kGe,
    kBetween,   ///< Inclusive [lo, hi]
    kIn,        ///< Any of a set
    kPrefix,
    kSuffix,
    kContains,
    kExists,
    kCidr,      ///< IP rule list
    kDomain     ///< Domain rule list
};

/// @brief Get the grammar spelling of a comparator ("==", "between", ...).
[[nodiscard]] std::string_view comparatorToString(Comparator op) noexcept;

/// @brief Parse a comparator spelling ("=" is accepted for "==").
[[nodiscard]] std::optional<Comparator> comparatorFromString(std::string_view text) noexcept;

// =============================================================================
// Condition Specification
// =============================================================================

/// @brief Uncompiled condition as written by the user.
struct ConditionSpec {
    std::string field;
    Comparator op = Comparator::kEq;
    std::vector<std::string> operands;

    friend bool operator==(const ConditionSpec&, const ConditionSpec&) = default;
};

// =============================================================================
// Condition
// =============================================================================

/// @brief One condition compiled against a schema.
class Condition {
public:
    /// @brief Typed operand.
    using Operand = std::variant<std::string, std::int64_t, double, parse::Timestamp>;

    /// @brief Compile a condition.
    /// @return ConfigError for unknown fields, operand count or type errors,
    ///         and comparators not applicable to the field's type.
    [[nodiscard]] static Result<Condition> compile(const ConditionSpec& spec,
                                                   const parse::Schema& schema);

    /// @brief Evaluate against an extracted record.
    [[nodiscard]] bool evaluate(const parse::FieldSet& fields) const;

    [[nodiscard]] std::size_t fieldIndex() const noexcept { return field_; }
    [[nodiscard]] Comparator op() const noexcept { return op_; }

    /// @brief Relative evaluation cost (lower runs first).
    [[nodiscard]] unsigned cost() const noexcept;

private:
    Condition() = default;

    [[nodiscard]] bool evaluateValue(const parse::FieldValue& value) const;

    std::size_t field_ = 0;
    parse::FieldType type_ = parse::FieldType::kString;
    Comparator op_ = Comparator::kEq;
    std::vector<Operand> operands_;
    StringSet stringSet_;
    std::optional<IpMatcher> ipMatcher_;
    std::optional<DomainMatcher> domainMatcher_;
};

// =============================================================================
// Predicate
// =============================================================================

/// @brief Conjunction of compiled conditions; empty matches everything.
class Predicate {
public:
    Predicate() = default;

    /// @brief Compile and cost-order a condition list.
    [[nodiscard]] static Result<Predicate> compile(const std::vector<ConditionSpec>& specs,
                                                   const parse::Schema& schema);

    /// @brief Test a record. Short-circuits on the first failing condition.
    [[nodiscard]] bool evaluate(const parse::FieldSet& fields) const;

    /// @brief Conditions in evaluation order.
    [[nodiscard]] const std::vector<Condition>& conditions() const noexcept { return conditions_; }

    /// @brief Schema positions referenced by any condition.
    [[nodiscard]] std::vector<std::size_t> referencedFields() const;

private:
    std::vector<Condition> conditions_;
};

}  // namespace logq::query

#endif  // LOGQ_QUERY_PREDICATE_H
