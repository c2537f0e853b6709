// =============================================================================
// logq - Field Values
// =============================================================================
// Typed values extracted from record fields, and their coercion rules.
//
// FieldValue views the record's bytes (string fields) and is valid only while
// the record is. OwnedValue is the detached form kept in results.
// =============================================================================

#ifndef LOGQ_PARSE_FIELD_VALUE_H
#define LOGQ_PARSE_FIELD_VALUE_H

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace logq::parse {

// =============================================================================
// Field Types
// =============================================================================

/// @brief Declared type of a schema field.
enum class FieldType : std::uint8_t {
    kString = 0,
    kInteger = 1,
    kFloat = 2,
    kTimestamp = 3
};

/// @brief Get the configuration name of a field type (e.g. "int").
[[nodiscard]] std::string_view fieldTypeToString(FieldType type) noexcept;

/// @brief Parse a field type name (string/str, int/integer, float/double,
///        timestamp/time/ts).
[[nodiscard]] std::optional<FieldType> fieldTypeFromString(std::string_view name) noexcept;

/// @brief Check whether a type supports numeric aggregation.
[[nodiscard]] constexpr bool isNumeric(FieldType type) noexcept {
    return type == FieldType::kInteger || type == FieldType::kFloat;
}

// =============================================================================
// Timestamp
// =============================================================================

/// @brief Instant with millisecond precision, UTC.
struct Timestamp {
    std::int64_t epochMillis = 0;

    friend constexpr auto operator<=>(const Timestamp&, const Timestamp&) = default;
};

// =============================================================================
// Values
// =============================================================================

/// @brief Value of one field in the record being evaluated.
/// @note std::monostate marks an absent field.
using FieldValue = std::variant<std::monostate, std::string_view, std::int64_t, double, Timestamp>;

/// @brief Detached value stored in matches and group keys.
using OwnedValue = std::variant<std::monostate, std::string, std::int64_t, double, Timestamp>;

/// @brief Check whether a field carries a value.
[[nodiscard]] inline bool isPresent(const FieldValue& value) noexcept {
    return !std::holds_alternative<std::monostate>(value);
}

/// @brief Copy a value out of the record buffer.
[[nodiscard]] OwnedValue toOwned(const FieldValue& value);

/// @brief Render a value as text (absent renders as an empty string).
[[nodiscard]] std::string formatValue(const FieldValue& value);
[[nodiscard]] std::string formatValue(const OwnedValue& value);

/// @brief Total order on owned values: absent first, then by alternative.
[[nodiscard]] std::weak_ordering compareOwned(const OwnedValue& lhs, const OwnedValue& rhs);

// =============================================================================
// Coercion
// =============================================================================

/// @brief Parse a base-10 signed integer (optional leading sign).
[[nodiscard]] std::optional<std::int64_t> parseInteger(std::string_view text) noexcept;

/// @brief Parse a decimal floating-point number.
[[nodiscard]] std::optional<double> parseFloat(std::string_view text) noexcept;

/// @brief Parse a timestamp.
///
/// Accepted forms:
/// - YYYY-MM-DD, optionally followed by [T| ]HH:MM[:SS[.fraction]]
/// - '/' as date separator instead of '-'
/// - trailing Z or +HH:MM / -HH:MM / +HHMM offset
/// - YYYYMMDD (exactly eight digits)
/// - other all-digit text: epoch seconds (up to 11 digits) or epoch milliseconds
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view text) noexcept;

/// @brief Render a timestamp as ISO 8601 UTC ("2024-01-02T03:04:05.678Z").
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

/// @brief Coerce a token to a declared type.
/// @return The typed value, or std::nullopt when the token does not parse.
[[nodiscard]] std::optional<FieldValue> coerce(std::string_view token, FieldType type) noexcept;

// =============================================================================
// FieldSet
// =============================================================================

/// @brief Per-record extracted values, indexed by schema position.
class FieldSet {
public:
    FieldSet() = default;
    explicit FieldSet(std::size_t fieldCount) : values_(fieldCount) {}

    /// @brief Reset to fieldCount absent values.
    void reset(std::size_t fieldCount) {
        values_.assign(fieldCount, FieldValue{});
    }

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    [[nodiscard]] const FieldValue& operator[](std::size_t index) const { return values_[index]; }
    [[nodiscard]] FieldValue& operator[](std::size_t index) { return values_[index]; }

    [[nodiscard]] bool has(std::size_t index) const noexcept {
        return index < values_.size() && isPresent(values_[index]);
    }

private:
    std::vector<FieldValue> values_;
};

}  // namespace logq::parse

#endif  // LOGQ_PARSE_FIELD_VALUE_H
