// =============================================================================
// logq - Predicate Implementation
// =============================================================================

#include "logq/query/predicate.h"

#include <algorithm>
#include <compare>

#include <fmt/format.h>

namespace logq::query {

// =============================================================================
// Comparators
// =============================================================================

std::string_view comparatorToString(Comparator op) noexcept {
    switch (op) {
        case Comparator::kEq:
            return "==";
        case Comparator::kNe:
            return "!=";
        case Comparator::kLt:
            return "<";
        case Comparator::kLe:
            return "<=";
        case Comparator::kGt:
            return ">";
        case Comparator::kGe:
            return ">=";
        case Comparator::kBetween:
            return "between";
        case Comparator::kIn:
            return "in";
        case Comparator::kPrefix:
            return "prefix";
        case Comparator::kSuffix:
            return "suffix";
        case Comparator::kContains:
            return "contains";
        case Comparator::kExists:
            return "exists";
        case Comparator::kCidr:
            return "cidr";
        case Comparator::kDomain:
            return "domain";
        default:
            return "?";
    }
}

std::optional<Comparator> comparatorFromString(std::string_view text) noexcept {
    static constexpr std::pair<std::string_view, Comparator> kSpellings[] = {
        {"==", Comparator::kEq},          {"=", Comparator::kEq},
        {"!=", Comparator::kNe},          {"<", Comparator::kLt},
        {"<=", Comparator::kLe},          {">", Comparator::kGt},
        {">=", Comparator::kGe},          {"between", Comparator::kBetween},
        {"in", Comparator::kIn},          {"prefix", Comparator::kPrefix},
        {"suffix", Comparator::kSuffix},  {"contains", Comparator::kContains},
        {"exists", Comparator::kExists},  {"cidr", Comparator::kCidr},
        {"domain", Comparator::kDomain},
    };
    for (const auto& [spelling, op] : kSpellings) {
        if (spelling == text) {
            return op;
        }
    }
    return std::nullopt;
}

namespace {

bool isStringOnly(Comparator op) noexcept {
    return op == Comparator::kPrefix || op == Comparator::kSuffix ||
           op == Comparator::kContains || op == Comparator::kCidr || op == Comparator::kDomain;
}

Result<Condition::Operand> parseOperand(const std::string& text, parse::FieldType type,
                                        const std::string& field) {
    using parse::FieldType;

    switch (type) {
        case FieldType::kString:
            return Condition::Operand{text};
        case FieldType::kInteger:
            if (auto v = parse::parseInteger(text)) {
                return Condition::Operand{*v};
            }
            break;
        case FieldType::kFloat:
            if (auto v = parse::parseFloat(text)) {
                return Condition::Operand{*v};
            }
            break;
        case FieldType::kTimestamp:
            if (auto v = parse::parseTimestamp(text)) {
                return Condition::Operand{*v};
            }
            break;
    }
    return makeError<Condition::Operand>(
        ErrorCode::kConfigError, fmt::format("operand '{}' is not a valid {} for field '{}'", text,
                                             parse::fieldTypeToString(type), field));
}

/// @brief Order a present field value against an operand of the same type.
std::partial_ordering compareTo(const parse::FieldValue& value, const Condition::Operand& operand) {
    if (const auto* s = std::get_if<std::string_view>(&value)) {
        return *s <=> std::string_view(std::get<std::string>(operand));
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return *i <=> std::get<std::int64_t>(operand);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d <=> std::get<double>(operand);
    }
    if (const auto* t = std::get_if<parse::Timestamp>(&value)) {
        return *t <=> std::get<parse::Timestamp>(operand);
    }
    return std::partial_ordering::unordered;
}

}  // namespace

// =============================================================================
// Condition
// =============================================================================

Result<Condition> Condition::compile(const ConditionSpec& spec, const parse::Schema& schema) {
    auto index = schema.indexOf(spec.field);
    if (!index) {
        return makeError<Condition>(ErrorCode::kConfigError,
                                    fmt::format("condition references unknown field '{}'",
                                                spec.field));
    }

    Condition condition;
    condition.field_ = *index;
    condition.type_ = schema.field(*index).type;
    condition.op_ = spec.op;

    const std::string_view opName = comparatorToString(spec.op);
    const std::size_t count = spec.operands.size();

    switch (spec.op) {
        case Comparator::kExists:
            if (count != 0) {
                return makeError<Condition>(ErrorCode::kConfigError,
                                            fmt::format("'{}' takes no operand", opName));
            }
            break;
        case Comparator::kBetween:
            if (count != 2) {
                return makeError<Condition>(
                    ErrorCode::kConfigError,
                    fmt::format("'between' on '{}' needs exactly two operands", spec.field));
            }
            break;
        case Comparator::kIn:
        case Comparator::kCidr:
        case Comparator::kDomain:
            if (count == 0) {
                return makeError<Condition>(
                    ErrorCode::kConfigError,
                    fmt::format("'{}' on '{}' needs at least one operand", opName, spec.field));
            }
            break;
        default:
            if (count != 1) {
                return makeError<Condition>(
                    ErrorCode::kConfigError,
                    fmt::format("'{}' on '{}' needs exactly one operand", opName, spec.field));
            }
            break;
    }

    if (isStringOnly(spec.op) && condition.type_ != parse::FieldType::kString) {
        return makeError<Condition>(
            ErrorCode::kConfigError,
            fmt::format("'{}' applies to string fields only, '{}' is {}", opName, spec.field,
                        parse::fieldTypeToString(condition.type_)));
    }

    if (spec.op == Comparator::kCidr) {
        auto matcher = IpMatcher::compile(spec.operands);
        if (!matcher) {
            return std::unexpected(matcher.error());
        }
        condition.ipMatcher_ = std::move(*matcher);
        return condition;
    }
    if (spec.op == Comparator::kDomain) {
        auto matcher = DomainMatcher::compile(spec.operands);
        if (!matcher) {
            return std::unexpected(matcher.error());
        }
        condition.domainMatcher_ = std::move(*matcher);
        return condition;
    }

    for (const auto& text : spec.operands) {
        auto operand = parseOperand(text, condition.type_, spec.field);
        if (!operand) {
            return std::unexpected(operand.error());
        }
        condition.operands_.push_back(std::move(*operand));
    }

    if (spec.op == Comparator::kIn && condition.type_ == parse::FieldType::kString) {
        for (const auto& operand : condition.operands_) {
            condition.stringSet_.insert(std::get<std::string>(operand));
        }
    }

    return condition;
}

unsigned Condition::cost() const noexcept {
    const bool isString = type_ == parse::FieldType::kString;
    switch (op_) {
        case Comparator::kExists:
            return 0;
        case Comparator::kEq:
        case Comparator::kNe:
            return isString ? 3 : 1;
        case Comparator::kLt:
        case Comparator::kLe:
        case Comparator::kGt:
        case Comparator::kGe:
            return isString ? 4 : 1;
        case Comparator::kBetween:
            return isString ? 4 : 2;
        case Comparator::kPrefix:
        case Comparator::kSuffix:
            return 4;
        case Comparator::kIn:
            return isString ? 5 : 3;
        case Comparator::kContains:
            return 6;
        case Comparator::kDomain:
            return 7;
        case Comparator::kCidr:
            return 8;
        default:
            return 9;
    }
}

bool Condition::evaluate(const parse::FieldSet& fields) const {
    const bool present = fields.has(field_);
    if (op_ == Comparator::kExists) {
        return present;
    }
    if (!present) {
        return false;
    }
    return evaluateValue(fields[field_]);
}

bool Condition::evaluateValue(const parse::FieldValue& value) const {
    switch (op_) {
        case Comparator::kEq:
            return compareTo(value, operands_[0]) == 0;
        case Comparator::kNe: {
            auto order = compareTo(value, operands_[0]);
            return order != 0 && order != std::partial_ordering::unordered;
        }
        case Comparator::kLt:
            return compareTo(value, operands_[0]) < 0;
        case Comparator::kLe:
            return compareTo(value, operands_[0]) <= 0;
        case Comparator::kGt:
            return compareTo(value, operands_[0]) > 0;
        case Comparator::kGe:
            return compareTo(value, operands_[0]) >= 0;
        case Comparator::kBetween:
            return compareTo(value, operands_[0]) >= 0 && compareTo(value, operands_[1]) <= 0;
        case Comparator::kIn:
            if (type_ == parse::FieldType::kString) {
                return stringSet_.contains(std::get<std::string_view>(value));
            }
            return std::any_of(operands_.begin(), operands_.end(), [&value](const Operand& o) {
                return compareTo(value, o) == 0;
            });
        case Comparator::kPrefix:
            return std::get<std::string_view>(value).starts_with(std::get<std::string>(operands_[0]));
        case Comparator::kSuffix:
            return std::get<std::string_view>(value).ends_with(std::get<std::string>(operands_[0]));
        case Comparator::kContains:
            return std::get<std::string_view>(value).find(std::get<std::string>(operands_[0])) !=
                   std::string_view::npos;
        case Comparator::kCidr:
            return ipMatcher_->matches(std::get<std::string_view>(value));
        case Comparator::kDomain:
            return domainMatcher_->matches(std::get<std::string_view>(value));
        case Comparator::kExists:
            return true;
    }
    return false;
}

// =============================================================================
// Predicate
// =============================================================================

Result<Predicate> Predicate::compile(const std::vector<ConditionSpec>& specs,
                                     const parse::Schema& schema) {
    Predicate predicate;
    predicate.conditions_.reserve(specs.size());

    for (const auto& spec : specs) {
        auto condition = Condition::compile(spec, schema);
        if (!condition) {
            return std::unexpected(condition.error());
        }
        predicate.conditions_.push_back(std::move(*condition));
    }

    std::stable_sort(predicate.conditions_.begin(), predicate.conditions_.end(),
                     [](const Condition& a, const Condition& b) { return a.cost() < b.cost(); });
    return predicate;
}

bool Predicate::evaluate(const parse::FieldSet& fields) const {
    for (const auto& condition : conditions_) {
        if (!condition.evaluate(fields)) {
            return false;
        }
    }
    return true;
}

std::vector<std::size_t> Predicate::referencedFields() const {
    std::vector<std::size_t> fields;
    for (const auto& condition : conditions_) {
        fields.push_back(condition.fieldIndex());
    }
    std::sort(fields.begin(), fields.end());
    fields.erase(std::unique(fields.begin(), fields.end()), fields.end());
    return fields;
}

}  // namespace logq::query
