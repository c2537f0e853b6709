// =============================================================================
// logq - Condition Parser Implementation
// =============================================================================

#include "logq/query/condition_parser.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace logq::query {

namespace {

bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t';
}

bool isOperatorChar(char c) noexcept {
    return c == '=' || c == '!' || c == '<' || c == '>';
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

bool isListOperator(Comparator op) noexcept {
    return op == Comparator::kIn || op == Comparator::kBetween || op == Comparator::kCidr ||
           op == Comparator::kDomain;
}

/// @brief Parse one operand: a quoted string or bare text up to a comma
///        (when splitOnComma) or the end.
/// @param pos In: operand start. Out: position after the operand.
Result<std::string> parseOperand(std::string_view text, std::size_t& pos, bool splitOnComma,
                                 std::string_view whole) {
    while (pos < text.size() && isSpace(text[pos])) {
        ++pos;
    }

    if (pos < text.size() && text[pos] == '"') {
        std::string value;
        ++pos;
        while (pos < text.size() && text[pos] != '"') {
            if (text[pos] == '\\' && pos + 1 < text.size() &&
                (text[pos + 1] == '"' || text[pos + 1] == '\\')) {
                ++pos;
            }
            value.push_back(text[pos++]);
        }
        if (pos >= text.size()) {
            return makeError<std::string>(
                ErrorCode::kConfigError, fmt::format("unterminated quote in condition '{}'", whole));
        }
        ++pos;  // closing quote
        while (pos < text.size() && isSpace(text[pos])) {
            ++pos;
        }
        if (pos < text.size() && !(splitOnComma && text[pos] == ',')) {
            return makeError<std::string>(
                ErrorCode::kConfigError,
                fmt::format("unexpected text after quoted value in condition '{}'", whole));
        }
        return value;
    }

    std::size_t end = splitOnComma ? text.find(',', pos) : std::string_view::npos;
    if (end == std::string_view::npos) {
        end = text.size();
    }
    std::string_view bare = trim(text.substr(pos, end - pos));
    pos = end;
    if (bare.empty()) {
        return makeError<std::string>(ErrorCode::kConfigError,
                                      fmt::format("missing value in condition '{}'", whole));
    }
    return std::string(bare);
}

}  // namespace

Result<ConditionSpec> parseCondition(std::string_view text) {
    const std::string_view whole = trim(text);
    std::size_t pos = 0;

    // Field name
    while (pos < whole.size() && !isSpace(whole[pos]) && !isOperatorChar(whole[pos])) {
        ++pos;
    }
    ConditionSpec spec;
    spec.field = std::string(whole.substr(0, pos));
    if (spec.field.empty()) {
        return makeError<ConditionSpec>(ErrorCode::kConfigError,
                                        fmt::format("condition '{}' has no field name", text));
    }

    while (pos < whole.size() && isSpace(whole[pos])) {
        ++pos;
    }

    // Operator
    std::string opText;
    if (pos < whole.size() && isOperatorChar(whole[pos])) {
        opText.push_back(whole[pos++]);
        if (pos < whole.size() && whole[pos] == '=') {
            opText.push_back(whole[pos++]);
        }
    } else {
        while (pos < whole.size() && !isSpace(whole[pos])) {
            opText.push_back(
                static_cast<char>(std::tolower(static_cast<unsigned char>(whole[pos++]))));
        }
    }

    auto op = comparatorFromString(opText);
    if (!op) {
        return makeError<ConditionSpec>(
            ErrorCode::kConfigError,
            fmt::format("unknown operator '{}' in condition '{}'", opText, text));
    }
    spec.op = *op;

    const std::string_view rest = trim(whole.substr(pos));

    if (spec.op == Comparator::kExists) {
        if (!rest.empty()) {
            return makeError<ConditionSpec>(
                ErrorCode::kConfigError,
                fmt::format("'exists' takes no value in condition '{}'", text));
        }
        return spec;
    }

    if (rest.empty()) {
        return makeError<ConditionSpec>(ErrorCode::kConfigError,
                                        fmt::format("missing value in condition '{}'", text));
    }

    const bool list = isListOperator(spec.op);
    std::size_t valuePos = 0;
    while (true) {
        auto operand = parseOperand(rest, valuePos, list, text);
        if (!operand) {
            return std::unexpected(operand.error());
        }
        spec.operands.push_back(std::move(*operand));

        if (valuePos >= rest.size()) {
            break;
        }
        ++valuePos;  // comma
    }

    if (spec.op == Comparator::kBetween && spec.operands.size() != 2) {
        return makeError<ConditionSpec>(
            ErrorCode::kConfigError,
            fmt::format("'between' needs 'lo,hi' in condition '{}'", text));
    }

    return spec;
}

Result<std::vector<ConditionSpec>> parseConditions(const std::vector<std::string>& texts) {
    std::vector<ConditionSpec> specs;
    specs.reserve(texts.size());
    for (const auto& text : texts) {
        auto spec = parseCondition(text);
        if (!spec) {
            return std::unexpected(spec.error());
        }
        specs.push_back(std::move(*spec));
    }
    return specs;
}

std::string formatCondition(const ConditionSpec& spec) {
    auto quote = [](const std::string& value) {
        const bool plain = !value.empty() && std::none_of(value.begin(), value.end(), [](char c) {
            return c == ',' || c == '"' || c == '\\' || isSpace(c);
        });
        if (plain) {
            return value;
        }
        std::string quoted = "\"";
        for (char c : value) {
            if (c == '"' || c == '\\') {
                quoted.push_back('\\');
            }
            quoted.push_back(c);
        }
        quoted.push_back('"');
        return quoted;
    };

    std::string result = fmt::format("{} {}", spec.field, comparatorToString(spec.op));
    for (std::size_t i = 0; i < spec.operands.size(); ++i) {
        result += i == 0 ? " " : ",";
        result += quote(spec.operands[i]);
    }
    return result;
}

}  // namespace logq::query
