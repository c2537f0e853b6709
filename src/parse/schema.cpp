// =============================================================================
// logq - Record Schema Implementation
// =============================================================================

#include "logq/parse/schema.h"

#include <fmt/format.h>

namespace logq::parse {

// =============================================================================
// Field Specification Parsing
// =============================================================================

Result<FieldSpec> parseFieldSpec(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t colon = text.find(':', start);
        parts.push_back(text.substr(start, colon == std::string_view::npos ? colon : colon - start));
        if (colon == std::string_view::npos) {
            break;
        }
        start = colon + 1;
    }

    FieldSpec spec;
    spec.name = std::string(parts[0]);
    if (spec.name.empty()) {
        return makeError<FieldSpec>(ErrorCode::kConfigError,
                                    fmt::format("field declaration '{}' has no name", text));
    }

    if (parts.size() > 1 && !parts[1].empty()) {
        auto type = fieldTypeFromString(parts[1]);
        if (!type) {
            return makeError<FieldSpec>(
                ErrorCode::kConfigError,
                fmt::format("field '{}' has unknown type '{}'", spec.name, parts[1]));
        }
        spec.type = *type;
    }

    for (std::size_t i = 2; i < parts.size(); ++i) {
        if (parts[i] == "required") {
            spec.required = true;
        } else if (parts[i] == "remainder" || parts[i] == "rest") {
            spec.remainder = true;
        } else {
            return makeError<FieldSpec>(
                ErrorCode::kConfigError,
                fmt::format("field '{}' has unknown flag '{}'", spec.name, parts[i]));
        }
    }

    return spec;
}

Result<std::string> unescapeDelimiter(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            result.push_back(text[i]);
            continue;
        }
        if (i + 1 >= text.size()) {
            return makeError<std::string>(ErrorCode::kConfigError,
                                          fmt::format("dangling escape in delimiter '{}'", text));
        }
        const char c = text[++i];
        switch (c) {
            case 't':
                result.push_back('\t');
                break;
            case 'n':
                result.push_back('\n');
                break;
            case 'r':
                result.push_back('\r');
                break;
            case '0':
                result.push_back('\0');
                break;
            case '\\':
                result.push_back('\\');
                break;
            case '|':
                result.push_back('|');
                break;
            case 'x': {
                if (i + 2 >= text.size()) {
                    return makeError<std::string>(
                        ErrorCode::kConfigError,
                        fmt::format("incomplete \\x escape in delimiter '{}'", text));
                }
                int value = 0;
                for (int k = 1; k <= 2; ++k) {
                    const char h = text[i + k];
                    value <<= 4;
                    if (h >= '0' && h <= '9') {
                        value |= h - '0';
                    } else if (h >= 'a' && h <= 'f') {
                        value |= h - 'a' + 10;
                    } else if (h >= 'A' && h <= 'F') {
                        value |= h - 'A' + 10;
                    } else {
                        return makeError<std::string>(
                            ErrorCode::kConfigError,
                            fmt::format("invalid \\x escape in delimiter '{}'", text));
                    }
                }
                result.push_back(static_cast<char>(value));
                i += 2;
                break;
            }
            default:
                return makeError<std::string>(
                    ErrorCode::kConfigError,
                    fmt::format("unknown escape '\\{}' in delimiter '{}'", c, text));
        }
    }

    return result;
}

// =============================================================================
// Schema Implementation
// =============================================================================

Result<Schema> Schema::create(std::vector<FieldSpec> fields, std::string fieldDelimiter,
                              bool allowEmptyRecords) {
    if (fields.empty()) {
        return makeError<Schema>(ErrorCode::kConfigError, "schema declares no fields");
    }
    if (fieldDelimiter.empty()) {
        return makeError<Schema>(ErrorCode::kConfigError, "field delimiter must not be empty");
    }

    Schema schema;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& spec = fields[i];
        if (spec.name.empty()) {
            return makeError<Schema>(ErrorCode::kConfigError,
                                     fmt::format("field #{} has no name", i + 1));
        }
        if (spec.remainder && i + 1 != fields.size()) {
            return makeError<Schema>(
                ErrorCode::kConfigError,
                fmt::format("only the last field may take the remainder ('{}')", spec.name));
        }
        if (!schema.index_.emplace(spec.name, i).second) {
            return makeError<Schema>(ErrorCode::kConfigError,
                                     fmt::format("duplicate field name '{}'", spec.name));
        }
        if (spec.required) {
            schema.requiredTokens_ = i + 1;
        }
    }

    schema.fields_ = std::move(fields);
    schema.fieldDelimiter_ = std::move(fieldDelimiter);
    schema.allowEmptyRecords_ = allowEmptyRecords;
    return schema;
}

std::optional<std::size_t> Schema::indexOf(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace logq::parse
