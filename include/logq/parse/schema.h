// =============================================================================
// logq - Record Schema
// =============================================================================
// Ordered field declarations describing how a record is tokenized.
// =============================================================================

#ifndef LOGQ_PARSE_SCHEMA_H
#define LOGQ_PARSE_SCHEMA_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "logq/common/error.h"
#include "logq/common/types.h"
#include "logq/parse/field_value.h"

namespace logq::parse {

// =============================================================================
// Field Specification
// =============================================================================

/// @brief Declaration of one positional field.
struct FieldSpec {
    std::string name;
    FieldType type = FieldType::kString;

    /// @brief Records lacking this field are schema mismatches.
    bool required = false;

    /// @brief Last field only: takes the rest of the record, delimiters included.
    bool remainder = false;

    friend bool operator==(const FieldSpec&, const FieldSpec&) = default;
};

/// @brief Parse "name:type[:required][:remainder]" (type defaults to string).
[[nodiscard]] Result<FieldSpec> parseFieldSpec(std::string_view text);

/// @brief Decode backslash escapes in a delimiter argument (\t \n \r \\ \| \xHH).
[[nodiscard]] Result<std::string> unescapeDelimiter(std::string_view text);

// =============================================================================
// Schema
// =============================================================================

/// @brief Validated, immutable record layout.
class Schema {
public:
    /// @brief Build and validate a schema.
    /// @return ConfigError if the field list is empty, names repeat or are
    ///         empty, the delimiter is empty, or a non-final field is marked
    ///         remainder.
    [[nodiscard]] static Result<Schema> create(
        std::vector<FieldSpec> fields, std::string fieldDelimiter = std::string(kDefaultFieldDelimiter),
        bool allowEmptyRecords = false);

    [[nodiscard]] const std::vector<FieldSpec>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t fieldCount() const noexcept { return fields_.size(); }
    [[nodiscard]] const FieldSpec& field(std::size_t index) const { return fields_.at(index); }

    /// @brief Position of a named field.
    [[nodiscard]] std::optional<std::size_t> indexOf(std::string_view name) const;

    [[nodiscard]] const std::string& fieldDelimiter() const noexcept { return fieldDelimiter_; }
    [[nodiscard]] bool allowEmptyRecords() const noexcept { return allowEmptyRecords_; }

    /// @brief Number of leading tokens a record needs to cover every required field.
    [[nodiscard]] std::size_t requiredTokens() const noexcept { return requiredTokens_; }

private:
    Schema() = default;

    std::vector<FieldSpec> fields_;
    std::unordered_map<std::string, std::size_t> index_;
    std::string fieldDelimiter_;
    bool allowEmptyRecords_ = false;
    std::size_t requiredTokens_ = 0;
};

}  // namespace logq::parse

#endif  // LOGQ_PARSE_SCHEMA_H
