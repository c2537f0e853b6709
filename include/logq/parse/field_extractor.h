// =============================================================================
// logq - Field Extractor
// =============================================================================
// Tokenizes a record on the schema's field delimiter and coerces the tokens
// the query needs into typed values.
//
// Tokenization rules:
// - Token i maps to schema field i; extra tokens are ignored
// - A remainder field takes the original tail of the record verbatim
// - A missing token leaves the field absent
// - An empty token is absent for non-string fields (no coercion failure)
// - A token failing coercion leaves the field absent and is counted, unless
//   the field is required, which makes the record a schema mismatch
// =============================================================================

#ifndef LOGQ_PARSE_FIELD_EXTRACTOR_H
#define LOGQ_PARSE_FIELD_EXTRACTOR_H

#include <cstdint>
#include <string_view>
#include <vector>

#include "logq/parse/field_value.h"
#include "logq/parse/schema.h"

namespace logq::parse {

/// @brief Outcome of extracting one record.
enum class ExtractStatus : std::uint8_t {
    kOk = 0,
    kSchemaMismatch = 1
};

/// @brief Counters kept by an extractor over its lifetime.
struct ExtractStats {
    std::uint64_t recordsExtracted = 0;
    std::uint64_t schemaMismatches = 0;
    std::uint64_t coercionFailures = 0;
};

/// @brief Record tokenizer bound to one schema.
///
/// Thread Safety:
/// - Not thread-safe; each FileTask owns one
class FieldExtractor {
public:
    /// @brief Construct an extractor.
    /// @param schema Record layout (must outlive the extractor).
    /// @param neededFields Fields to coerce, by position; empty means all.
    ///        Fields outside the mask stay absent unless required.
    explicit FieldExtractor(const Schema& schema, std::vector<bool> neededFields = {});

    /// @brief Extract one record into out.
    /// @note String values view record; out is valid only while record is.
    [[nodiscard]] ExtractStatus extract(std::string_view record, FieldSet& out);

    [[nodiscard]] const ExtractStats& stats() const noexcept { return stats_; }

private:
    const Schema& schema_;
    std::vector<bool> needed_;
    std::size_t lastTokenNeeded_ = 0;
    ExtractStats stats_;
};

}  // namespace logq::parse

#endif  // LOGQ_PARSE_FIELD_EXTRACTOR_H
