// =============================================================================
// logq - Field Extractor Implementation
// =============================================================================

#include "logq/parse/field_extractor.h"

#include <algorithm>

namespace logq::parse {

FieldExtractor::FieldExtractor(const Schema& schema, std::vector<bool> neededFields)
    : schema_(schema), needed_(std::move(neededFields)) {
    const std::size_t n = schema_.fieldCount();
    if (needed_.empty()) {
        needed_.assign(n, true);
    }
    needed_.resize(n, false);

    for (std::size_t i = 0; i < n; ++i) {
        if (schema_.field(i).required) {
            needed_[i] = true;
        }
        if (needed_[i]) {
            lastTokenNeeded_ = i + 1;
        }
    }
}

ExtractStatus FieldExtractor::extract(std::string_view record, FieldSet& out) {
    const std::size_t n = schema_.fieldCount();
    const std::string_view delimiter = schema_.fieldDelimiter();
    out.reset(n);

    std::size_t pos = 0;
    std::size_t tokens = 0;
    bool exhausted = false;

    // Tokens after the last needed field are never inspected
    while (tokens < lastTokenNeeded_ && !exhausted) {
        const std::size_t index = tokens;
        const FieldSpec& spec = schema_.field(index);

        std::string_view token;
        if (spec.remainder) {
            token = record.substr(pos);
            exhausted = true;
        } else {
            const std::size_t end = record.find(delimiter, pos);
            if (end == std::string_view::npos) {
                token = record.substr(pos);
                exhausted = true;
            } else {
                token = record.substr(pos, end - pos);
                pos = end + delimiter.size();
            }
        }
        ++tokens;

        if (!needed_[index]) {
            continue;
        }

        if (spec.type != FieldType::kString && token.empty()) {
            if (spec.required) {
                ++stats_.schemaMismatches;
                return ExtractStatus::kSchemaMismatch;
            }
            continue;
        }

        auto value = coerce(token, spec.type);
        if (!value) {
            if (spec.required) {
                ++stats_.schemaMismatches;
                return ExtractStatus::kSchemaMismatch;
            }
            ++stats_.coercionFailures;
            continue;
        }
        out[index] = *value;
    }

    if (tokens < schema_.requiredTokens()) {
        ++stats_.schemaMismatches;
        return ExtractStatus::kSchemaMismatch;
    }

    ++stats_.recordsExtracted;
    return ExtractStatus::kOk;
}

}  // namespace logq::parse
