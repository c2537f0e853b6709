// =============================================================================
// logq - Engine Configuration Implementation
// =============================================================================

#include "logq/engine/engine_config.h"

#include <fmt/format.h>

#include "logq/common/logger.h"

namespace logq::engine {

VoidResult EngineConfig::validate() const {
    if (auto scanResult = scan.validate(); !scanResult) {
        return scanResult;
    }
    if (fields.empty()) {
        return makeVoidError(ErrorCode::kConfigError, "no fields declared");
    }
    if (fieldDelimiter.empty()) {
        return makeVoidError(ErrorCode::kConfigError, "field delimiter must not be empty");
    }
    if (fieldDelimiter == scan.recordDelimiter) {
        return makeVoidError(ErrorCode::kConfigError,
                             "record and field delimiters must differ");
    }

    // Schema and query compilation report the remaining problems: unknown
    // field references, misplaced remainder, duplicates, group mode without
    // a group field
    auto spec = buildQuerySpec();
    if (!spec) {
        return std::unexpected(spec.error());
    }
    return makeVoidSuccess();
}

Result<std::shared_ptr<const query::QuerySpec>> EngineConfig::buildQuerySpec() const {
    auto schema = parse::Schema::create(fields, fieldDelimiter, allowEmptyRecords);
    if (!schema) {
        return std::unexpected(schema.error());
    }
    return query::QuerySpec::compile(
        query, std::make_shared<const parse::Schema>(std::move(*schema)));
}

Result<FinalResult> runQuery(const EngineConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    auto spec = config.buildQuerySpec();
    if (!spec) {
        return std::unexpected(spec.error());
    }

    LOGQ_LOG_DEBUG("Query: mode={}, {} conditions, {} fields",
                   query::aggregationModeToString(config.query.mode),
                   config.query.conditions.size(), config.fields.size());

    Scheduler scheduler(config.scan);
    return scheduler.run(std::move(*spec));
}

}  // namespace logq::engine
