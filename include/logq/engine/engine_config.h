// =============================================================================
// logq - Engine Configuration
// =============================================================================
// Complete configuration of one run: scan options, record schema and query.
// The CLI fills an EngineConfig; validate() checks it as a whole before any
// file is opened, and buildQuerySpec() turns it into the compiled QuerySpec
// shared by the workers.
// =============================================================================

#ifndef LOGQ_ENGINE_ENGINE_CONFIG_H
#define LOGQ_ENGINE_ENGINE_CONFIG_H

#include <memory>
#include <string>
#include <vector>

#include "logq/common/error.h"
#include "logq/engine/scheduler.h"
#include "logq/parse/schema.h"
#include "logq/query/query_spec.h"

namespace logq::engine {

/// @brief Run configuration.
struct EngineConfig {
    /// @brief Enumeration, pool and reading options
    ScanOptions scan;

    /// @brief Positional field declarations
    std::vector<parse::FieldSpec> fields;

    /// @brief Field delimiter (already unescaped)
    std::string fieldDelimiter = std::string(kDefaultFieldDelimiter);

    /// @brief Emit empty records instead of skipping them
    bool allowEmptyRecords = false;

    /// @brief Query to run
    query::QueryDefinition query;

    /// @brief Validate the whole configuration.
    /// @return kConfigError describing the first problem found.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Build the schema and compile the query against it.
    [[nodiscard]] Result<std::shared_ptr<const query::QuerySpec>> buildQuerySpec() const;
};

/// @brief Validate, compile and run a configuration.
[[nodiscard]] Result<FinalResult> runQuery(const EngineConfig& config);

}  // namespace logq::engine

#endif  // LOGQ_ENGINE_ENGINE_CONFIG_H
