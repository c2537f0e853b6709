// =============================================================================
// logq - Condition Parser
// =============================================================================
// Parses the textual condition grammar used by --where and config files:
//
//   <field> <op> <value>
//
// op is one of == (or =), !=, <, <=, >, >=, between, in, prefix, suffix,
// contains, exists, cidr, domain. Symbolic operators need no surrounding
// spaces ("status>=500"). List operands (in, cidr, domain, between) are
// comma-separated; between takes "lo,hi". Values may be double-quoted, in
// which case commas inside the quotes are literal and \" and \\ are escapes.
//
// Examples:
//   level == "ERROR"
//   status between 500,599
//   client_ip cidr 10.0.0.0/8, 192.168.1.1-192.168.1.20
//   host domain *.example.com
//   user_agent exists
// =============================================================================

#ifndef LOGQ_QUERY_CONDITION_PARSER_H
#define LOGQ_QUERY_CONDITION_PARSER_H

#include <string>
#include <string_view>
#include <vector>

#include "logq/common/error.h"
#include "logq/query/predicate.h"

namespace logq::query {

/// @brief Parse one condition.
/// @return ConfigError describing the first syntax problem.
[[nodiscard]] Result<ConditionSpec> parseCondition(std::string_view text);

/// @brief Parse a list of conditions (conjunction).
[[nodiscard]] Result<std::vector<ConditionSpec>> parseConditions(
    const std::vector<std::string>& texts);

/// @brief Render a condition back to grammar text.
[[nodiscard]] std::string formatCondition(const ConditionSpec& spec);

}  // namespace logq::query

#endif  // LOGQ_QUERY_CONDITION_PARSER_H
