// =============================================================================
// logq - Address Matchers
// =============================================================================
// Rule lists for matching IP address and domain name fields.
//
// IP rules:
// - Exact:  "10.1.2.3" or "2001:db8::1"
// - CIDR:   "10.0.0.0/8", "2001:db8::/32" (IPv4 /8, /16 and /24 compile to a
//           textual prefix test on the dotted form)
// - Range:  "10.0.0.5-10.0.0.9" (inclusive, same address family)
//
// Domain rules:
// - Exact:    "example.com"
// - Wildcard: "*.example.com" matches "example.com" and any subdomain
//
// A rule list matches when any rule matches; an empty list matches everything.
// =============================================================================

#ifndef LOGQ_QUERY_MATCHERS_H
#define LOGQ_QUERY_MATCHERS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "logq/common/error.h"

namespace logq::query {

// =============================================================================
// IP Address
// =============================================================================

/// @brief Parsed IPv4 or IPv6 address in network byte order.
struct IpAddress {
    bool v6 = false;
    std::array<std::uint8_t, 16> bytes{};

    [[nodiscard]] std::size_t length() const noexcept { return v6 ? 16 : 4; }

    /// @brief Parse a textual address.
    [[nodiscard]] static std::optional<IpAddress> parse(std::string_view text) noexcept;

    friend auto operator<=>(const IpAddress&, const IpAddress&) = default;
};

// =============================================================================
// IpMatcher
// =============================================================================

/// @brief Any-of list of IP rules.
class IpMatcher {
public:
    enum class RuleKind : std::uint8_t {
        kExact = 0,
        kPrefix = 1,
        kCidr = 2,
        kRange = 3
    };

    struct Rule {
        RuleKind kind = RuleKind::kExact;
        std::string text;  ///< Exact text or textual prefix
        IpAddress low;     ///< Network (CIDR) or range start
        IpAddress high;    ///< Range end
        unsigned prefixBits = 0;
    };

    IpMatcher() = default;

    /// @brief Compile rules from their textual forms.
    /// @return ConfigError naming the first malformed rule.
    [[nodiscard]] static Result<IpMatcher> compile(const std::vector<std::string>& rules);

    /// @brief Test a field value against the rules.
    [[nodiscard]] bool matches(std::string_view value) const;

    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }

private:
    std::vector<Rule> rules_;
    bool needsParse_ = false;
};

// =============================================================================
// DomainMatcher
// =============================================================================

/// @brief Any-of list of domain rules.
class DomainMatcher {
public:
    struct Rule {
        bool wildcard = false;
        std::string domain;  ///< Without the "*." prefix
    };

    DomainMatcher() = default;

    /// @brief Compile rules from their textual forms.
    [[nodiscard]] static Result<DomainMatcher> compile(const std::vector<std::string>& rules);

    /// @brief Test a field value against the rules.
    [[nodiscard]] bool matches(std::string_view value) const noexcept;

    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }

private:
    std::vector<Rule> rules_;
};

}  // namespace logq::query

#endif  // LOGQ_QUERY_MATCHERS_H
