// =============================================================================
// logq - Address Matchers Implementation
// =============================================================================

#include "logq/query/matchers.h"

#include <arpa/inet.h>

#include <cstring>

#include <fmt/format.h>

namespace logq::query {

namespace {

/// @brief Longest textual IPv6 address plus terminator.
constexpr std::size_t kMaxAddressText = 64;

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

/// @brief Compare the leading bits of two addresses of the same family.
bool prefixEqual(const IpAddress& a, const IpAddress& b, unsigned bits) noexcept {
    const unsigned fullBytes = bits / 8;
    if (std::memcmp(a.bytes.data(), b.bytes.data(), fullBytes) != 0) {
        return false;
    }
    const unsigned rest = bits % 8;
    if (rest == 0) {
        return true;
    }
    const auto mask = static_cast<std::uint8_t>(0xff << (8 - rest));
    return (a.bytes[fullBytes] & mask) == (b.bytes[fullBytes] & mask);
}

void applyMask(IpAddress& address, unsigned bits) noexcept {
    for (std::size_t i = 0; i < address.length(); ++i) {
        const unsigned bitStart = static_cast<unsigned>(i) * 8;
        if (bitStart >= bits) {
            address.bytes[i] = 0;
        } else if (bits - bitStart < 8) {
            address.bytes[i] &= static_cast<std::uint8_t>(0xff << (8 - (bits - bitStart)));
        }
    }
}

Result<IpMatcher::Rule> parseIpRule(std::string_view text) {
    using Rule = IpMatcher::Rule;
    using RuleKind = IpMatcher::RuleKind;

    Rule rule;
    rule.text = std::string(text);

    if (auto slash = text.find('/'); slash != std::string_view::npos) {
        auto network = IpAddress::parse(text.substr(0, slash));
        const std::string_view bitsText = text.substr(slash + 1);
        unsigned bits = 0;
        bool bitsOk = !bitsText.empty() && bitsText.size() <= 3;
        for (char c : bitsText) {
            if (c < '0' || c > '9') {
                bitsOk = false;
                break;
            }
            bits = bits * 10 + static_cast<unsigned>(c - '0');
        }
        if (!network || !bitsOk || bits > network->length() * 8) {
            return makeError<Rule>(ErrorCode::kConfigError,
                                   fmt::format("invalid CIDR rule '{}'", text));
        }

        if (!network->v6 && (bits == 8 || bits == 16 || bits == 24)) {
            // Common IPv4 blocks reduce to a dotted-prefix test
            rule.kind = RuleKind::kPrefix;
            rule.text.clear();
            for (unsigned octet = 0; octet < bits / 8; ++octet) {
                rule.text += fmt::format("{}.", network->bytes[octet]);
            }
            return rule;
        }

        applyMask(*network, bits);
        rule.kind = RuleKind::kCidr;
        rule.low = *network;
        rule.prefixBits = bits;
        return rule;
    }

    if (auto dash = text.find('-'); dash != std::string_view::npos) {
        auto low = IpAddress::parse(trim(text.substr(0, dash)));
        auto high = IpAddress::parse(trim(text.substr(dash + 1)));
        if (!low || !high || low->v6 != high->v6 || *high < *low) {
            return makeError<Rule>(ErrorCode::kConfigError,
                                   fmt::format("invalid IP range rule '{}'", text));
        }
        rule.kind = RuleKind::kRange;
        rule.low = *low;
        rule.high = *high;
        return rule;
    }

    auto address = IpAddress::parse(text);
    if (!address) {
        return makeError<Rule>(ErrorCode::kConfigError,
                               fmt::format("invalid IP address rule '{}'", text));
    }
    rule.kind = RuleKind::kExact;
    rule.low = *address;
    return rule;
}

}  // namespace

// =============================================================================
// IpAddress
// =============================================================================

std::optional<IpAddress> IpAddress::parse(std::string_view text) noexcept {
    if (text.empty() || text.size() >= kMaxAddressText) {
        return std::nullopt;
    }

    // inet_pton needs a terminated string
    char buffer[kMaxAddressText];
    std::memcpy(buffer, text.data(), text.size());
    buffer[text.size()] = '\0';

    IpAddress address;
    if (text.find(':') != std::string_view::npos) {
        address.v6 = true;
        if (inet_pton(AF_INET6, buffer, address.bytes.data()) != 1) {
            return std::nullopt;
        }
        return address;
    }

    if (inet_pton(AF_INET, buffer, address.bytes.data()) != 1) {
        return std::nullopt;
    }
    return address;
}

// =============================================================================
// IpMatcher
// =============================================================================

Result<IpMatcher> IpMatcher::compile(const std::vector<std::string>& rules) {
    IpMatcher matcher;
    for (const auto& raw : rules) {
        const std::string_view text = trim(raw);
        if (text.empty()) {
            continue;
        }
        auto rule = parseIpRule(text);
        if (!rule) {
            return std::unexpected(rule.error());
        }
        if (rule->kind != RuleKind::kPrefix) {
            matcher.needsParse_ = true;
        }
        matcher.rules_.push_back(std::move(*rule));
    }
    return matcher;
}

bool IpMatcher::matches(std::string_view value) const {
    if (rules_.empty()) {
        return true;
    }

    std::optional<IpAddress> parsed;
    if (needsParse_) {
        parsed = IpAddress::parse(value);
    }

    for (const auto& rule : rules_) {
        switch (rule.kind) {
            case RuleKind::kPrefix:
                if (value.starts_with(rule.text)) {
                    return true;
                }
                break;
            case RuleKind::kExact:
                if (value == rule.text || (parsed && *parsed == rule.low)) {
                    return true;
                }
                break;
            case RuleKind::kCidr:
                if (parsed && parsed->v6 == rule.low.v6 &&
                    prefixEqual(*parsed, rule.low, rule.prefixBits)) {
                    return true;
                }
                break;
            case RuleKind::kRange:
                if (parsed && parsed->v6 == rule.low.v6 && rule.low <= *parsed &&
                    *parsed <= rule.high) {
                    return true;
                }
                break;
        }
    }
    return false;
}

// =============================================================================
// DomainMatcher
// =============================================================================

Result<DomainMatcher> DomainMatcher::compile(const std::vector<std::string>& rules) {
    DomainMatcher matcher;
    for (const auto& raw : rules) {
        const std::string_view text = trim(raw);
        if (text.empty()) {
            continue;
        }

        Rule rule;
        if (text.starts_with("*.")) {
            rule.wildcard = true;
            rule.domain = std::string(text.substr(2));
        } else {
            rule.domain = std::string(text);
        }
        if (rule.domain.empty()) {
            return makeError<DomainMatcher>(ErrorCode::kConfigError,
                                            fmt::format("invalid domain rule '{}'", text));
        }
        matcher.rules_.push_back(std::move(rule));
    }
    return matcher;
}

bool DomainMatcher::matches(std::string_view value) const noexcept {
    if (rules_.empty()) {
        return true;
    }

    for (const auto& rule : rules_) {
        if (!rule.wildcard) {
            if (value == rule.domain) {
                return true;
            }
            continue;
        }

        if (!value.ends_with(rule.domain)) {
            continue;
        }
        // Suffix must start on a label boundary
        const std::size_t head = value.size() - rule.domain.size();
        if (head == 0 || value[head - 1] == '.') {
            return true;
        }
    }
    return false;
}

}  // namespace logq::query
