// =============================================================================
// logq - Field Value Implementation
// =============================================================================

#include "logq/parse/field_value.h"

#include <charconv>
#include <chrono>
#include <cmath>

#include <fmt/format.h>

namespace logq::parse {

// =============================================================================
// Field Types
// =============================================================================

std::string_view fieldTypeToString(FieldType type) noexcept {
    switch (type) {
        case FieldType::kString:
            return "string";
        case FieldType::kInteger:
            return "int";
        case FieldType::kFloat:
            return "float";
        case FieldType::kTimestamp:
            return "timestamp";
        default:
            return "unknown";
    }
}

std::optional<FieldType> fieldTypeFromString(std::string_view name) noexcept {
    if (name == "string" || name == "str") {
        return FieldType::kString;
    }
    if (name == "int" || name == "integer" || name == "i64") {
        return FieldType::kInteger;
    }
    if (name == "float" || name == "double" || name == "f64") {
        return FieldType::kFloat;
    }
    if (name == "timestamp" || name == "time" || name == "ts") {
        return FieldType::kTimestamp;
    }
    return std::nullopt;
}

// =============================================================================
// Values
// =============================================================================

OwnedValue toOwned(const FieldValue& value) {
    return std::visit(
        [](const auto& v) -> OwnedValue {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string_view>) {
                return std::string(v);
            } else {
                return v;
            }
        },
        value);
}

namespace {

template <typename Variant>
std::string formatAny(const Variant& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return formatTimestamp(v);
            } else if constexpr (std::is_same_v<T, std::string_view> ||
                                 std::is_same_v<T, std::string>) {
                return std::string(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

}  // namespace

std::string formatValue(const FieldValue& value) {
    return formatAny(value);
}

std::string formatValue(const OwnedValue& value) {
    return formatAny(value);
}

std::weak_ordering compareOwned(const OwnedValue& lhs, const OwnedValue& rhs) {
    if (lhs.index() != rhs.index()) {
        return lhs.index() <=> rhs.index();
    }

    return std::visit(
        [&rhs](const auto& l) -> std::weak_ordering {
            using T = std::decay_t<decltype(l)>;
            const auto& r = std::get<T>(rhs);
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::weak_ordering::equivalent;
            } else if constexpr (std::is_same_v<T, double>) {
                if (l < r) {
                    return std::weak_ordering::less;
                }
                if (l > r) {
                    return std::weak_ordering::greater;
                }
                return std::weak_ordering::equivalent;
            } else {
                return l <=> r;
            }
        },
        lhs);
}

// =============================================================================
// Coercion
// =============================================================================

std::optional<std::int64_t> parseInteger(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin == '+') {
        ++begin;
        if (begin == end || *begin == '-') {
            return std::nullopt;
        }
    }

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseFloat(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin == '+') {
        ++begin;
        if (begin == end || *begin == '-') {
            return std::nullopt;
        }
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

namespace {

/// @brief Read exactly count decimal digits at pos.
bool readDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) noexcept {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool allDigits(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

constexpr std::size_t kCompactDateLength = 8;

std::optional<Timestamp> fromCivil(int year, int month, int day, int hour, int minute,
                                   int second, int millis, int offsetMinutes) noexcept {
    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    const std::int64_t days = std::chrono::sys_days{ymd}.time_since_epoch().count();
    const std::int64_t seconds =
        ((days * 24 + hour) * 60 + minute - offsetMinutes) * 60 + second;
    return Timestamp{seconds * 1000 + millis};
}

}  // namespace

std::optional<Timestamp> parseTimestamp(std::string_view text) noexcept {
    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;

    // Eight digits are a compact YYYYMMDD date, never an epoch count
    if (text.size() == kCompactDateLength && allDigits(text)) {
        if (!readDigits(text, pos, 4, year) || !readDigits(text, pos, 2, month) ||
            !readDigits(text, pos, 2, day)) {
            return std::nullopt;
        }
        return fromCivil(year, month, day, 0, 0, 0, 0, 0);
    }

    if (allDigits(text)) {
        auto value = parseInteger(text);
        if (!value) {
            return std::nullopt;
        }
        // More than 11 digits cannot be a plausible epoch second count
        if (text.size() > 11) {
            return Timestamp{*value};
        }
        return Timestamp{*value * 1000};
    }

    if (!readDigits(text, pos, 4, year)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != '-' && text[pos] != '/')) {
        return std::nullopt;
    }
    const char dateSep = text[pos++];
    if (!readDigits(text, pos, 2, month) || pos >= text.size() || text[pos++] != dateSep ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    int offsetMinutes = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!readDigits(text, pos, 2, hour) || pos >= text.size() || text[pos++] != ':' ||
            !readDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readDigits(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
                ++pos;
                std::size_t digits = 0;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                    if (digits < 3) {
                        millis = millis * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (std::size_t i = digits; i < 3; ++i) {
                    millis *= 10;
                }
            }
        }

        if (pos < text.size()) {
            if (text[pos] == 'Z') {
                ++pos;
            } else if (text[pos] == '+' || text[pos] == '-') {
                const int sign = text[pos] == '-' ? -1 : 1;
                ++pos;
                int offsetHours = 0;
                int offsetMins = 0;
                if (!readDigits(text, pos, 2, offsetHours)) {
                    return std::nullopt;
                }
                if (pos < text.size() && text[pos] == ':') {
                    ++pos;
                }
                if (!readDigits(text, pos, 2, offsetMins) || offsetHours > 23 || offsetMins > 59) {
                    return std::nullopt;
                }
                offsetMinutes = sign * (offsetHours * 60 + offsetMins);
            }
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    return fromCivil(year, month, day, hour, minute, second, millis, offsetMinutes);
}

std::string formatTimestamp(Timestamp ts) {
    using namespace std::chrono;

    const sys_time<milliseconds> tp{milliseconds{ts.epochMillis}};
    const auto dayPoint = floor<days>(tp);
    const year_month_day ymd{dayPoint};
    const hh_mm_ss<milliseconds> tod{tp - dayPoint};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       tod.hours().count(), tod.minutes().count(), tod.seconds().count(),
                       tod.subseconds().count());
}

std::optional<FieldValue> coerce(std::string_view token, FieldType type) noexcept {
    switch (type) {
        case FieldType::kString:
            return FieldValue{token};
        case FieldType::kInteger:
            if (auto v = parseInteger(token)) {
                return FieldValue{*v};
            }
            return std::nullopt;
        case FieldType::kFloat:
            if (auto v = parseFloat(token)) {
                return FieldValue{*v};
            }
            return std::nullopt;
        case FieldType::kTimestamp:
            if (auto v = parseTimestamp(token)) {
                return FieldValue{*v};
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

}  // namespace logq::parse
