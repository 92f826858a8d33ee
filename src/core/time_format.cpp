#include "core/time_format.hpp"
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace prism::time_format {

namespace {

// 9999-12-31T23:59:59.999Z
constexpr EpochMillis kMaxEpochMillis = 253402300799999LL;

std::string format_utc(std::time_t seconds) {
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << 'Z';
    return oss.str();
}

}  // namespace

std::string iso8601(WallTime time) {
    return format_utc(std::chrono::system_clock::to_time_t(time));
}

std::string iso_now() {
    return iso8601(std::chrono::system_clock::now());
}

std::optional<EpochMillis> parse_epoch_millis(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    EpochMillis value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    if (value < 0 || value > kMaxEpochMillis) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> millis_to_iso8601(std::string_view text) {
    auto millis = parse_epoch_millis(text);
    if (!millis) {
        return std::nullopt;
    }
    // Whole seconds only; a nanosecond time_point would overflow near year 9999
    return format_utc(static_cast<std::time_t>(*millis / 1000));
}

}  // namespace prism::time_format
