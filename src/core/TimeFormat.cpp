/**
 * @file TimeFormat.cpp
 * @brief Epoch timestamp formatting
 */

#include "TimeFormat.hpp"
#include "XdiErrors.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>

namespace xdi {

namespace {

struct SplitTime {
    std::tm local{};
    long microseconds = 0;
};

SplitTime split_epoch(double epoch_seconds) {
    if (!std::isfinite(epoch_seconds)) {
        throw RenderError("timestamp is not a finite number");
    }

    double whole = std::floor(epoch_seconds);
    long micros = std::lround((epoch_seconds - whole) * 1e6);
    if (micros >= 1000000) {
        whole += 1.0;
        micros -= 1000000;
    }

    if (whole < static_cast<double>(std::numeric_limits<std::time_t>::min()) ||
        whole >= static_cast<double>(std::numeric_limits<std::time_t>::max())) {
        throw RenderError("timestamp out of range: " + std::to_string(epoch_seconds));
    }

    SplitTime result;
    std::time_t seconds = static_cast<std::time_t>(whole);
    if (localtime_r(&seconds, &result.local) == nullptr) {
        throw RenderError("timestamp out of range: " + std::to_string(epoch_seconds));
    }
    result.microseconds = micros;
    return result;
}

} // namespace

std::string format_iso8601(double epoch_seconds) {
    SplitTime t = split_epoch(epoch_seconds);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d",
                  t.local.tm_year + 1900, t.local.tm_mon + 1, t.local.tm_mday,
                  t.local.tm_hour, t.local.tm_min, t.local.tm_sec);

    std::string result(buffer);
    if (t.microseconds != 0) {
        std::snprintf(buffer, sizeof(buffer), ".%06ld", t.microseconds);
        result += buffer;
    }
    return result;
}

std::string format_timestamp(double epoch_seconds, const std::string& pattern) {
    SplitTime t = split_epoch(epoch_seconds);

    if (pattern.empty()) {
        return "";
    }

    // strftime returns 0 both for "buffer too small" and for an empty result
    std::string buffer(pattern.size() * 4 + 64, '\0');
    for (int attempt = 0; attempt < 4; ++attempt) {
        size_t written = std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &t.local);
        if (written > 0) {
            buffer.resize(written);
            return buffer;
        }
        buffer.assign(buffer.size() * 4, '\0');
    }
    return "";
}

} // namespace xdi
