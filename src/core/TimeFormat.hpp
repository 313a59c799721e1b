/**
 * @file TimeFormat.hpp
 * @brief Conversions from document epoch timestamps to text
 */

#pragma once

#include <string>

namespace xdi {

/**
 * @brief Local-time ISO-8601 rendering of an epoch timestamp
 *
 * Produces YYYY-MM-DDTHH:MM:SS, followed by .ffffff only when the
 * microsecond part is non-zero.
 *
 * @param epoch_seconds Seconds since the Unix epoch (fractional allowed)
 */
std::string format_iso8601(double epoch_seconds);

/**
 * @brief strftime-style rendering of an epoch timestamp in local time
 * @param epoch_seconds Seconds since the Unix epoch
 * @param pattern strftime pattern, e.g. "%Y-%m-%d_%H-%M"
 */
std::string format_timestamp(double epoch_seconds, const std::string& pattern);

} // namespace xdi
