#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace prism::time_format {

/// Format a wall-clock instant as ISO-8601 UTC with second precision
/// e.g. "2024-05-01T12:00:00Z"
[[nodiscard]] std::string iso8601(WallTime time);

/// Current time formatted with iso8601()
[[nodiscard]] std::string iso_now();

/// Parse a venue-reported epoch in milliseconds
/// Accepts an optional leading '+', rejects negatives, garbage and values
/// beyond year 9999
[[nodiscard]] std::optional<EpochMillis> parse_epoch_millis(std::string_view text);

/// Convert venue millisecond epoch text to ISO-8601 UTC
/// Returns nullopt instead of failing on bad input
[[nodiscard]] std::optional<std::string> millis_to_iso8601(std::string_view text);

}  // namespace prism::time_format
