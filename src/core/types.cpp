#include "core/types.hpp"
#include "core/text.hpp"

namespace prism {

std::optional<Venue> parse_venue(std::string_view label) {
    const std::string lowered = text::to_lowercase(text::trim(label));
    for (Venue venue : kAllVenues) {
        if (lowered == venue_label(venue)) {
            return venue;
        }
    }
    return std::nullopt;
}

}  // namespace prism
