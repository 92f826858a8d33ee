#include "venues/json_fields.hpp"
#include "core/text.hpp"
#include <charconv>
#include <cmath>
#include <system_error>

namespace prism::venues::fields {

const nlohmann::json* member(const nlohmann::json& obj, std::string_view key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

bool is_present(const nlohmann::json& obj, std::string_view key) {
    const auto* value = member(obj, key);
    if (value == nullptr) {
        return false;
    }
    return !(value->is_string() && value->get_ref<const std::string&>().empty());
}

std::optional<double> number(const nlohmann::json& obj, std::string_view key) {
    const auto* value = member(obj, key);
    if (value == nullptr) {
        return std::nullopt;
    }

    double parsed = 0.0;
    if (value->is_number()) {
        parsed = value->get<double>();
    } else if (value->is_string()) {
        auto raw = prism::text::trim(value->get_ref<const std::string&>());
        if (raw.empty()) {
            return std::nullopt;
        }
        // Wire data: locale-independent, whole string must be consumed
        const char* last = raw.data() + raw.size();
        auto [ptr, ec] = std::from_chars(raw.data(), last, parsed);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> first_number(const nlohmann::json& obj,
                                   std::initializer_list<std::string_view> keys) {
    for (auto key : keys) {
        if (is_present(obj, key)) {
            return number(obj, key);
        }
    }
    return std::nullopt;
}

std::optional<std::string> text(const nlohmann::json& obj, std::string_view key) {
    const auto* value = member(obj, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_number_integer()) {
        return value->dump();
    }
    return std::nullopt;
}

const nlohmann::json* first_row(const nlohmann::json& array) {
    if (!array.is_array() || array.empty() || !array.front().is_object()) {
        return nullptr;
    }
    return &array.front();
}

}  // namespace prism::venues::fields
