#pragma once

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace prism::venues {

/// Fail-soft accessors for loosely typed venue payloads
/// Venues send numbers as JSON strings ("65000.1"), as JSON numbers, as ""
/// or not at all; none of these may throw.
namespace fields {

/// Member of obj, or nullptr when obj is not an object or lacks a non-null key
[[nodiscard]] const nlohmann::json* member(const nlohmann::json& obj, std::string_view key);

/// True when the member exists, is non-null and is not an empty string
[[nodiscard]] bool is_present(const nlohmann::json& obj, std::string_view key);

/// Parse a string or number member as a finite double
/// Missing, empty, non-numeric and non-finite values give nullopt
[[nodiscard]] std::optional<double> number(const nlohmann::json& obj, std::string_view key);

/// number() of the first present key in precedence order
/// A present but unparsable value still wins (and yields nullopt)
[[nodiscard]] std::optional<double> first_number(const nlohmann::json& obj,
                                                 std::initializer_list<std::string_view> keys);

/// String member, or an integer member rendered as text
[[nodiscard]] std::optional<std::string> text(const nlohmann::json& obj, std::string_view key);

/// First element of an array when it is an object, else nullptr
[[nodiscard]] const nlohmann::json* first_row(const nlohmann::json& array);

}  // namespace fields

}  // namespace prism::venues
