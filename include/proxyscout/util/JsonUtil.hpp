#pragma once

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proxyscout::util {

boost::json::value parseJson(std::string_view payload);

// Strings are returned as-is, integers in decimal. Anything else is absent.
std::optional<std::string> stringField(const boost::json::object& obj, std::string_view key);

} // namespace proxyscout::util
