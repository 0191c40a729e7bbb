#include "proxyscout/util/JsonUtil.hpp"

namespace proxyscout::util {

boost::json::value parseJson(std::string_view payload) {
    return boost::json::parse(payload);
}

std::optional<std::string> stringField(const boost::json::object& obj, std::string_view key) {
    auto it = obj.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_string()) {
        const auto& str = it->as_string();
        return std::string(str.c_str(), str.size());
    }
    if (it->is_int64()) {
        return std::to_string(it->as_int64());
    }
    if (it->is_uint64()) {
        return std::to_string(it->as_uint64());
    }
    return std::nullopt;
}

} // namespace proxyscout::util
