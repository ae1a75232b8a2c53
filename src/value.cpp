#include "value.hpp"
#include <sstream>

namespace replicator {

std::string to_string(const key& k) {
    if (const auto* i = std::get_if<std::int64_t>(&k)) return std::to_string(*i);
    return std::get<std::string>(k);
}

std::string to_string(const table& t) {
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : t) {
        if (!first) out += ", ";
        first = false;
        out += to_string(k);
        out += ": ";
        out += to_string(v);
    }
    out += "}";
    return out;
}

std::string to_string(const value& v) {
    if (v.is_table()) return to_string(v.as_table());
    if (v.is_bool()) return v.as_bool() ? "true" : "false";
    if (v.is_int()) return std::to_string(v.as_int());
    if (v.is_double()) {
        std::ostringstream ss;
        ss << v.as_double();
        return ss.str();
    }
    return "\"" + v.as_string() + "\"";
}

} // namespace replicator
