#include "update_request.hpp"
#include "codec.hpp"
#include <stdexcept>

namespace replicator {

void update_request::apply(table& data) const {
    for (const auto& [where, v] : set) {
        assign(data, where, v);
    }
    for (const auto& where : remove) {
        erase(data, where);
    }
}

update_request parse_update_request(const nlohmann::json& req) {
    update_request out;
    out.identity = req.at("identity").get<std::string>();

    if (auto it = req.find("set"); it != req.end()) {
        if (!it->is_array()) throw std::invalid_argument("'set' must be a list");
        for (const auto& entry : *it) {
            auto where = parse_path(entry.at("path").get<std::string>());
            if (where.empty()) throw std::invalid_argument("'set' path must not be empty");
            out.set.emplace_back(std::move(where), value_from_json(entry.at("value")));
        }
    }

    if (auto it = req.find("remove"); it != req.end()) {
        if (!it->is_array()) throw std::invalid_argument("'remove' must be a list");
        for (const auto& entry : *it) {
            auto where = parse_path(entry.get<std::string>());
            if (where.empty()) throw std::invalid_argument("'remove' path must not be empty");
            out.remove.push_back(std::move(where));
        }
    }

    if (out.set.empty() && out.remove.empty()) {
        throw std::invalid_argument("update has neither 'set' nor 'remove'");
    }
    return out;
}

} // namespace replicator
