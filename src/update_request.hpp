#pragma once

#include "path_index.hpp"
#include "value.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace replicator {

// Control-plane mutation:
//   {"identity": "42", "set": [{"path": "Currencies.Money", "value": 15}],
//    "remove": ["Inventory.Sword"]}
// Sets are applied before removals, each in listed order.
struct update_request {
    std::string identity;
    std::vector<std::pair<path, value>> set;
    std::vector<path> remove;

    void apply(table& data) const;
};

// Throws nlohmann::json::exception for a missing identity and
// codec_error / std::invalid_argument for malformed entries.
update_request parse_update_request(const nlohmann::json& req);

} // namespace replicator
