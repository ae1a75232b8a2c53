#pragma once

#include "value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace replicator {

// Ordered key sequence identifying a location within a tree.
using path = std::vector<key>;

// Walk `p` from `root`. Returns nullptr (absent) as soon as a key is missing
// or a scalar is reached before the path is exhausted. An empty path
// resolves to the root itself.
const value* resolve(const value& root, const path& p);

// Table overload. The root table is not a value, so an empty path yields nullptr.
const value* resolve(const table& root, const path& p);

// Same as resolve() but returns a copy, std::nullopt when absent.
std::optional<value> lookup(const value& root, const path& p);

// Write `v` at `p`, creating intermediate tables and replacing scalars met
// on the way. Throws std::invalid_argument for an empty path.
void assign(table& root, const path& p, value v);

// Delete the entry at `p`. Returns false if it was absent.
bool erase(table& root, const path& p);

// "Currencies.Money" -> {"Currencies", "Money"}; "Slots.1" -> {"Slots", 1}.
// Empty segments are kept as empty string keys.
path parse_path(const std::string& dotted);

// Inverse of parse_path, used for logging.
std::string format_path(const path& p);

} // namespace replicator
