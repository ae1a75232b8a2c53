#pragma once

#include "value.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace replicator {

using bytes = std::vector<std::uint8_t>;

class codec_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// JSON form of a tree. Tables whose keys are all strings become objects;
// tables holding any integer key become an array of [key, value] pairs so
// integer keys survive the round trip.
nlohmann::json to_json(const value& v);
nlohmann::json to_json(const table& t);

// Throws codec_error on null, arrays that are not pair lists, or a
// non-table document root.
value value_from_json(const nlohmann::json& j);
table table_from_json(const nlohmann::json& j);

// CBOR payload of a table (the JSON form above, CBOR encoded).
bytes encode(const table& t);

// Throws codec_error on malformed input.
table decode(std::span<const std::uint8_t> payload);

// Diff frame: CBOR array of two byte strings [added, removed].
bytes pack_frame(const bytes& added, const bytes& removed);
std::pair<bytes, bytes> unpack_frame(std::span<const std::uint8_t> payload);

} // namespace replicator
