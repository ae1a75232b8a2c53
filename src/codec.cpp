#include "codec.hpp"

namespace replicator {

namespace {

bool has_integer_key(const table& t) {
    for (const auto& [k, v] : t) {
        if (std::holds_alternative<std::int64_t>(k)) return true;
    }
    return false;
}

key key_from_json(const nlohmann::json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number_integer()) return j.get<std::int64_t>();
    throw codec_error("codec: table key must be a string or an integer, got " +
                      std::string(j.type_name()));
}

} // namespace

nlohmann::json to_json(const table& t) {
    if (has_integer_key(t)) {
        auto pairs = nlohmann::json::array();
        for (const auto& [k, v] : t) {
            nlohmann::json jk;
            if (const auto* i = std::get_if<std::int64_t>(&k)) jk = *i;
            else jk = std::get<std::string>(k);
            pairs.push_back(nlohmann::json::array({std::move(jk), to_json(v)}));
        }
        return pairs;
    }

    auto obj = nlohmann::json::object();
    for (const auto& [k, v] : t) {
        obj[std::get<std::string>(k)] = to_json(v);
    }
    return obj;
}

nlohmann::json to_json(const value& v) {
    return std::visit([](const auto& alt) -> nlohmann::json {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<T, table>) {
            return to_json(alt);
        } else {
            return nlohmann::json(alt);
        }
    }, v.data());
}

table table_from_json(const nlohmann::json& j) {
    table t;
    if (j.is_object()) {
        for (const auto& [k, v] : j.items()) {
            t.emplace(k, value_from_json(v));
        }
        return t;
    }

    if (j.is_array()) {
        for (const auto& pair : j) {
            if (!pair.is_array() || pair.size() != 2) {
                throw codec_error("codec: table entry must be a [key, value] pair");
            }
            t.emplace(key_from_json(pair[0]), value_from_json(pair[1]));
        }
        return t;
    }

    throw codec_error("codec: expected a table, got " + std::string(j.type_name()));
}

value value_from_json(const nlohmann::json& j) {
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<std::int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_object() || j.is_array()) return table_from_json(j);
    throw codec_error("codec: unsupported value type " + std::string(j.type_name()));
}

bytes encode(const table& t) {
    return nlohmann::json::to_cbor(to_json(t));
}

table decode(std::span<const std::uint8_t> payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::from_cbor(payload.begin(), payload.end());
    } catch (const nlohmann::json::exception& e) {
        throw codec_error(std::string("codec: invalid CBOR payload: ") + e.what());
    }
    return table_from_json(j);
}

bytes pack_frame(const bytes& added, const bytes& removed) {
    auto frame = nlohmann::json::array({
        nlohmann::json::binary(added),
        nlohmann::json::binary(removed)
    });
    return nlohmann::json::to_cbor(frame);
}

std::pair<bytes, bytes> unpack_frame(std::span<const std::uint8_t> payload) {
    nlohmann::json frame;
    try {
        frame = nlohmann::json::from_cbor(payload.begin(), payload.end());
    } catch (const nlohmann::json::exception& e) {
        throw codec_error(std::string("codec: invalid diff frame: ") + e.what());
    }

    if (!frame.is_array() || frame.size() != 2 ||
        !frame[0].is_binary() || !frame[1].is_binary()) {
        throw codec_error("codec: diff frame must be [added, removed] byte strings");
    }

    return {bytes(frame[0].get_binary()), bytes(frame[1].get_binary())};
}

} // namespace replicator
