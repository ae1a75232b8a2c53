#pragma once

#include "codec.hpp"
#include <string>

namespace replicator {

// Point-to-point channel from the server to one identity. Implementations
// must preserve per-identity ordering.
class transport {
public:
    virtual ~transport() = default;

    virtual void send(const std::string& identity, bytes added, bytes removed) = 0;
};

} // namespace replicator
