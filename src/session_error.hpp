#pragma once

#include <stdexcept>

namespace replicator {

// Operation against an identity that is not (or no longer) connected, or a
// mirror that has been closed.
class session_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace replicator
