#pragma once

#include "callback_dispatcher.hpp"
#include "path_index.hpp"
#include "tree_diff.hpp"
#include "value.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace replicator {

// Receives the value now at the subscribed path; std::nullopt once the path
// has been deleted.
using change_callback = std::function<void(const std::optional<value>&)>;

// Returned by listen(). Calling it more than once, or after the notifier is
// gone, does nothing.
using disconnect_fn = std::function<void()>;

struct subscription {
    uint64_t id = 0;
    path where;
    change_callback callback;

    // Values waiting to be delivered, oldest first. At most one dispatcher
    // task per subscription is in flight, so deliveries arrive in order.
    mutable std::mutex delivery_mutex;
    mutable std::deque<std::optional<value>> pending;
    mutable bool delivering = false;
};

// Immutable view of the subscription set, swapped on every add/remove.
struct subscription_list {
    std::vector<std::shared_ptr<const subscription>> entries;
};

// Path subscriptions for one owning context (a server session or a mirror).
// Uses RCU-style snapshot swapping: notify() works on the snapshot current
// at its start, so callbacks may subscribe or disconnect freely.
class change_notifier {
public:
    change_notifier(callback_dispatcher& dispatcher, std::shared_ptr<spdlog::logger> log);

    // Register `cb` for `p`. If `p` resolves in `current_root`, an immediate
    // invocation is dispatched before this returns.
    disconnect_fn listen(path p, change_callback cb, const value& current_root);

    // Dispatch every subscription whose path, or an ancestor or descendant of
    // it, appears in `added` or `removed` (an empty path matches any change)
    // with its value in `current_root`.
    // Returns the number of callbacks dispatched.
    std::size_t notify(const table& added, const table& removed, const value& current_root);
    std::size_t notify(const diff_pair& d, const value& current_root) {
        return notify(d.added, d.removed, current_root);
    }

    // Removes the subscription; returns false if it was already gone.
    bool disconnect(uint64_t id);

    std::shared_ptr<const subscription_list> snapshot() const;

    std::size_t active_count() const;

private:
    // Shared with disconnect handles so they can outlive the notifier.
    struct state {
        std::mutex write_mutex;
        std::shared_ptr<const subscription_list> current;
        uint64_t next_id = 1;
    };

    static bool remove_entry(state& s, uint64_t id);

    void dispatch(const std::shared_ptr<const subscription>& sub, std::optional<value> v);
    static void deliver_next(callback_dispatcher& dispatcher,
                             std::shared_ptr<const subscription> sub);

    callback_dispatcher& m_dispatcher;
    std::shared_ptr<spdlog::logger> m_log;
    std::shared_ptr<state> m_state;
};

} // namespace replicator
