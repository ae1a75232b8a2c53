#include "change_notifier.hpp"
#include <algorithm>

namespace replicator {

namespace {

// True if `p`, one of its ancestors, or one of its descendants appears in
// the diff half `d`. An ancestor shows up as a leaf (a replacement value or
// a removal marker) met before the path is exhausted.
bool touches(const table& d, const path& p) {
    const table* current = &d;
    for (const auto& k : p) {
        auto it = current->find(k);
        if (it == current->end()) return false;
        current = it->second.table_if();
        if (!current) return true;
    }
    return true;
}

} // namespace

change_notifier::change_notifier(callback_dispatcher& dispatcher,
                                 std::shared_ptr<spdlog::logger> log)
    : m_dispatcher(dispatcher),
      m_log(std::move(log)),
      m_state(std::make_shared<state>())
{
    m_state->current = std::make_shared<const subscription_list>();
}

disconnect_fn change_notifier::listen(path p, change_callback cb, const value& current_root) {
    auto sub = std::make_shared<subscription>();
    sub->where = std::move(p);
    sub->callback = std::move(cb);

    {
        std::lock_guard<std::mutex> lock(m_state->write_mutex);
        sub->id = m_state->next_id++;

        auto next = std::make_shared<subscription_list>(*m_state->current);
        next->entries.push_back(sub);
        std::atomic_store(&m_state->current,
                          std::shared_ptr<const subscription_list>(std::move(next)));
    }

    m_log->debug("change_notifier: subscription {} on '{}'", sub->id, format_path(sub->where));

    if (const value* initial = resolve(current_root, sub->where)) {
        dispatch(sub, *initial);
    }

    std::weak_ptr<state> weak = m_state;
    uint64_t id = sub->id;
    return [weak, id]() {
        if (auto s = weak.lock()) remove_entry(*s, id);
    };
}

std::size_t change_notifier::notify(const table& added, const table& removed,
                                    const value& current_root) {
    auto subs = snapshot();

    std::size_t fired = 0;
    for (const auto& sub : subs->entries) {
        bool touched = sub->where.empty() ||
                       touches(added, sub->where) ||
                       touches(removed, sub->where);
        if (!touched) continue;

        dispatch(sub, lookup(current_root, sub->where));
        ++fired;
    }
    return fired;
}

bool change_notifier::disconnect(uint64_t id) {
    return remove_entry(*m_state, id);
}

bool change_notifier::remove_entry(state& s, uint64_t id) {
    std::lock_guard<std::mutex> lock(s.write_mutex);

    const auto& entries = s.current->entries;
    auto it = std::find_if(entries.begin(), entries.end(),
                           [id](const auto& e) { return e->id == id; });
    if (it == entries.end()) return false;

    auto next = std::make_shared<subscription_list>();
    next->entries.reserve(entries.size() - 1);
    for (const auto& e : entries) {
        if (e->id != id) next->entries.push_back(e);
    }
    std::atomic_store(&s.current, std::shared_ptr<const subscription_list>(std::move(next)));
    return true;
}

void change_notifier::dispatch(const std::shared_ptr<const subscription>& sub,
                               std::optional<value> v) {
    {
        std::lock_guard<std::mutex> lock(sub->delivery_mutex);
        sub->pending.push_back(std::move(v));
        if (sub->delivering) return;
        sub->delivering = true;
    }
    m_dispatcher.post([&dispatcher = m_dispatcher, sub]() {
        deliver_next(dispatcher, sub);
    });
}

// One value per task; the next one is posted when this one finishes, even if
// the callback threw.
void change_notifier::deliver_next(callback_dispatcher& dispatcher,
                                   std::shared_ptr<const subscription> sub) {
    std::optional<value> v;
    {
        std::lock_guard<std::mutex> lock(sub->delivery_mutex);
        v = std::move(sub->pending.front());
        sub->pending.pop_front();
    }

    struct continuation {
        callback_dispatcher& dispatcher;
        std::shared_ptr<const subscription> sub;

        ~continuation() {
            {
                std::lock_guard<std::mutex> lock(sub->delivery_mutex);
                if (sub->pending.empty()) {
                    sub->delivering = false;
                    return;
                }
            }
            dispatcher.post([&d = dispatcher, s = sub]() { deliver_next(d, s); });
        }
    } next{dispatcher, sub};

    sub->callback(v);
}

std::shared_ptr<const subscription_list> change_notifier::snapshot() const {
    return std::atomic_load(&m_state->current);
}

std::size_t change_notifier::active_count() const {
    return snapshot()->entries.size();
}

} // namespace replicator
