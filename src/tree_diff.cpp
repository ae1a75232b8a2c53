#include "tree_diff.hpp"

namespace replicator {

namespace {

void diff_into(const table& previous, const table& current,
               table& added, table& removed) {
    for (const auto& [k, prev_val] : previous) {
        auto cur_it = current.find(k);

        if (cur_it == current.end()) {
            removed.emplace(k, true);
            continue;
        }

        const value& cur_val = cur_it->second;
        const table* prev_table = prev_val.table_if();
        const table* cur_table = cur_val.table_if();

        if (prev_table && cur_table) {
            table nested_added;
            table nested_removed;
            diff_into(*prev_table, *cur_table, nested_added, nested_removed);

            if (!nested_added.empty()) added.emplace(k, std::move(nested_added));
            if (!nested_removed.empty()) removed.emplace(k, std::move(nested_removed));
        } else if (cur_val != prev_val) {
            added.emplace(k, cur_val);
        }
    }

    // Brand new keys carry their whole value, there is nothing to diff against
    for (const auto& [k, cur_val] : current) {
        if (previous.find(k) == previous.end()) {
            added.emplace(k, cur_val);
        }
    }
}

} // namespace

diff_pair diff(const table& previous, const table& current) {
    diff_pair result;
    diff_into(previous, current, result.added, result.removed);
    return result;
}

void merge(table& target, const table& added, const table& removed) {
    static const table empty;

    for (const auto& [k, add_val] : added) {
        auto it = target.find(k);
        if (it != target.end()) {
            table* target_table = it->second.table_if();
            const table* add_table = add_val.table_if();
            if (target_table && add_table) {
                merge(*target_table, *add_table, empty);
                continue;
            }
            it->second = add_val;
        } else {
            target.emplace(k, add_val);
        }
    }

    for (const auto& [k, rem_val] : removed) {
        auto it = target.find(k);
        if (it == target.end()) continue;

        table* target_table = it->second.table_if();
        const table* rem_table = rem_val.table_if();
        if (target_table && rem_table) {
            merge(*target_table, empty, *rem_table);
        } else {
            target.erase(it);
        }
    }
}

bool reconcile(table& target, const table& defaults) {
    bool changed = false;
    for (const auto& [k, default_val] : defaults) {
        auto it = target.find(k);
        if (it == target.end()) {
            target.emplace(k, default_val);
            changed = true;
            continue;
        }

        table* target_table = it->second.table_if();
        const table* default_table = default_val.table_if();
        if (target_table && default_table) {
            changed = reconcile(*target_table, *default_table) || changed;
        }
    }
    return changed;
}

} // namespace replicator
