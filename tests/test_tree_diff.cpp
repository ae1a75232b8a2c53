#include "tree_diff.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using replicator::key;
using replicator::table;
using replicator::value;

namespace {

table profile(int money) {
    return table{
        {"Currencies", table{{"Money", money}}},
        {"Name", "Bob"},
    };
}

table apply(table base, const replicator::diff_pair& d) {
    replicator::merge(base, d);
    return base;
}

// Random trees over a small key pool so that generated pairs overlap.
// Integer and string keys share the pool, "1" and 1 included.
class tree_generator {
public:
    explicit tree_generator(std::uint32_t seed) : m_rng(seed) {}

    table make_table(int depth) {
        table t;
        int n = pick(0, 4);
        for (int i = 0; i < n; ++i) t[make_key()] = make_value(depth);
        return t;
    }

    // Deletes, replaces (often with another kind), descends into and adds keys.
    table mutate(table t, int depth) {
        std::vector<key> keys;
        for (const auto& [k, v] : t) keys.push_back(k);

        for (const auto& k : keys) {
            switch (pick(0, 4)) {
            case 0:
                t.erase(k);
                break;
            case 1:
                t[k] = make_value(depth);
                break;
            case 2:
                if (auto* nested = t[k].table_if(); nested && depth > 0) {
                    *nested = mutate(*nested, depth - 1);
                }
                break;
            default:
                break;
            }
        }

        int extra = pick(0, 2);
        for (int i = 0; i < extra; ++i) t[make_key()] = make_value(depth);
        return t;
    }

private:
    int pick(int lo, int hi) {
        return std::uniform_int_distribution<int>(lo, hi)(m_rng);
    }

    key make_key() {
        static const std::vector<key> pool{
            std::string("a"), std::string("b"), std::string("1"),
            std::int64_t{1}, std::int64_t{2}, std::int64_t{3},
        };
        return pool[pick(0, static_cast<int>(pool.size()) - 1)];
    }

    value make_value(int depth) {
        if (depth > 0 && pick(0, 2) == 0) return make_table(depth - 1);
        switch (pick(0, 4)) {
        case 0: return pick(0, 1) == 1;
        case 1: return pick(0, 2);
        case 2: return pick(0, 1) ? 1.0 : 2.5;
        case 3: return pick(0, 1) ? "x" : "y";
        default: return table{};
        }
    }

    std::mt19937 m_rng;
};

} // namespace

TEST(tree_diff, identical_trees_produce_empty_diff) {
    auto d = replicator::diff(profile(10), profile(10));
    EXPECT_TRUE(d.added.empty());
    EXPECT_TRUE(d.removed.empty());
    EXPECT_TRUE(d.empty());
}

TEST(tree_diff, changed_leaf_is_nested_in_added) {
    auto d = replicator::diff(profile(10), profile(15));

    table expected_added{{"Currencies", table{{"Money", 15}}}};
    EXPECT_EQ(d.added, expected_added);
    EXPECT_TRUE(d.removed.empty());
}

TEST(tree_diff, deleted_leaf_marks_removed_true) {
    table prev{{"Currencies", table{{"Money", 10}, {"Gems", 3}}}};
    table cur{{"Currencies", table{{"Gems", 3}}}};

    auto d = replicator::diff(prev, cur);
    EXPECT_TRUE(d.added.empty());
    table expected_removed{{"Currencies", table{{"Money", true}}}};
    EXPECT_EQ(d.removed, expected_removed);
}

TEST(tree_diff, deleted_subtree_is_a_single_marker) {
    table prev = profile(10);
    table cur{{"Name", "Bob"}};

    auto d = replicator::diff(prev, cur);
    table expected_removed{{"Currencies", true}};
    EXPECT_EQ(d.removed, expected_removed);
    EXPECT_TRUE(d.added.empty());
}

TEST(tree_diff, new_key_carries_whole_subtree) {
    table prev{{"Name", "Bob"}};
    table cur{{"Name", "Bob"}, {"Inventory", table{{1, "Sword"}, {2, "Shield"}}}};

    auto d = replicator::diff(prev, cur);
    table expected_added{{"Inventory", table{{1, "Sword"}, {2, "Shield"}}}};
    EXPECT_EQ(d.added, expected_added);
    EXPECT_TRUE(d.removed.empty());
}

TEST(tree_diff, kind_change_is_a_replacement) {
    table prev{{"Slot", table{{"Item", "Sword"}}}};
    table cur{{"Slot", "empty"}};

    auto d = replicator::diff(prev, cur);
    table expected_added{{"Slot", "empty"}};
    EXPECT_EQ(d.added, expected_added);
    EXPECT_TRUE(d.removed.empty());

    EXPECT_EQ(::apply(prev, d), cur);
}

TEST(tree_diff, int_and_double_are_distinct_values) {
    table prev{{"Ratio", 1}};
    table cur{{"Ratio", 1.0}};

    auto d = replicator::diff(prev, cur);
    ASSERT_EQ(d.added.size(), 1u);
    EXPECT_TRUE(d.added.at("Ratio").is_double());
}

TEST(tree_diff, merge_reproduces_current) {
    table prev{
        {"Currencies", table{{"Money", 10}, {"Gems", 3}}},
        {"Inventory", table{{1, "Sword"}, {2, "Shield"}}},
        {"Flags", table{{"Tutorial", true}}},
    };
    table cur{
        {"Currencies", table{{"Money", 25}}},
        {"Inventory", table{{1, "Sword"}, {3, "Bow"}}},
        {"Level", 4},
    };

    auto d = replicator::diff(prev, cur);
    EXPECT_EQ(::apply(prev, d), cur);
}

TEST(tree_diff, merge_is_idempotent) {
    table prev = profile(10);
    table cur{{"Currencies", table{{"Money", 15}}}};

    auto d = replicator::diff(prev, cur);
    table once = ::apply(prev, d);
    table twice = ::apply(once, d);
    EXPECT_EQ(once, twice);
    EXPECT_EQ(twice, cur);
}

TEST(tree_diff, merge_applies_added_before_removed) {
    table target{{"A", table{{"x", 1}}}};
    table added{{"A", table{{"y", 2}}}};
    table removed{{"A", true}};

    replicator::merge(target, added, removed);
    EXPECT_TRUE(target.empty());
}

TEST(tree_diff, merge_ignores_missing_removed_keys) {
    table target{{"A", 1}};
    table removed{{"B", true}, {"C", table{{"D", true}}}};

    replicator::merge(target, table{}, removed);
    table expected{{"A", 1}};
    EXPECT_EQ(target, expected);
}

TEST(tree_diff, full_state_as_added_populates_empty_mirror) {
    table authoritative = profile(10);
    table mirror;

    replicator::merge(mirror, authoritative, table{});
    EXPECT_EQ(mirror, authoritative);
}

TEST(tree_diff, reconcile_fills_missing_keys) {
    table data{{"Currencies", table{{"Money", 50}}}};
    table defaults{
        {"Currencies", table{{"Money", 0}, {"Gems", 0}}},
        {"Settings", table{{"Music", true}}},
    };

    EXPECT_TRUE(replicator::reconcile(data, defaults));

    table expected{
        {"Currencies", table{{"Money", 50}, {"Gems", 0}}},
        {"Settings", table{{"Music", true}}},
    };
    EXPECT_EQ(data, expected);
}

TEST(tree_diff, reconcile_never_overwrites) {
    table data{{"Settings", "legacy"}, {"Money", 7}};
    table defaults{{"Settings", table{{"Music", true}}}, {"Money", 0}};

    EXPECT_FALSE(replicator::reconcile(data, defaults));
    EXPECT_EQ(data.at("Settings"), value("legacy"));
    EXPECT_EQ(data.at("Money"), value(7));
}

TEST(tree_diff, nested_kind_changes_under_integer_keys) {
    table prev{
        {std::int64_t{1}, table{{std::int64_t{2}, "x"}, {"2", 4}}},
        {"1", 5},
        {"Bag", table{{std::int64_t{0}, table{{"Id", 7}}}}},
    };
    table cur{
        {std::int64_t{1}, 7},
        {"1", table{{std::int64_t{2}, true}}},
        {"Bag", table{{std::int64_t{0}, "empty"}, {std::int64_t{1}, table{{"Id", 8}}}}},
    };

    auto d = replicator::diff(prev, cur);
    EXPECT_EQ(::apply(prev, d), cur);
    EXPECT_EQ(::apply(::apply(prev, d), d), cur);
    EXPECT_EQ(d.added.at(std::int64_t{1}), value(7));
    EXPECT_FALSE(d.added.count(std::int64_t{2}));
}

TEST(tree_diff, merge_of_diff_reproduces_generated_trees) {
    tree_generator gen(20261018);
    int changed = 0;

    for (int i = 0; i < 500; ++i) {
        table a = gen.make_table(3);
        table b = gen.mutate(a, 3);
        SCOPED_TRACE("a = " + replicator::to_string(a) + ", b = " + replicator::to_string(b));

        auto d = replicator::diff(a, b);
        if (!d.empty()) ++changed;

        table merged = ::apply(a, d);
        ASSERT_EQ(merged, b);
        EXPECT_EQ(::apply(merged, d), b);
        EXPECT_EQ(::apply(b, replicator::diff(b, a)), a);
        EXPECT_TRUE(replicator::diff(b, b).empty());
    }

    EXPECT_GT(changed, 100);
}
