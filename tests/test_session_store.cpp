#include "session_store.hpp"
#include "mirror_store.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include <vector>

using replicator::bytes;
using replicator::path;
using replicator::session_error;
using replicator::table;
using replicator::value;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// In-memory profile store. Loads can be held at a gate to exercise the
// "still loading" paths.
class memory_profiles : public replicator::profile_store {
public:
    std::optional<table> load(const std::string& identity) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++m_loads;
        m_load_started = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return !m_hold; });

        if (m_failing.count(identity)) return std::nullopt;
        auto it = m_documents.find(identity);
        if (it != m_documents.end()) return it->second;
        return table{};
    }

    void release(const std::string& identity, const table& data) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_documents[identity] = data;
        m_released.insert(identity);
        m_handlers.erase(identity);
    }

    void on_force_release(const std::string& identity, release_handler handler) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[identity] = std::move(handler);
    }

    void put(const std::string& identity, table data) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_documents[identity] = std::move(data);
    }

    void fail(const std::string& identity) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(identity);
    }

    void hold() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hold = true;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hold = false;
        }
        m_cv.notify_all();
    }

    void wait_for_load() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_load_started; });
    }

    void force(const std::string& identity) {
        release_handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_handlers.find(identity);
            if (it == m_handlers.end()) return;
            handler = std::move(it->second);
            m_handlers.erase(it);
        }
        handler();
    }

    int loads() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_loads;
    }

    bool released(const std::string& identity) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_released.count(identity) > 0;
    }

    table document(const std::string& identity) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_documents.at(identity);
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_hold = false;
    bool m_load_started = false;
    int m_loads = 0;
    std::map<std::string, table> m_documents;
    std::set<std::string> m_failing;
    std::set<std::string> m_released;
    std::map<std::string, release_handler> m_handlers;
};

// Decodes every frame it is handed; optionally feeds a mirror.
class recording_transport : public replicator::transport {
public:
    struct frame {
        std::string identity;
        table added;
        table removed;
    };

    void send(const std::string& identity, bytes added, bytes removed) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frames.push_back({identity, replicator::decode(added), replicator::decode(removed)});
        if (mirror) mirror->on_receive(added, removed);
    }

    std::vector<frame> frames() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_frames;
    }

    replicator::mirror_store* mirror = nullptr;

private:
    mutable std::mutex m_mutex;
    std::vector<frame> m_frames;
};

table defaults() {
    return table{{"Currencies", table{{"Money", 0}, {"Gems", 0}}}};
}

struct store_fixture : ::testing::Test {
    std::shared_ptr<spdlog::logger> log = make_log();
    memory_profiles profiles;
    recording_transport wire;
    replicator::callback_dispatcher dispatcher{2, log};
    std::unique_ptr<replicator::session_store> store;

    std::mutex kick_mutex;
    std::vector<std::pair<std::string, std::string>> kicks;

    std::mutex seen_mutex;
    std::vector<std::optional<value>> seen;

    void SetUp() override {
        dispatcher.start();
        store = std::make_unique<replicator::session_store>(profiles, wire, dispatcher, defaults(), log);
        store->set_terminate_handler([this](const std::string& identity, const std::string& reason) {
            std::lock_guard<std::mutex> lock(kick_mutex);
            kicks.emplace_back(identity, reason);
        });
    }

    void TearDown() override {
        store.reset();
        dispatcher.stop();
    }

    replicator::change_callback record() {
        return [this](const std::optional<value>& v) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(v);
        };
    }

    std::vector<std::optional<value>> seen_values() {
        dispatcher.wait_idle();
        std::lock_guard<std::mutex> lock(seen_mutex);
        return seen;
    }
};

} // namespace

TEST_F(store_fixture, create_replicates_reconciled_full_state) {
    profiles.put("42", table{{"Currencies", table{{"Money", 10}}}});

    EXPECT_TRUE(store->create_session("42"));

    auto frames = wire.frames();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].identity, "42");
    EXPECT_EQ(frames[0].added, (table{{"Currencies", table{{"Money", 10}, {"Gems", 0}}}}));
    EXPECT_TRUE(frames[0].removed.empty());
    EXPECT_EQ(store->session_count(), 1u);
}

TEST_F(store_fixture, create_twice_is_a_no_op) {
    EXPECT_TRUE(store->create_session("42"));
    EXPECT_TRUE(store->create_session("42"));

    EXPECT_EQ(profiles.loads(), 1);
    EXPECT_EQ(wire.frames().size(), 1u);
}

TEST_F(store_fixture, update_replicates_diff_and_notifies) {
    profiles.put("42", table{{"Currencies", table{{"Money", 10}}}});
    ASSERT_TRUE(store->create_session("42"));

    store->listen_to_value_changed("42", path{"Currencies", "Money"}, record());
    EXPECT_TRUE(store->update("42", [](table& data) {
        data["Currencies"].as_table()["Money"] = 15;
    }));

    auto values = seen_values();
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(*values[0], value(10));
    EXPECT_EQ(*values[1], value(15));

    auto frames = wire.frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[1].added, (table{{"Currencies", table{{"Money", 15}}}}));
    EXPECT_TRUE(frames[1].removed.empty());
}

TEST_F(store_fixture, deletion_notifies_absent) {
    profiles.put("42", table{{"Currencies", table{{"Money", 10}}}});
    ASSERT_TRUE(store->create_session("42"));

    store->listen_to_value_changed("42", path{"Currencies", "Money"}, record());
    store->update("42", [](table& data) {
        data["Currencies"].as_table().erase("Money");
    });

    auto values = seen_values();
    ASSERT_EQ(values.size(), 2u);
    EXPECT_FALSE(values[1].has_value());

    auto frames = wire.frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_TRUE(frames[1].added.empty());
    EXPECT_EQ(frames[1].removed, (table{{"Currencies", table{{"Money", true}}}}));
}

TEST_F(store_fixture, listen_on_missing_path_stays_silent_until_created) {
    ASSERT_TRUE(store->create_session("42"));

    store->listen_to_value_changed("42", path{"Inventory", 1}, record());
    EXPECT_TRUE(seen_values().empty());

    store->update("42", [](table& data) {
        data["Inventory"] = table{{1, "Sword"}};
    });

    auto values = seen_values();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(*values[0], value("Sword"));
}

TEST_F(store_fixture, load_failure_terminates_and_get_fails) {
    profiles.fail("bad");

    EXPECT_FALSE(store->create_session("bad"));

    ASSERT_EQ(kicks.size(), 1u);
    EXPECT_EQ(kicks[0].first, "bad");
    EXPECT_EQ(kicks[0].second, "Data couldn't be loaded, try rejoining!");
    EXPECT_THROW(store->get("bad"), session_error);
    EXPECT_TRUE(wire.frames().empty());
    EXPECT_EQ(store->get_stats().loads_failed, 1u);
}

TEST_F(store_fixture, get_on_unknown_identity_throws) {
    EXPECT_THROW(store->get("nobody"), session_error);
    EXPECT_THROW(store->update("nobody", [](table&) {}), session_error);
    EXPECT_EQ(store->peek("nobody"), nullptr);
}

TEST_F(store_fixture, concurrent_creates_share_one_load) {
    profiles.hold();

    bool first = false;
    bool second = false;
    std::thread a([&] { first = store->create_session("7"); });
    profiles.wait_for_load();
    std::thread b([&] { second = store->create_session("7"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    profiles.open();
    a.join();
    b.join();

    EXPECT_TRUE(first);
    EXPECT_TRUE(second);
    EXPECT_EQ(profiles.loads(), 1);
    EXPECT_EQ(wire.frames().size(), 1u);
}

TEST_F(store_fixture, get_waits_for_session_creation) {
    profiles.hold();

    std::thread creator([&] { store->create_session("7"); });
    profiles.wait_for_load();

    std::shared_ptr<replicator::session> got;
    std::thread getter([&] { got = store->get("7"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(store->peek("7"), nullptr);

    profiles.open();
    creator.join();
    getter.join();

    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->identity(), "7");
}

TEST_F(store_fixture, get_for_times_out_while_loading) {
    profiles.hold();

    std::thread creator([&] { store->create_session("3"); });
    profiles.wait_for_load();

    EXPECT_THROW(store->get_for("3", std::chrono::milliseconds(30)), session_error);

    profiles.open();
    creator.join();
    EXPECT_NE(store->get_for("3", std::chrono::milliseconds(30)), nullptr);
}

TEST_F(store_fixture, disconnect_during_load_fails_waiters_and_releases) {
    profiles.hold();

    bool created = true;
    std::thread creator([&] { created = store->create_session("7"); });
    profiles.wait_for_load();

    bool get_failed = false;
    std::thread getter([&] {
        try {
            store->get("7");
        } catch (const session_error&) {
            get_failed = true;
        }
    });

    EXPECT_FALSE(store->remove_session("7"));
    getter.join();
    EXPECT_TRUE(get_failed);

    profiles.open();
    creator.join();

    EXPECT_FALSE(created);
    EXPECT_TRUE(profiles.released("7"));
    EXPECT_EQ(store->session_count(), 0u);
    EXPECT_TRUE(wire.frames().empty());
}

TEST_F(store_fixture, reconnect_during_load_keeps_the_session) {
    profiles.hold();

    bool first = false;
    bool second = false;
    std::thread a([&] { first = store->create_session("9"); });
    profiles.wait_for_load();

    // Leave and come back while the first load is still running
    EXPECT_FALSE(store->remove_session("9"));
    std::thread b([&] { second = store->create_session("9"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    profiles.open();
    a.join();
    b.join();

    EXPECT_TRUE(second);
    EXPECT_EQ(store->session_count(), 1u);
    ASSERT_NE(store->peek("9"), nullptr);
    EXPECT_NO_THROW(store->get("9"));
    EXPECT_TRUE(kicks.empty());
}

TEST_F(store_fixture, forced_release_drops_session_and_kicks) {
    ASSERT_TRUE(store->create_session("9"));

    profiles.force("9");

    ASSERT_EQ(kicks.size(), 1u);
    EXPECT_EQ(kicks[0].first, "9");
    EXPECT_EQ(kicks[0].second, "Data loaded on another server!");
    EXPECT_EQ(store->peek("9"), nullptr);
    EXPECT_THROW(store->get("9"), session_error);
}

TEST_F(store_fixture, remove_persists_final_state) {
    ASSERT_TRUE(store->create_session("5"));
    store->update("5", [](table& data) {
        data["Currencies"].as_table()["Money"] = 99;
    });

    EXPECT_TRUE(store->remove_session("5"));
    EXPECT_FALSE(store->remove_session("5"));

    ASSERT_TRUE(profiles.released("5"));
    EXPECT_EQ(profiles.document("5"), (table{{"Currencies", table{{"Money", 99}, {"Gems", 0}}}}));
    EXPECT_THROW(store->get("5"), session_error);
}

TEST_F(store_fixture, release_runs_after_queued_updates) {
    ASSERT_TRUE(store->create_session("5"));

    store->update("5", [this](table& data) {
        // Removal while this turn is in flight must still persist the queued write
        store->update("5", [](table& d) { d["Level"] = 3; });
        store->remove_session("5");
        data["Level"] = 2;
    });

    ASSERT_TRUE(profiles.released("5"));
    EXPECT_EQ(profiles.document("5").at("Level"), value(3));
}

TEST_F(store_fixture, destroying_store_waits_for_queued_release) {
    ASSERT_TRUE(store->create_session("5"));
    auto s = store->get("5");

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool in_turn = false;
    bool gate_open = false;

    std::thread turn([&] {
        s->update([&](table& data) {
            std::unique_lock<std::mutex> lock(gate_mutex);
            in_turn = true;
            gate_cv.notify_all();
            gate_cv.wait(lock, [&] { return gate_open; });
            data["Level"] = 1;
        });
    });
    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate_cv.wait(lock, [&] { return in_turn; });
    }

    // The release queues behind the running turn, so destruction has to wait
    std::atomic<bool> destroyed{false};
    std::thread destroyer([&] {
        store.reset();
        destroyed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(destroyed);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        gate_open = true;
    }
    gate_cv.notify_all();
    turn.join();
    destroyer.join();

    EXPECT_TRUE(destroyed);
    ASSERT_TRUE(profiles.released("5"));
    EXPECT_EQ(profiles.document("5").at("Level"), value(1));
}

TEST_F(store_fixture, remove_all_releases_every_session) {
    ASSERT_TRUE(store->create_session("a"));
    ASSERT_TRUE(store->create_session("b"));

    store->remove_all();

    EXPECT_EQ(store->session_count(), 0u);
    EXPECT_TRUE(profiles.released("a"));
    EXPECT_TRUE(profiles.released("b"));
}

TEST_F(store_fixture, mirror_converges_with_server) {
    replicator::mirror_store mirror(dispatcher, log);
    wire.mirror = &mirror;

    profiles.put("42", table{{"Name", "Bob"}, {"Inventory", table{{1, "Sword"}, {2, "Shield"}}}});
    ASSERT_TRUE(store->create_session("42"));

    store->update("42", [](table& data) {
        data["Currencies"].as_table()["Money"] = 40;
        data["Inventory"].as_table().erase(static_cast<std::int64_t>(1));
    });
    store->update("42", [](table& data) {
        data.erase("Name");
        data["Inventory"].as_table()[3] = "Bow";
    });

    EXPECT_EQ(mirror.get(), store->peek("42")->snapshot());
    EXPECT_EQ(mirror.diffs_received(), 3u);
    EXPECT_EQ(store->get_stats().diffs_sent, 3u);

    wire.mirror = nullptr;
}
