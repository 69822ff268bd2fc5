#include <gtest/gtest.h>
#include "mcpconn/registry.hpp"
#include "mcpconn/logging.hpp"
#include "fake_server.hpp"
#include <thread>

using namespace mcpconn;
using namespace mcpconn::test_support;

namespace {

pid_t server_pid(ConnectionRegistry& registry, const std::string& id) {
    auto r = registry.execute_tool(id, "handshake_info", nlohmann::json::object());
    if (!is_ok(r)) return -1;
    return static_cast<pid_t>(get_value(r).result["pid"].get<long>());
}

} // anonymous namespace

TEST(RegistryLifecycle, CapacityIsEnforcedBeforeSpawning) {
    auto cfg = fast_config();
    cfg.max_connections = 2;
    ConnectionRegistry registry{cfg};

    ASSERT_TRUE(is_ok(registry.connect("a", fake_server())));
    ASSERT_TRUE(is_ok(registry.connect("b", fake_server())));

    PidFile pid_file;
    auto third = registry.connect("c", fake_server(), {}, {{"FAKE_MCP_PID_FILE", pid_file.path()}});
    ASSERT_FALSE(is_ok(third));
    EXPECT_EQ(get_error(third).kind, ErrorKind::CapacityError);
    EXPECT_FALSE(pid_file.read().has_value());
    EXPECT_EQ(registry.size(), 2u);
}

TEST(RegistryLifecycle, DisconnectTerminatesProcess) {
    ConnectionRegistry registry{fast_config()};
    auto r = registry.connect("fake", fake_server());
    ASSERT_TRUE(is_ok(r));
    const auto id = get_value(r).connection_id;
    pid_t pid = server_pid(registry, id);
    ASSERT_GT(pid, 0);

    ASSERT_TRUE(is_ok(registry.disconnect(id)));
    EXPECT_FALSE(pid_exists(pid));
    EXPECT_FALSE(registry.get_status(id).has_value());
    EXPECT_TRUE(registry.list().empty());

    auto again = registry.disconnect(id);
    ASSERT_FALSE(is_ok(again));
    EXPECT_EQ(get_error(again).kind, ErrorKind::NotFound);
}

TEST(RegistryLifecycle, DisconnectFreesCapacity) {
    auto cfg = fast_config();
    cfg.max_connections = 1;
    ConnectionRegistry registry{cfg};

    auto first = registry.connect("a", fake_server());
    ASSERT_TRUE(is_ok(first));
    ASSERT_FALSE(is_ok(registry.connect("b", fake_server())));
    ASSERT_TRUE(is_ok(registry.disconnect(get_value(first).connection_id)));
    EXPECT_TRUE(is_ok(registry.connect("b", fake_server())));
}

TEST(RegistryLifecycle, ExitedServerIsReportedDead) {
    ConnectionRegistry registry{fast_config()};
    auto r = registry.connect("short-lived", fake_server(), fake_server_args("exit-after-handshake"));
    ASSERT_TRUE(is_ok(r)) << get_error(r).message;
    const auto id = get_value(r).connection_id;

    ASSERT_TRUE(eventually([&] {
        auto s = registry.get_status(id);
        return s && !s->is_alive;
    }));

    auto call = registry.execute_tool(id, "echo", nlohmann::json::object());
    ASSERT_FALSE(is_ok(call));
    EXPECT_EQ(get_error(call).kind, ErrorKind::ProcessDead);

    auto all = registry.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].status, ConnectionStatus::Disconnected);
    EXPECT_FALSE(all[0].is_alive);

    // The dead entry stays until it is disconnected explicitly.
    EXPECT_TRUE(is_ok(registry.disconnect(id)));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(RegistryLifecycle, CrashDuringCallIsProcessDead) {
    ConnectionRegistry registry{fast_config()};
    auto r = registry.connect("crashy", fake_server());
    ASSERT_TRUE(is_ok(r));
    const auto id = get_value(r).connection_id;

    auto call = registry.execute_tool(id, "crash", nlohmann::json::object());
    ASSERT_FALSE(is_ok(call));
    EXPECT_EQ(get_error(call).kind, ErrorKind::ProcessDead) << get_error(call).message;

    auto status = registry.get_status(id);
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->is_alive);
    EXPECT_TRUE(is_terminal(status->status));
}

TEST(RegistryLifecycle, DeadEntryDoesNotHoldSlot) {
    auto cfg = fast_config();
    cfg.max_connections = 1;
    ConnectionRegistry registry{cfg};

    auto first = registry.connect("short-lived", fake_server(), fake_server_args("exit-after-handshake"));
    ASSERT_TRUE(is_ok(first));

    // Liveness is refreshed by connect itself; the exited child may take a
    // moment to become reapable.
    bool accepted = eventually([&] {
        auto r = registry.connect("replacement", fake_server());
        return is_ok(r);
    });
    EXPECT_TRUE(accepted);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(RegistryLifecycle, StubbornServerIsKilled) {
    auto cfg = fast_config();
    cfg.termination_grace = std::chrono::milliseconds(300);
    ConnectionRegistry registry{cfg};
    auto r = registry.connect("stubborn", fake_server(), fake_server_args("ignore-term"));
    ASSERT_TRUE(is_ok(r));
    const auto id = get_value(r).connection_id;
    pid_t pid = server_pid(registry, id);
    ASSERT_GT(pid, 0);

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(is_ok(registry.disconnect(id)));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(pid_exists(pid));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(RegistryLifecycle, ListIsOrderedByCreation) {
    ConnectionRegistry registry{fast_config()};
    std::vector<std::string> ids;
    for (const char* name : {"first", "second", "third"}) {
        auto r = registry.connect(name, fake_server());
        ASSERT_TRUE(is_ok(r));
        ids.push_back(get_value(r).connection_id);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    auto all = registry.list();
    ASSERT_EQ(all.size(), 3u);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(all[i].connection_id, ids[i]);
        EXPECT_EQ(all[i].status, ConnectionStatus::Connected);
        EXPECT_TRUE(all[i].is_alive);
        EXPECT_EQ(all[i].tools_count, 7u);
        EXPECT_EQ(all[i].resources_count, 2u);
    }
    EXPECT_EQ(all[0].name, "first");
    EXPECT_EQ(all[2].name, "third");
}

TEST(RegistryLifecycle, ShutdownTerminatesEverything) {
    std::vector<pid_t> pids;
    {
        ConnectionRegistry registry{fast_config()};
        for (int i = 0; i < 3; ++i) {
            auto r = registry.connect("n" + std::to_string(i), fake_server());
            ASSERT_TRUE(is_ok(r));
            pids.push_back(server_pid(registry, get_value(r).connection_id));
        }
        registry.shutdown();
        EXPECT_EQ(registry.size(), 0u);
        for (pid_t pid : pids) EXPECT_FALSE(pid_exists(pid));

        auto r = registry.connect("after", fake_server());
        ASSERT_TRUE(is_ok(r));
        pids.push_back(server_pid(registry, get_value(r).connection_id));
    }
    // The destructor cleans up what shutdown() left behind.
    EXPECT_FALSE(pid_exists(pids.back()));
}

TEST(RegistryLifecycle, UnknownIdHasNoStatus) {
    ConnectionRegistry registry{fast_config()};
    EXPECT_FALSE(registry.get_status("not-a-connection").has_value());
}

TEST(RegistryLifecycle, LogLevelIsOnlyAppliedWhenConfigured) {
    const auto before = logger()->level();
    set_log_level(spdlog::level::err);

    { ConnectionRegistry registry{fast_config()}; }
    EXPECT_EQ(logger()->level(), spdlog::level::err);

    auto cfg = fast_config();
    cfg.log_level = spdlog::level::debug;
    { ConnectionRegistry registry{cfg}; }
    EXPECT_EQ(logger()->level(), spdlog::level::debug);

    set_log_level(before);
}

TEST(RegistryLifecycle, ZeroGraceKillsImmediately) {
    auto cfg = fast_config();
    cfg.termination_grace = std::chrono::milliseconds(0);
    ConnectionRegistry registry{cfg};
    PidFile pid_file;
    auto r = registry.connect("stubborn", fake_server(), fake_server_args("ignore-term"),
                              {{"FAKE_MCP_PID_FILE", pid_file.path()}});
    ASSERT_TRUE(is_ok(r)) << get_error(r).message;

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(is_ok(registry.disconnect(get_value(r).connection_id)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(400));

    auto pid = pid_file.read();
    ASSERT_TRUE(pid.has_value());
    EXPECT_TRUE(eventually([&] { return !pid_exists(*pid); }));
}
