#include "quantlab/core/session_manager.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using namespace quantlab;

namespace {

core::ManagerConfig SmallPool(std::size_t max_sessions = 2) {
    core::ManagerConfig config;
    config.max_sessions = max_sessions;
    config.session_timeout = std::chrono::hours(1);
    config.cleanup_interval = std::chrono::milliseconds(50);
    config.base_port = 9000;
    config.default_params = fakes::FastParams();
    return config;
}

} // namespace

TEST(SessionManagerTest, SameIdReturnsSameSession) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(), fx.Deps());

    auto first = manager.GetOrCreateSession("default");
    auto second = manager.GetOrCreateSession("default");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_TRUE(first->IsInitialized());
    EXPECT_EQ(1, fx.tool->launch_calls.load());
    EXPECT_EQ(1u, manager.GetSessionCount().active);
}

TEST(SessionManagerTest, GetSessionDoesNotCreate) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(), fx.Deps());

    EXPECT_EQ(nullptr, manager.GetSession("missing"));
    manager.GetOrCreateSession("present");
    EXPECT_NE(nullptr, manager.GetSession("present"));
}

TEST(SessionManagerTest, AllocatesDistinctPorts) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(3), fx.Deps());

    auto a = manager.GetOrCreateSession("a");
    auto b = manager.GetOrCreateSession("b");
    EXPECT_EQ(9000, a->GetPort());
    EXPECT_EQ(9001, b->GetPort());

    manager.CloseSession("a");
    auto c = manager.GetOrCreateSession("c");
    EXPECT_EQ(9000, c->GetPort());
}

TEST(SessionManagerTest, ExplicitParamsAreUsed) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(), fx.Deps());

    auto params = fakes::FastParams();
    params.port = 9555;
    params.memory_limit_mb = 8192;
    auto session = manager.GetOrCreateSession("custom", params);
    EXPECT_EQ(9555, session->GetPort());
    EXPECT_EQ(8192u, session->GetParams().memory_limit_mb);
}

TEST(SessionManagerTest, CapacityIsEnforced) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(2), fx.Deps());

    manager.GetOrCreateSession("a");
    manager.GetOrCreateSession("b");

    try {
        manager.GetOrCreateSession("c");
        FAIL() << "expected CapacityExceededError";
    } catch (const core::CapacityExceededError& e) {
        EXPECT_EQ("Maximum number of sessions (2) reached", std::string(e.what()));
    }

    auto count = manager.GetSessionCount();
    EXPECT_EQ(2u, count.active);
    EXPECT_EQ(2u, count.max);
    EXPECT_EQ(0u, count.available);

    // Existing ids are still served when full
    EXPECT_NE(nullptr, manager.GetOrCreateSession("a"));
}

TEST(SessionManagerTest, ClosingFreesTheOnlySlot) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(1), fx.Deps());

    manager.GetOrCreateSession("s1");
    EXPECT_THROW(manager.GetOrCreateSession("s2"), core::CapacityExceededError);

    EXPECT_TRUE(manager.CloseSession("s1"));
    EXPECT_NE(nullptr, manager.GetOrCreateSession("s2"));
    EXPECT_EQ(nullptr, manager.GetSession("s1"));
    EXPECT_EQ(1u, manager.GetSessionCount().active);
}

TEST(SessionManagerTest, FullPoolEvictsExpiredSessions) {
    fakes::Fixture fx;
    auto config = SmallPool(1);
    config.session_timeout = std::chrono::milliseconds(20);
    core::SessionManager manager(config, fx.Deps());

    auto old_session = manager.GetOrCreateSession("old");
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    auto fresh = manager.GetOrCreateSession("fresh");
    EXPECT_NE(nullptr, fresh);
    EXPECT_EQ(core::SessionState::CLOSED, old_session->GetState());
    EXPECT_EQ(nullptr, manager.GetSession("old"));
}

TEST(SessionManagerTest, ConcurrentCreationProvisionsOnce) {
    fakes::Fixture fx;
    auto config = SmallPool(4);
    config.default_params.relocation_delay = std::chrono::milliseconds(100);
    core::SessionManager manager(config, fx.Deps());

    std::vector<std::shared_ptr<core::ResearchSession>> results(6);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&manager, &results, i]() {
            results[i] = manager.GetOrCreateSession("shared");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(1, fx.tool->launch_calls.load());
    for (const auto& session : results) {
        ASSERT_NE(nullptr, session);
        EXPECT_EQ(results[0].get(), session.get());
    }
}

TEST(SessionManagerTest, ConcurrentDistinctIdsRespectCapacity) {
    fakes::Fixture fx;
    auto config = SmallPool(3);
    config.default_params.relocation_delay = std::chrono::milliseconds(50);
    core::SessionManager manager(config, fx.Deps());

    std::atomic<int> created{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i]() {
            try {
                manager.GetOrCreateSession("s" + std::to_string(i));
                ++created;
            } catch (const core::CapacityExceededError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(3, created.load());
    EXPECT_EQ(3, rejected.load());

    std::set<int> ports;
    for (const auto& info : manager.ListSessions()) {
        ports.insert(info.port);
    }
    EXPECT_EQ(3u, ports.size());
}

TEST(SessionManagerTest, ProvisioningFailureReleasesSlot) {
    fakes::Fixture fx;
    fx.tool->installed = false;
    core::SessionManager manager(SmallPool(1), fx.Deps());

    EXPECT_THROW(manager.GetOrCreateSession("broken"), core::ProvisioningError);
    EXPECT_EQ(0u, manager.GetSessionCount().active);

    fx.tool->installed = true;
    EXPECT_NE(nullptr, manager.GetOrCreateSession("working"));
}

TEST(SessionManagerTest, CloseSession) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(), fx.Deps());

    auto session = manager.GetOrCreateSession("a");
    EXPECT_TRUE(manager.CloseSession("a", "user_request"));
    EXPECT_FALSE(manager.CloseSession("a"));
    EXPECT_EQ(core::SessionState::CLOSED, session->GetState());
    EXPECT_EQ(1u, fx.audit->Count("destroyed"));
}

TEST(SessionManagerTest, CleanupExpiredSessionsLeavesFreshOnes) {
    fakes::Fixture fx;
    auto config = SmallPool(3);
    config.session_timeout = std::chrono::milliseconds(80);
    core::SessionManager manager(config, fx.Deps());

    manager.GetOrCreateSession("stale");
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    manager.GetOrCreateSession("fresh");

    EXPECT_EQ(1u, manager.CleanupExpiredSessions());
    ASSERT_EQ(1u, manager.ListSessions().size());
    EXPECT_EQ("fresh", manager.ListSessions()[0].session_id);
}

TEST(SessionManagerTest, ZeroTimeoutSweepsEverySession) {
    fakes::Fixture fx;
    auto config = SmallPool(2);
    config.session_timeout = std::chrono::milliseconds(0);
    core::SessionManager manager(config, fx.Deps());

    auto a = manager.GetOrCreateSession("a");
    auto b = manager.GetOrCreateSession("b");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_EQ(2u, manager.CleanupExpiredSessions());
    EXPECT_TRUE(manager.ListSessions().empty());
    EXPECT_EQ(core::SessionState::CLOSED, a->GetState());
    EXPECT_EQ(core::SessionState::CLOSED, b->GetState());
}

TEST(SessionManagerTest, BackgroundSweepClosesIdleSessions) {
    fakes::Fixture fx;
    auto config = SmallPool(2);
    config.session_timeout = std::chrono::milliseconds(30);
    config.cleanup_interval = std::chrono::milliseconds(20);
    core::SessionManager manager(config, fx.Deps());

    manager.Start();
    EXPECT_TRUE(manager.IsRunning());
    manager.GetOrCreateSession("idle");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (manager.GetSessionCount().active > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(0u, manager.GetSessionCount().active);

    manager.Stop();
    EXPECT_FALSE(manager.IsRunning());
}

TEST(SessionManagerTest, StopClosesEverything) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(), fx.Deps());

    manager.Start();
    manager.Start();
    auto a = manager.GetOrCreateSession("a");
    auto b = manager.GetOrCreateSession("b");

    manager.Stop();
    manager.Stop();

    EXPECT_EQ(core::SessionState::CLOSED, a->GetState());
    EXPECT_EQ(core::SessionState::CLOSED, b->GetState());
    EXPECT_EQ(0u, manager.GetSessionCount().active);
    EXPECT_EQ(2u, fx.runtime->Stopped().size());
}

TEST(SessionManagerTest, StopWithoutStartClosesSessions) {
    fakes::Fixture fx;
    core::SessionManager manager(SmallPool(), fx.Deps());

    auto session = manager.GetOrCreateSession("a");
    EXPECT_FALSE(manager.IsRunning());

    manager.Stop();
    EXPECT_EQ(core::SessionState::CLOSED, session->GetState());
    EXPECT_EQ(0u, manager.GetSessionCount().active);
    EXPECT_EQ(1u, fx.audit->Count("destroyed"));
}

TEST(SessionManagerTest, DestructorClosesSessions) {
    fakes::Fixture fx;
    std::shared_ptr<core::ResearchSession> session;
    {
        core::SessionManager manager(SmallPool(), fx.Deps());
        session = manager.GetOrCreateSession("a");
    }
    EXPECT_EQ(core::SessionState::CLOSED, session->GetState());
}
