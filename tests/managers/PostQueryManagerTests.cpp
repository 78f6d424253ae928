/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE PostQueryManagerTests
#include <boost/test/unit_test.hpp>
#include <boost/test/tools/floating_point_comparison.hpp>

#include "collisions/AABB.hpp"
#include "core/FrameScheduler.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/ActorDataManager.hpp"
#include "managers/CollisionManager.hpp"
#include "managers/PostQueryManager.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/JsonReader.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace Vantage;

// Global fixture: one thread pool for the whole module
struct ThreadSystemFixture {
    ThreadSystemFixture() { ThreadSystem::Instance().init(1024, 4); }
    ~ThreadSystemFixture() {
        if (!ThreadSystem::Instance().isShutdown()) {
            ThreadSystem::Instance().clean();
        }
    }
};

BOOST_GLOBAL_FIXTURE(ThreadSystemFixture);

struct PostQueryFixture {
    static constexpr int FRAMES_PER_TICK = 10;

    PostQueryFixture() {
        resetWorld();
        CollisionManager::Instance().init();
        ActorDataManager::Instance().init();
    }

    ~PostQueryFixture() { resetWorld(); }

    static void resetWorld() {
        PostQueryManager::Instance().clean();
        FrameScheduler::Instance().clean();
        CollisionManager::Instance().clean();
        ActorDataManager::Instance().clean();
        SettingsManager::Instance().clearAll();
    }

    // Initializes the manager with the given per-tick cap and cadence
    static bool start(int maxWorkers = PostQueryManager::DEFAULT_WORKER_COUNT,
                      int framesPerTick = FRAMES_PER_TICK) {
        auto& settings = SettingsManager::Instance();
        settings.set("postquery", "max_worker_count", maxWorkers);
        settings.set("postquery", "frames_per_tick", framesPerTick);
        return PostQueryManager::Instance().init();
    }

    static void run(int frames) {
        for (int i = 0; i < frames; ++i) {
            FrameScheduler::Instance().update();
        }
    }

    static ActorHandle spawn(float x, float y, float z) {
        return ActorDataManager::Instance().createActor(Vector3D(x, y, z));
    }

    static PostQueryCommand command(ActorHandle self, ActorHandle target,
                                    float angle = 60.0f, int step = 5, int depth = 1) {
        PostQueryCommand cmd;
        cmd.self = self;
        cmd.target = target;
        cmd.layerMask = Layer_All;
        cmd.parameters.angle = angle;
        cmd.parameters.distance = 10.0f;
        cmd.parameters.step = step;
        cmd.parameters.depth = depth;
        return cmd;
    }

    // Two boxes at x = 5 that block the two outer rays on each side of a
    // 5-ray, 60 degree fan cast from (10,0,0) towards the origin
    static void addSplitCover() {
        auto& collisions = CollisionManager::Instance();
        collisions.addStaticBody(AABB(Vector3D(5.0f, 0.0f, -2.25f), Vector3D(0.25f, 1.0f, 1.25f)), Layer_Cover);
        collisions.addStaticBody(AABB(Vector3D(5.0f, 0.0f, 2.25f), Vector3D(0.25f, 1.0f, 1.25f)), Layer_Cover);
    }
};

BOOST_FIXTURE_TEST_SUITE(PostQueryConfigurationTests, PostQueryFixture)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    BOOST_REQUIRE(PostQueryManager::Instance().init());
    BOOST_CHECK_EQUAL(PostQueryManager::Instance().getMaxWorkerCount(), 5);
    BOOST_CHECK_EQUAL(PostQueryManager::Instance().getFramesPerTick(), 25);
}

BOOST_AUTO_TEST_CASE(TestInitRejectsShortTick) {
    BOOST_CHECK(!start(5, 3));
    BOOST_CHECK(!PostQueryManager::Instance().isInitialized());
    BOOST_CHECK_EQUAL(FrameScheduler::Instance().getTimerCount(), 0u);

    BOOST_CHECK(start(5, 4));
    BOOST_CHECK(PostQueryManager::Instance().isInitialized());
    BOOST_CHECK_EQUAL(FrameScheduler::Instance().getTimerCount(), 2u);
}

BOOST_AUTO_TEST_CASE(TestInitRejectsZeroWorkers) {
    BOOST_CHECK(!start(0, 10));
    BOOST_CHECK(!PostQueryManager::Instance().isInitialized());
}

BOOST_AUTO_TEST_CASE(TestSettersValidate) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();

    BOOST_CHECK(!manager.setFramesPerTick(3));
    BOOST_CHECK(!manager.setMaxWorkerCount(0));
    BOOST_CHECK_EQUAL(manager.getFramesPerTick(), FRAMES_PER_TICK);
    BOOST_CHECK_EQUAL(manager.getMaxWorkerCount(), 5);

    BOOST_CHECK(manager.setMaxWorkerCount(2));
    BOOST_CHECK_EQUAL(manager.getMaxWorkerCount(), 2);
}

BOOST_AUTO_TEST_CASE(TestSettingsChangesReachManager) {
    BOOST_REQUIRE(start());
    auto& settings = SettingsManager::Instance();
    auto& manager = PostQueryManager::Instance();

    settings.set("postquery", "max_worker_count", 1);
    BOOST_CHECK_EQUAL(manager.getMaxWorkerCount(), 1);

    settings.set("postquery", "frames_per_tick", 2);
    BOOST_CHECK_EQUAL(manager.getFramesPerTick(), FRAMES_PER_TICK);

    settings.set("postquery", "frames_per_tick", 30.0f);
    BOOST_CHECK_EQUAL(manager.getFramesPerTick(), 30);
}

BOOST_AUTO_TEST_CASE(TestNewCadenceStartsAfterNextConsume) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    BOOST_REQUIRE(manager.setFramesPerTick(20));

    run(FRAMES_PER_TICK);
    BOOST_CHECK_EQUAL(manager.getStats().consumeCycles, 1u);
    run(19);
    BOOST_CHECK_EQUAL(manager.getStats().consumeCycles, 1u);
    run(1);
    BOOST_CHECK_EQUAL(manager.getStats().consumeCycles, 2u);
}

BOOST_AUTO_TEST_CASE(TestInitRejectsOutOfRangeTick) {
    // 5e9 does not fit in an int and is stored as a float
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"postquery": {"frames_per_tick": 5e9}})"));
    BOOST_REQUIRE(SettingsManager::Instance().loadFromJson(reader.getRoot(), "test"));

    BOOST_CHECK(!PostQueryManager::Instance().init());
    BOOST_CHECK(!PostQueryManager::Instance().isInitialized());
    BOOST_CHECK_EQUAL(FrameScheduler::Instance().getTimerCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestInitRejectsFractionalTick) {
    SettingsManager::Instance().set("postquery", "frames_per_tick", 4.5f);
    BOOST_CHECK(!PostQueryManager::Instance().init());
    BOOST_CHECK(!PostQueryManager::Instance().isInitialized());

    // Whole floats are accepted
    SettingsManager::Instance().set("postquery", "frames_per_tick", 12.0f);
    BOOST_CHECK(PostQueryManager::Instance().init());
    BOOST_CHECK_EQUAL(PostQueryManager::Instance().getFramesPerTick(), 12);
}

BOOST_AUTO_TEST_CASE(TestSettingsChangesRejectNonWholeValues) {
    BOOST_REQUIRE(start(3, FRAMES_PER_TICK));
    auto& settings = SettingsManager::Instance();
    auto& manager = PostQueryManager::Instance();

    settings.set("postquery", "frames_per_tick", 40.5f);
    settings.set("postquery", "frames_per_tick", 5e9f);
    settings.set("postquery", "max_worker_count", 2.5f);
    settings.set("postquery", "max_worker_count", std::string("many"));

    BOOST_CHECK_EQUAL(manager.getFramesPerTick(), FRAMES_PER_TICK);
    BOOST_CHECK_EQUAL(manager.getMaxWorkerCount(), 3);
}

BOOST_AUTO_TEST_CASE(TestEnqueueBeforeInitFails) {
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);
    BOOST_CHECK(!PostQueryManager::Instance().enqueueCommand(command(self, target)));
    BOOST_CHECK_EQUAL(PostQueryManager::Instance().getQueueSize(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PostQuerySchedulingTests, PostQueryFixture)

BOOST_AUTO_TEST_CASE(TestUnknownActorIsFree) {
    BOOST_REQUIRE(start());
    ActorHandle stranger = spawn(1.0f, 0.0f, 1.0f);
    BOOST_CHECK(PostQueryManager::Instance().isFree(stranger));
    BOOST_CHECK(PostQueryManager::Instance().getPosts(stranger).empty());
    BOOST_CHECK(PostQueryManager::Instance().getWorkerState(stranger) == PostQueryWorkerState::Idle);
}

BOOST_AUTO_TEST_CASE(TestIsFreeTimeline) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    BOOST_CHECK(manager.isFree(self));
    BOOST_REQUIRE(manager.enqueueCommand(command(self, target)));
    BOOST_CHECK(!manager.isFree(self));
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Pending);

    run(FRAMES_PER_TICK - 1);
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Pending);

    run(1); // Consume
    BOOST_CHECK(!manager.isFree(self));
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Running);

    run(PostQueryManager::COMPLETE_DELAY_FRAMES - 1);
    BOOST_CHECK(!manager.isFree(self));

    run(1); // Complete
    BOOST_CHECK(manager.isFree(self));
    BOOST_CHECK_EQUAL(manager.getStats().totalCompleted, 1u);
}

BOOST_AUTO_TEST_CASE(TestMaxWorkerCountCapsDispatch) {
    BOOST_REQUIRE(start(2));
    auto& manager = PostQueryManager::Instance();
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    std::vector<ActorHandle> actors;
    for (int i = 0; i < 5; ++i) {
        actors.push_back(spawn(0.0f, 0.0f, static_cast<float>(i)));
        manager.enqueueCommand(command(actors.back(), target));
    }
    BOOST_CHECK_EQUAL(manager.getQueueSize(), 5u);
    BOOST_CHECK_EQUAL(manager.getWorkerCount(), 5u);

    run(FRAMES_PER_TICK);

    size_t running = 0;
    for (ActorHandle actor : actors) {
        if (manager.getWorkerState(actor) == PostQueryWorkerState::Running) {
            ++running;
        }
    }
    BOOST_CHECK_EQUAL(running, 2u);
    // FIFO: the first two commands were dispatched
    BOOST_CHECK(manager.getWorkerState(actors[0]) == PostQueryWorkerState::Running);
    BOOST_CHECK(manager.getWorkerState(actors[1]) == PostQueryWorkerState::Running);
    BOOST_CHECK(manager.getWorkerState(actors[2]) == PostQueryWorkerState::Pending);

    PostQueryStats stats = manager.getStats();
    BOOST_CHECK_EQUAL(stats.totalDispatched, 2u);
    BOOST_CHECK_EQUAL(stats.lastBatchSize, 2u);
    BOOST_CHECK_EQUAL(stats.queueSize, 3u);

    run(FRAMES_PER_TICK);
    BOOST_CHECK_EQUAL(manager.getStats().totalDispatched, 4u);
    BOOST_CHECK_EQUAL(manager.getStats().totalCompleted, 2u);
    run(FRAMES_PER_TICK);
    BOOST_CHECK_EQUAL(manager.getStats().totalDispatched, 5u);
    BOOST_CHECK_EQUAL(manager.getQueueSize(), 0u);
}

BOOST_AUTO_TEST_CASE(TestSecondCommandForRunningActorIsDropped) {
    BOOST_REQUIRE(start());
    addSplitCover();
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    // The second command would see nothing: its mask excludes the cover
    PostQueryCommand first = command(self, target);
    PostQueryCommand second = command(self, target);
    second.layerMask = Layer_Trigger;
    manager.enqueueCommand(first);
    manager.enqueueCommand(second);

    run(FRAMES_PER_TICK);
    PostQueryStats stats = manager.getStats();
    BOOST_CHECK_EQUAL(stats.totalDispatched, 1u);
    BOOST_CHECK_EQUAL(stats.busyDrops, 1u);
    BOOST_CHECK_EQUAL(stats.queueSize, 0u);
    // The drop released the pending mark: only the running job remains
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Running);

    run(PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK(manager.isFree(self));
    BOOST_CHECK_EQUAL(manager.getPosts(self).size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestCommandQueuedWhileRunningWaitsForNextTick) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target));
    run(FRAMES_PER_TICK);
    manager.enqueueCommand(command(self, target));
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Running);

    run(PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Pending);

    run(FRAMES_PER_TICK - PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK_EQUAL(manager.getStats().totalDispatched, 2u);
    BOOST_CHECK_EQUAL(manager.getStats().busyDrops, 0u);
}

BOOST_AUTO_TEST_CASE(TestOpenGroundYieldsNoPosts) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target));
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);

    BOOST_CHECK_EQUAL(manager.getStats().totalCompleted, 1u);
    BOOST_CHECK(manager.getPosts(self).empty());
    BOOST_CHECK(manager.isFree(self));
}

BOOST_AUTO_TEST_CASE(TestPostsAreFirstPointOfEachBlockedRun) {
    BOOST_REQUIRE(start());
    addSplitCover();
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target));
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);

    // Rays at -30 and -15 hit the first box, 0 passes between, +15 and +30
    // hit the second box
    const auto& posts = manager.getPosts(self);
    BOOST_REQUIRE_EQUAL(posts.size(), 2u);
    BOOST_CHECK_CLOSE(posts[0].getX(), 5.25f, 0.01f);
    BOOST_CHECK_CLOSE(posts[0].getZ(), -4.75f * std::tan(30.0f * 3.14159265f / 180.0f), 0.1f);
    BOOST_CHECK_CLOSE(posts[1].getX(), 5.25f, 0.01f);
    BOOST_CHECK_CLOSE(posts[1].getZ(), 4.75f * std::tan(15.0f * 3.14159265f / 180.0f), 0.1f);
}

BOOST_AUTO_TEST_CASE(TestOffsetAndLayerMaskApply) {
    BOOST_REQUIRE(start());
    addSplitCover();
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    // Raised above the boxes: every ray passes over them
    PostQueryCommand raised = command(self, target);
    raised.offset = Vector3D(0.0f, 3.0f, 0.0f);
    manager.enqueueCommand(raised);
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK(manager.getPosts(self).empty());

    PostQueryCommand masked = command(self, target);
    masked.layerMask = Layer_Environment;
    manager.enqueueCommand(masked);
    run(FRAMES_PER_TICK);
    BOOST_CHECK(manager.getPosts(self).empty());
}

BOOST_AUTO_TEST_CASE(TestPostsReplacedOnlyAtCompletion) {
    BOOST_REQUIRE(start());
    addSplitCover();
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target));
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_REQUIRE_EQUAL(manager.getPosts(self).size(), 2u);

    CollisionManager::Instance().clean();
    CollisionManager::Instance().init();
    manager.enqueueCommand(command(self, target));

    run(FRAMES_PER_TICK - PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Running);
    BOOST_CHECK_EQUAL(manager.getPosts(self).size(), 2u);

    run(PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK(manager.getPosts(self).empty());
}

BOOST_AUTO_TEST_CASE(TestLargeFanAcrossManyChunks) {
    BOOST_REQUIRE(start());
    // One long wall across the whole fan
    CollisionManager::Instance().addStaticBody(
        AABB(Vector3D(5.0f, 0.0f, 0.0f), Vector3D(0.25f, 1.0f, 20.0f)), Layer_Cover);
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target, 90.0f, 50, 4));
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);

    // 200 rays, all blocked: one contiguous run, one post at the -45 degree ray
    const auto& posts = manager.getPosts(self);
    BOOST_REQUIRE_EQUAL(posts.size(), 1u);
    BOOST_CHECK_CLOSE(posts[0].getZ(), -4.75f, 0.1f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PostQueryAnomalyTests, PostQueryFixture)

BOOST_AUTO_TEST_CASE(TestDestroyedActorIsDropped) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target));
    ActorDataManager::Instance().destroyActor(target);
    run(FRAMES_PER_TICK);

    PostQueryStats stats = manager.getStats();
    BOOST_CHECK_EQUAL(stats.invalidDrops, 1u);
    BOOST_CHECK_EQUAL(stats.totalDispatched, 0u);
    BOOST_CHECK(manager.isFree(self));
}

BOOST_AUTO_TEST_CASE(TestZeroRayCountIsDropped) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target, 60.0f, 0, 1));
    run(FRAMES_PER_TICK);

    BOOST_CHECK_EQUAL(manager.getStats().invalidDrops, 1u);
    BOOST_CHECK(manager.isFree(self));
}

BOOST_AUTO_TEST_CASE(TestDroppedCommandsDoNotUseACapSlot) {
    BOOST_REQUIRE(start(1));
    auto& manager = PostQueryManager::Instance();
    ActorHandle ghost = spawn(5.0f, 0.0f, 5.0f);
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(ghost, target));
    manager.enqueueCommand(command(self, target));
    ActorDataManager::Instance().destroyActor(ghost);

    run(FRAMES_PER_TICK);
    BOOST_CHECK_EQUAL(manager.getStats().invalidDrops, 1u);
    BOOST_CHECK_EQUAL(manager.getStats().totalDispatched, 1u);
    BOOST_CHECK(manager.getWorkerState(self) == PostQueryWorkerState::Running);
}

BOOST_AUTO_TEST_CASE(TestCleanJoinsInFlightQueries) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target, 90.0f, 64, 8));
    manager.enqueueCommand(command(target, self));
    run(FRAMES_PER_TICK);
    BOOST_REQUIRE(manager.getWorkerState(self) == PostQueryWorkerState::Running);

    manager.clean();
    BOOST_CHECK(!manager.isInitialized());
    BOOST_CHECK_EQUAL(manager.getWorkerCount(), 0u);
    BOOST_CHECK_EQUAL(manager.getQueueSize(), 0u);
    BOOST_CHECK(manager.getPosts(self).empty());
    BOOST_CHECK_EQUAL(FrameScheduler::Instance().getTimerCount(), 0u);

    // Restartable
    BOOST_REQUIRE(start());
    manager.enqueueCommand(command(self, target));
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK_EQUAL(manager.getStats().totalCompleted, 1u);
}

BOOST_AUTO_TEST_CASE(TestResetStats) {
    BOOST_REQUIRE(start());
    auto& manager = PostQueryManager::Instance();
    ActorHandle self = spawn(0.0f, 0.0f, 0.0f);
    ActorHandle target = spawn(10.0f, 0.0f, 0.0f);

    manager.enqueueCommand(command(self, target));
    run(FRAMES_PER_TICK + PostQueryManager::COMPLETE_DELAY_FRAMES);
    BOOST_CHECK_EQUAL(manager.getStats().totalEnqueued, 1u);
    BOOST_CHECK_GE(manager.getStats().averageConsumeTimeMs, 0.0);

    manager.resetStats();
    PostQueryStats stats = manager.getStats();
    BOOST_CHECK_EQUAL(stats.totalEnqueued, 0u);
    BOOST_CHECK_EQUAL(stats.consumeCycles, 0u);
    BOOST_CHECK_EQUAL(stats.workerCount, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
