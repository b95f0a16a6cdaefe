#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "xplane_autopilot_cpp/worker_pool.hpp"

namespace {

using std::chrono::milliseconds;

struct WorkerLog {
    int started = 0;
    int stopped = 0;
    bool fail_start = false;
    std::map<std::string, ExitCallback> exits;   ///< Latest worker's callback per address
    ControlState state;                          ///< What every worker reports
};

class FakeWorker : public Worker {
public:
    explicit FakeWorker(std::shared_ptr<WorkerLog> log) : log_(std::move(log)) {}
    ~FakeWorker() override { ++log_->stopped; }

    ControlState snapshot() const override { return log_->state; }

private:
    std::shared_ptr<WorkerLog> log_;
};

WorkerFactory fakeFactory(const std::shared_ptr<WorkerLog>& log) {
    return [log](const InstanceDescriptor& instance, ExitCallback on_exit) {
        if (log->fail_start) {
            throw std::runtime_error("cannot start " + instance.address);
        }
        ++log->started;
        log->exits[instance.address] = std::move(on_exit);
        std::unique_ptr<Worker> worker = std::make_unique<FakeWorker>(log);
        return worker;
    };
}

InstanceDescriptor master(const std::string& address) {
    InstanceDescriptor instance;
    instance.address = address;
    instance.host = HostKind::XPlane;
    instance.role = InstanceRole::Master;
    instance.version_number = 110000;
    return instance;
}

class WorkerPoolTest : public ::testing::Test {
protected:
    WorkerPoolTest() : log_(std::make_shared<WorkerLog>()) {
        policy_.max_restarts = 2;
        policy_.window = milliseconds(1000);
    }

    void crash(const std::string& address) {
        log_->exits.at(address)("boom");
    }

    std::shared_ptr<WorkerLog> log_;
    RestartPolicy policy_;
    WorkerPool::Clock::time_point t0_ = WorkerPool::Clock::now();
};

}  // namespace

TEST_F(WorkerPoolTest, OneWorkerPerAddress) {
    WorkerPool pool(fakeFactory(log_), policy_);

    EXPECT_TRUE(pool.startIfAbsent(master("a:1")));
    EXPECT_FALSE(pool.startIfAbsent(master("a:1")));
    EXPECT_TRUE(pool.startIfAbsent(master("b:1")));

    EXPECT_EQ(log_->started, 2);
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_TRUE(pool.contains("a:1"));
    EXPECT_FALSE(pool.contains("c:1"));
}

TEST_F(WorkerPoolTest, FailedStartIsNotRecorded) {
    WorkerPool pool(fakeFactory(log_), policy_);
    log_->fail_start = true;

    EXPECT_THROW(pool.startIfAbsent(master("a:1")), std::runtime_error);
    EXPECT_FALSE(pool.contains("a:1"));

    log_->fail_start = false;
    EXPECT_TRUE(pool.startIfAbsent(master("a:1")));
}

TEST_F(WorkerPoolTest, ExitIsHandledBySupervise) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));

    crash("a:1");
    EXPECT_EQ(log_->stopped, 0);
    EXPECT_EQ(log_->started, 1);

    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Ok);
    EXPECT_EQ(log_->stopped, 1);
    EXPECT_EQ(log_->started, 2);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.totalRestarts(), 1u);
}

TEST_F(WorkerPoolTest, CrashOnlyRestartsThatWorker) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));
    pool.startIfAbsent(master("b:1"));

    crash("b:1");
    pool.supervise(t0_);

    EXPECT_EQ(log_->stopped, 1);
    EXPECT_EQ(log_->started, 3);
    EXPECT_EQ(pool.size(), 2u);
}

TEST_F(WorkerPoolTest, StaleExitReportIgnored) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));

    ExitCallback first = log_->exits.at("a:1");
    first("boom");
    pool.supervise(t0_);
    ASSERT_EQ(log_->started, 2);

    first("boom again");
    pool.supervise(t0_);
    EXPECT_EQ(log_->started, 2);
    EXPECT_EQ(pool.totalRestarts(), 1u);
}

TEST_F(WorkerPoolTest, TooManyRestartsEscalate) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));

    crash("a:1");
    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Ok);
    crash("a:1");
    EXPECT_EQ(pool.supervise(t0_ + milliseconds(100)), WorkerPool::SuperviseResult::Ok);
    crash("a:1");
    EXPECT_EQ(pool.supervise(t0_ + milliseconds(200)), WorkerPool::SuperviseResult::Escalate);
    EXPECT_FALSE(pool.contains("a:1"));
}

TEST_F(WorkerPoolTest, RestartsOutsideWindowAreForgotten) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));

    for (int n = 0; n < 5; ++n) {
        crash("a:1");
        EXPECT_EQ(pool.supervise(t0_ + milliseconds(600 * n)), WorkerPool::SuperviseResult::Ok);
    }
    EXPECT_EQ(pool.totalRestarts(), 5u);
}

TEST_F(WorkerPoolTest, FailedRestartCountsAgainstLimit) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));

    crash("a:1");
    log_->fail_start = true;
    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Ok);
    EXPECT_TRUE(pool.contains("a:1"));
    EXPECT_FALSE(pool.isRunning("a:1"));
    EXPECT_TRUE(pool.liveInstances().empty());
    EXPECT_FALSE(pool.snapshot("a:1"));

    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Ok);
    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Escalate);
}

TEST_F(WorkerPoolTest, ClearStopsEverythingAndDropsPendingExits) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));
    pool.startIfAbsent(master("b:1"));
    crash("a:1");

    pool.clear();
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_EQ(log_->stopped, 2);

    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Ok);
    EXPECT_EQ(log_->started, 2);
}

TEST_F(WorkerPoolTest, LiveInstancesListsRunningWorkers) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));
    pool.startIfAbsent(master("b:1"));

    const auto live = pool.liveInstances();
    ASSERT_EQ(live.size(), 2u);
    EXPECT_EQ(live[0].address, "a:1");
    EXPECT_EQ(live[1].address, "b:1");
}

TEST_F(WorkerPoolTest, PendingRestartIsNotLive) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));
    pool.startIfAbsent(master("b:1"));

    crash("a:1");
    log_->fail_start = true;
    pool.supervise(t0_);

    const auto live = pool.liveInstances();
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].address, "b:1");
    EXPECT_EQ(pool.size(), 2u);

    // A pending restart still blocks a second worker for the address
    log_->fail_start = false;
    EXPECT_FALSE(pool.startIfAbsent(master("a:1")));
    EXPECT_EQ(pool.supervise(t0_), WorkerPool::SuperviseResult::Ok);
    EXPECT_TRUE(pool.isRunning("a:1"));
    EXPECT_EQ(pool.liveInstances().size(), 2u);
}

TEST_F(WorkerPoolTest, SnapshotOfRunningWorker) {
    WorkerPool pool(fakeFactory(log_), policy_);
    pool.startIfAbsent(master("a:1"));
    log_->state.setTime(12.5);
    log_->state.set(Field::Phi, 3.0);

    auto state = pool.snapshot("a:1");
    ASSERT_TRUE(state);
    EXPECT_EQ(state->time(), 12.5);
    EXPECT_EQ(state->get(Field::Phi), 3.0);

    EXPECT_FALSE(pool.snapshot("b:1"));
}

TEST_F(WorkerPoolTest, ExitAfterPoolIsGoneIsHarmless) {
    ExitCallback on_exit;
    {
        WorkerPool pool(fakeFactory(log_), policy_);
        pool.startIfAbsent(master("a:1"));
        on_exit = log_->exits.at("a:1");
    }
    EXPECT_NO_THROW(on_exit("late"));
}
