#include <gtest/gtest.h>
#include "sidecar/CallbackDispatcher.hpp"
#include "sidecar/IdleTracker.hpp"
#include "sidecar/Reconciler.hpp"

#include <stdexcept>
#include <vector>

using namespace kv::sidecar;
using namespace kv::types;
using State = Target::State;

class ReconcilerTest : public ::testing::Test {
protected:
    Reconciler reconciler;
};

TEST_F(ReconcilerTest, NewTargetsGetFreshStatus) {
    const TargetMap desired{{"job1", {Target(1, 10)}}};

    const auto result = reconciler.reconcile(desired, {});
    ASSERT_EQ(result.status.size(), 1u);
    const auto& status = result.status.at(1);
    EXPECT_EQ(status.series, 10);
    EXPECT_EQ(status.scrape_times, 0u);
    EXPECT_EQ(status.state, State::Normal);
    EXPECT_TRUE(result.transfers.empty());
}

TEST_F(ReconcilerTest, KnownHashKeepsCounters) {
    StatusMap previous;
    auto prev = ScrapeStatus(10);
    prev.scrape_times = 7;
    prev.series = 99;
    previous.emplace(1, prev);

    // Series changed upstream; the tracked counters must not follow it
    const TargetMap desired{{"job1", {Target(1, 500)}}};
    const auto result = reconciler.reconcile(desired, previous);

    EXPECT_EQ(result.status.at(1), prev);
}

TEST_F(ReconcilerTest, NormalToInTransferResetsAttempts) {
    StatusMap previous;
    auto prev = ScrapeStatus(10);
    prev.scrape_times = 42;
    previous.emplace(1, prev);

    Target tar(1, 10, State::InTransfer);
    tar.labels = {{"__address__", "node:9100"}};
    const auto result = reconciler.reconcile({{"job1", {tar}}}, previous);

    EXPECT_EQ(result.status.at(1).scrape_times, 0u);
    EXPECT_EQ(result.status.at(1).state, State::InTransfer);
    ASSERT_EQ(result.transfers.size(), 1u);
    EXPECT_EQ(result.transfers[0].job, "job1");
    EXPECT_EQ(result.transfers[0].hash, 1u);
    EXPECT_EQ(result.transfers[0].url, "http://node:9100/metrics");
}

TEST_F(ReconcilerTest, StayingInTransferDoesNotResetAgain) {
    StatusMap previous;
    auto prev = ScrapeStatus(10);
    prev.state = State::InTransfer;
    prev.scrape_times = 3;
    previous.emplace(1, prev);

    const auto result = reconciler.reconcile({{"job1", {Target(1, 10, State::InTransfer)}}}, previous);
    EXPECT_EQ(result.status.at(1).scrape_times, 3u);
    EXPECT_TRUE(result.transfers.empty());
}

TEST_F(ReconcilerTest, InTransferBackToNormalKeepsCounters) {
    StatusMap previous;
    auto prev = ScrapeStatus(10);
    prev.state = State::InTransfer;
    prev.scrape_times = 3;
    previous.emplace(1, prev);

    const auto result = reconciler.reconcile({{"job1", {Target(1, 10)}}}, previous);
    EXPECT_EQ(result.status.at(1).scrape_times, 3u);
    EXPECT_EQ(result.status.at(1).state, State::Normal);
}

TEST_F(ReconcilerTest, NewTargetAlreadyInTransferIsAnnounced) {
    const auto result = reconciler.reconcile({{"job1", {Target(7, 10, State::InTransfer)}}}, {});
    EXPECT_EQ(result.status.at(7).state, State::InTransfer);
    EXPECT_EQ(result.status.at(7).scrape_times, 0u);
    EXPECT_EQ(result.status.at(7).series, 10);
    ASSERT_EQ(result.transfers.size(), 1u);
    EXPECT_EQ(result.transfers[0].job, "job1");
    EXPECT_EQ(result.transfers[0].hash, 7u);
}

TEST_F(ReconcilerTest, VanishedHashesAreDropped) {
    StatusMap previous;
    previous.emplace(1, ScrapeStatus(1));
    previous.emplace(2, ScrapeStatus(2));

    const auto result = reconciler.reconcile({{"job1", {Target(2, 2)}}}, previous);
    EXPECT_EQ(result.status.size(), 1u);
    EXPECT_FALSE(result.status.contains(1));
    EXPECT_TRUE(result.status.contains(2));
}

TEST_F(ReconcilerTest, StatusKeysMatchDesiredHashesAcrossJobs) {
    const TargetMap desired{
        {"job1", {Target(1, 1), Target(2, 2)}},
        {"job2", {Target(3, 3)}},
        {"empty", {}}
    };
    const auto result = reconciler.reconcile(desired, {});
    EXPECT_EQ(result.status.size(), 3u);
    for (const auto hash : {1u, 2u, 3u}) EXPECT_TRUE(result.status.contains(hash));
}

TEST_F(ReconcilerTest, DuplicateHashSharesOneEntry) {
    const TargetMap desired{
        {"job1", {Target(1, 10)}},
        {"job2", {Target(1, 20)}}
    };
    const auto result = reconciler.reconcile(desired, {});
    ASSERT_EQ(result.status.size(), 1u);
    EXPECT_EQ(result.status.at(1).series, 10);
}

TEST(TransitionTest, OnlyNormalToInTransferBeginsTransfer) {
    EXPECT_TRUE(Reconciler::beginsTransfer(State::Normal, State::InTransfer));
    EXPECT_FALSE(Reconciler::beginsTransfer(State::Normal, State::Normal));
    EXPECT_FALSE(Reconciler::beginsTransfer(State::InTransfer, State::InTransfer));
    EXPECT_FALSE(Reconciler::beginsTransfer(State::InTransfer, State::Normal));
}

class IdleTrackerTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point now{std::chrono::seconds(1000)};
    IdleTracker tracker{[this] { return now; }};
};

TEST_F(IdleTrackerTest, StampsWhenEmpty) {
    TargetsInfo info;
    tracker.observe(info);
    ASSERT_TRUE(info.idle_at.has_value());
    EXPECT_EQ(*info.idle_at, now);
}

TEST_F(IdleTrackerTest, KeepsFirstStampWhileEmpty) {
    TargetsInfo info;
    tracker.observe(info);
    const auto first = info.idle_at;

    now += std::chrono::seconds(60);
    tracker.observe(info);
    EXPECT_EQ(info.idle_at, first);
}

TEST_F(IdleTrackerTest, ClearsWhenTargetsReturn) {
    TargetsInfo info;
    tracker.observe(info);
    info.status.emplace(1, ScrapeStatus(1));
    tracker.observe(info);
    EXPECT_FALSE(info.idle_at.has_value());
}

TEST(CallbackDispatcherTest, RunsInRegistrationOrder) {
    std::vector<int> calls;
    CallbackDispatcher dispatcher;
    dispatcher.add([&](const TargetMap&) { calls.push_back(1); },
                   [&](const TargetMap&) { calls.push_back(2); });
    dispatcher.add([&](const TargetMap&) { calls.push_back(3); });

    dispatcher.dispatch({});
    EXPECT_EQ(calls, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(dispatcher.size(), 3u);
}

TEST(CallbackDispatcherTest, StopsAtFirstFailure) {
    std::vector<int> calls;
    CallbackDispatcher dispatcher;
    dispatcher.add([&](const TargetMap&) { calls.push_back(1); },
                   [&](const TargetMap&) { throw std::runtime_error("observer down"); },
                   [&](const TargetMap&) { calls.push_back(3); });

    EXPECT_THROW(dispatcher.dispatch({}), std::runtime_error);
    EXPECT_EQ(calls, (std::vector<int>{1}));
}

TEST(CallbackDispatcherTest, PassesTheTargetSet) {
    const TargetMap targets{{"job1", {Target(1, 10)}}};
    TargetMap seen;
    CallbackDispatcher dispatcher;
    dispatcher.add([&](const TargetMap& t) { seen = t; });

    dispatcher.dispatch(targets);
    EXPECT_EQ(seen, targets);
}
