/**
 * @file test_reconciler.cpp
 * @brief Unit tests for Reconciler.
 */

#include "controller/reconciler.hpp"
#include "session/simulated_session.hpp"
#include "store/event_recorder.hpp"
#include "store/memory_store.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace fabric_controller;

namespace {

RemoteClusterRecord make_record(const std::string& name, const std::string& uuid = "") {
    RemoteClusterRecord record;
    record.name = name;
    record.connection = ConnectionParams{.api_endpoint = "https://" + name, .token = "t"};
    record.status.uuid = uuid;
    return record;
}

bool wait_until(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

class ReconcilerTest : public ::testing::Test {
protected:
    ReconcilerTest()
        : sink_(owned_sink_.get())
        , logger_(std::move(owned_sink_), LogLevel::Debug)
        , registry_(logger_.with_component("session-registry"))
        , recorder_(logger_.with_component("events"))
        , reconciler_(Reconciler::Options{.workers = 2,
                                          .max_retries = 2,
                                          .base_delay = std::chrono::milliseconds(1),
                                          .max_delay = std::chrono::milliseconds(10)},
                      store_, registry_, lock_, factory_, recorder_,
                      [this](Event event) {
                          std::lock_guard lock(published_mutex_);
                          published_.push_back(std::move(event));
                          return true;
                      },
                      logger_.with_component("reconciler")) {}

    std::vector<Event> published() {
        std::lock_guard lock(published_mutex_);
        return published_;
    }

    bool has_event(const ClusterName& name, const std::string& reason) const {
        for (const auto& e : recorder_.events_for(name)) {
            if (e.reason == reason) return true;
        }
        return false;
    }

    std::unique_ptr<MemorySink> owned_sink_ = std::make_unique<MemorySink>();
    MemorySink* sink_;
    Logger logger_;
    MemoryRemoteClusterStore store_;
    UuidLock lock_;
    SessionRegistry registry_;
    SimulatedSessionFactory factory_;
    RecordingEventSink recorder_;
    std::mutex published_mutex_;
    std::vector<Event> published_;
    Reconciler reconciler_;
};

}  // namespace

TEST_F(ReconcilerTest, NewRecordGetsSession) {
    factory_.set_profile("cluster-a", PeerProfile{.peer_uuid = "u-a"});
    ASSERT_TRUE(store_.create(make_record("cluster-a")));

    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    EXPECT_TRUE(registry_.contains("cluster-a"));
    EXPECT_EQ(factory_.created_count("cluster-a"), 1u);

    // The session announces the identity it learned from the peer
    auto events = published();
    ASSERT_FALSE(events.empty());
    auto* refresh = std::get_if<RefreshUuidEvent>(&events[0]);
    ASSERT_NE(refresh, nullptr);
    EXPECT_EQ(refresh->uuid, "u-a");
    EXPECT_EQ(refresh->cluster_name, "cluster-a");
}

TEST_F(ReconcilerTest, ReconcileIsIdempotent) {
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));
    EXPECT_EQ(factory_.created_count("cluster-a"), 1u);
    EXPECT_EQ(factory_.closed_count("cluster-a"), 0u);
}

TEST_F(ReconcilerTest, PersistedUuidIsLocked) {
    ASSERT_TRUE(store_.create(make_record("cluster-a", "u1")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));
    EXPECT_EQ(lock_.owner_of("u1"), "cluster-a");
}

TEST_F(ReconcilerTest, DeleteClosesSessionAndReleasesLock) {
    ASSERT_TRUE(store_.create(make_record("cluster-a", "u1")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    ASSERT_TRUE(store_.erase("cluster-a"));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    EXPECT_FALSE(registry_.contains("cluster-a"));
    EXPECT_FALSE(lock_.owner_of("u1").has_value());
    EXPECT_EQ(factory_.closed_count("cluster-a"), 1u);
}

TEST_F(ReconcilerTest, DeletionMarkerIsTreatedAsGone) {
    ASSERT_TRUE(store_.create(make_record("cluster-a", "u1")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    ASSERT_TRUE(store_.mark_deleted("cluster-a"));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    EXPECT_FALSE(registry_.contains("cluster-a"));
    EXPECT_EQ(lock_.size(), 0u);
}

TEST_F(ReconcilerTest, AddThenDeleteResolvesToAbsent) {
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    reconciler_.enqueue("cluster-a");
    ASSERT_TRUE(store_.erase("cluster-a"));
    reconciler_.enqueue("cluster-a");

    // Both notifications collapse into one key
    EXPECT_EQ(reconciler_.queue().len(), 1u);
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));
    EXPECT_FALSE(registry_.contains("cluster-a"));
    EXPECT_EQ(factory_.created_count("cluster-a"), 0u);
}

TEST_F(ReconcilerTest, ConnectionChangeReplacesSession) {
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    auto changed = make_record("cluster-a");
    changed.connection.api_endpoint = "https://cluster-a.new";
    ASSERT_TRUE(store_.update(changed));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    EXPECT_EQ(factory_.created_count("cluster-a"), 2u);
    EXPECT_EQ(factory_.closed_count("cluster-a"), 1u);
    EXPECT_EQ(registry_.entry("cluster-a")->params.api_endpoint, "https://cluster-a.new");
}

TEST_F(ReconcilerTest, LabelChangeKeepsSession) {
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    auto relabelled = make_record("cluster-a");
    relabelled.labels["zone"] = "west";
    ASSERT_TRUE(store_.update(relabelled));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    EXPECT_EQ(factory_.created_count("cluster-a"), 1u);
    EXPECT_EQ(factory_.closed_count("cluster-a"), 0u);
}

TEST_F(ReconcilerTest, UnusableConnectionDeactivatesWithoutRetry) {
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    ASSERT_TRUE(reconciler_.reconcile("cluster-a"));

    auto broken = make_record("cluster-a");
    broken.connection.token.clear();
    ASSERT_TRUE(store_.update(broken));

    EXPECT_TRUE(reconciler_.reconcile("cluster-a"));
    EXPECT_FALSE(registry_.contains("cluster-a"));
    EXPECT_TRUE(has_event("cluster-a", "InvalidConnection"));
    EXPECT_EQ(recorder_.events_for("cluster-a")[0].type, EventType::Warning);
}

TEST_F(ReconcilerTest, UuidConflictDeactivatesAndFails) {
    ASSERT_TRUE(lock_.lock_by_owner("u1", "cluster-a"));
    ASSERT_TRUE(store_.create(make_record("cluster-b", "u1")));

    auto result = reconciler_.reconcile("cluster-b");
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is_conflict());
    EXPECT_FALSE(registry_.contains("cluster-b"));
    EXPECT_TRUE(has_event("cluster-b", "UUIDConflict"));
    EXPECT_EQ(lock_.owner_of("u1"), "cluster-a");
}

TEST_F(ReconcilerTest, SessionFailureIsReported) {
    factory_.set_profile("cluster-a", PeerProfile{.fail_create = true});
    ASSERT_TRUE(store_.create(make_record("cluster-a")));

    auto result = reconciler_.reconcile("cluster-a");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::Unavailable);
    EXPECT_TRUE(has_event("cluster-a", "SessionFailed"));
}

TEST_F(ReconcilerTest, WorkersProcessQueuedKeys) {
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    ASSERT_TRUE(store_.create(make_record("cluster-b")));
    reconciler_.start();

    reconciler_.enqueue("cluster-a");
    reconciler_.enqueue("cluster-b");

    EXPECT_TRUE(wait_until([this] { return registry_.size() == 2; }));
    reconciler_.stop();
}

TEST_F(ReconcilerTest, RetriesStopAtCeiling) {
    factory_.set_profile("cluster-a", PeerProfile{.fail_create = true});
    ASSERT_TRUE(store_.create(make_record("cluster-a")));
    reconciler_.start();
    reconciler_.enqueue("cluster-a");

    EXPECT_TRUE(wait_until([this] { return sink_->contains("dropping remote cluster cluster-a"); }));
    reconciler_.stop();

    // One initial attempt plus max_retries requeues
    EXPECT_EQ(recorder_.events_for("cluster-a").size(), 3u);
    EXPECT_EQ(reconciler_.queue().num_requeues("cluster-a"), 0u);
}

TEST_F(ReconcilerTest, ConflictRecoversOnceOwnerReleases) {
    ASSERT_TRUE(lock_.lock_by_owner("u1", "cluster-a"));
    ASSERT_TRUE(store_.create(make_record("cluster-b", "u1")));
    ASSERT_FALSE(reconciler_.reconcile("cluster-b"));

    lock_.release_by_owner("cluster-a");

    ASSERT_TRUE(reconciler_.reconcile("cluster-b"));
    EXPECT_TRUE(registry_.contains("cluster-b"));
    EXPECT_EQ(lock_.owner_of("u1"), "cluster-b");
}

TEST_F(ReconcilerTest, OutOfScopeRecordIsTornDown) {
    Reconciler scoped(Reconciler::Options{
                          .in_scope = [](const RemoteClusterRecord& record) {
                              auto it = record.labels.find("fabric");
                              return it != record.labels.end() && it->second == "peer";
                          }},
                      store_, registry_, lock_, factory_, recorder_,
                      [](Event) { return true; },
                      logger_.with_component("reconciler"));

    auto record = make_record("cluster-a", "u1");
    record.labels["fabric"] = "peer";
    ASSERT_TRUE(store_.create(record));
    ASSERT_TRUE(scoped.reconcile("cluster-a"));
    ASSERT_TRUE(registry_.contains("cluster-a"));

    record.labels["fabric"] = "other";
    ASSERT_TRUE(store_.update(record));
    ASSERT_TRUE(scoped.reconcile("cluster-a"));

    EXPECT_FALSE(registry_.contains("cluster-a"));
    EXPECT_EQ(factory_.closed_count("cluster-a"), 1u);
    EXPECT_FALSE(lock_.owner_of("u1").has_value());
    EXPECT_TRUE(sink_->contains("remote cluster cluster-a out of scope"));

    // Reconciling again is a no-op
    ASSERT_TRUE(scoped.reconcile("cluster-a"));
    EXPECT_EQ(factory_.created_count("cluster-a"), 1u);
}
