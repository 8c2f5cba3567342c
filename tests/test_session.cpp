/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "jitstream/service.hpp"
#include "jitstream/session.hpp"
#include "test_support.hpp"

using namespace jitstream;

namespace {
constexpr const char* kDevice = "ABCD";
constexpr const char* kAddress = "10.0.0.7";
constexpr const char* kBundle = "com.example.app";

const Bytes kPairRecord{'<', 'd', 'i', 'c', 't', '/', '>'};

class FakeMux final : public MuxRegistrar {
public:
    RegisterResult addDevice(const DeviceId& device, const std::string& address) noexcept override {
        added.push_back(device + "@" + address);
        calls.push_back("add:" + device);
        return {addOk, addOk ? "" : "Result 2"};
    }
    RegisterResult removeDevice(const DeviceId& device) noexcept override {
        removed.push_back(device);
        return {true, ""};
    }
    RegisterResult savePairRecord(const DeviceId& device, const Bytes& record) noexcept override {
        savedRecord = record;
        calls.push_back("save:" + device);
        return {saveOk, saveOk ? "" : "SavePairRecord rejected by multiplexer (Result 22)"};
    }

    bool addOk = true;
    bool saveOk = true;
    std::vector<std::string> added;
    std::vector<DeviceId> removed;
    std::vector<std::string> calls;
    Bytes savedRecord;
};

class FakeHeartbeats final : public HeartbeatStarter {
public:
    HeartbeatStart start(const DeviceId&) noexcept override {
        ++started;
        HeartbeatStart result;
        result.ok = true;
        result.handle = handle;
        return result;
    }

    int started = 0;
    HeartbeatHandle handle;
};

class RecordingControl final : public HeartbeatControl {
public:
    void store(const DeviceId& device, HeartbeatHandle) noexcept override { stores.push_back(device); }
    void kill(const DeviceId& device) noexcept override { kills.push_back(device); }

    std::vector<DeviceId> stores;
    std::vector<DeviceId> kills;
};

class FakeImages final : public ImageProbe {
public:
    ProbeResult developerImageMounted(const DeviceId&) noexcept override {
        ++probes;
        return {true, mounted, ""};
    }

    bool mounted = true;
    int probes = 0;
};

class FakeTunnels final : public TunnelDirectory {
public:
    std::optional<TunnelDescriptor> lookup(const DeviceId& device) noexcept override {
        ++lookups;
        if (!available) {
            return std::nullopt;
        }
        return TunnelDescriptor{device, "fd12::1", 60105, "utun5"};
    }

    bool available = true;
    int lookups = 0;
};

class FakeRemote final : public RemoteServices {
public:
    DiscoveryResult discover(const TunnelDescriptor& tunnel) noexcept override {
        discoveredOn = tunnel.address + ":" + std::to_string(tunnel.port);
        DiscoveryResult result;
        result.ok = true;
        result.services.deviceId = tunnel.deviceId;
        if (withProcessControl) {
            result.services.ports[kProcessControlService] = 50001;
        }
        if (withDebugProxy) {
            result.services.ports[kDebugProxyService] = 50002;
        }
        return result;
    }

    LaunchResult launch(const ServiceEndpoint& endpoint, const std::string& bundleId) noexcept override {
        launches.push_back(endpoint.address + ":" + std::to_string(endpoint.port) + "/" + bundleId);
        LaunchResult result;
        result.ok = launchOk;
        result.pid = launchOk ? 4242 : 0;
        result.memoryLimitLifted = launchOk;
        if (!launchOk) {
            result.error = "The application is not installed";
        }
        return result;
    }

    AttachResult attach(const ServiceEndpoint& endpoint, Pid pid, int detachCommands) noexcept override {
        attaches.push_back(endpoint.address + ":" + std::to_string(endpoint.port));
        attachedPid = pid;
        detaches = detachCommands;
        return {true, ""};
    }

    bool withProcessControl = true;
    bool withDebugProxy = true;
    bool launchOk = true;
    std::string discoveredOn;
    std::vector<std::string> launches;
    std::vector<std::string> attaches;
    Pid attachedPid = 0;
    int detaches = 0;
};

class FakeIdentities final : public IdentityResolver {
public:
    Identity resolve(const std::string& sourceAddress) noexcept override {
        Identity identity;
        if (sourceAddress != kAddress || owner.empty()) {
            identity.failure = {FailureKind::NotRegistered, Stage::Identity, sourceAddress};
            return identity;
        }
        identity.ok = true;
        identity.deviceId = owner;
        identity.pairing = {"HOST-1", kPairRecord};
        return identity;
    }
    void touch(const DeviceId& device) noexcept override { touched.push_back(device); }

    DeviceId owner = kDevice;   // empty: address unregistered
    std::vector<DeviceId> touched;
};

class FakeApps final : public AppCatalog {
public:
    AppListing debuggableApps(const DeviceId& device) noexcept override {
        queried.push_back(device);
        AppListing listing;
        listing.ok = ok;
        listing.bundleIds = bundles;
        if (!ok) {
            listing.error = "failed to connect to the installation proxy (-1)";
        }
        return listing;
    }

    bool ok = true;
    std::vector<std::string> bundles{"com.example.app", "com.example.tool"};
    std::vector<DeviceId> queried;
};
}

class SessionTest : public ::testing::Test {
protected:
    jitstream::testing::ScratchDir dir_;
    FakeMux mux_;
    FakeHeartbeats heartbeats_;
    RecordingControl control_;
    FakeImages images_;
    FakeTunnels tunnels_;
    FakeRemote remote_;
    FakeIdentities identities_;
    FakeApps apps_;
    std::unique_ptr<QueueStore> queues_;
    std::unique_ptr<SessionContext> context_;
    int sleeps_ = 0;

    void SetUp() override {
        QueueStoreOptions options;
        options.database = dir_.file("queue.db");
        options.sleep = [](std::chrono::milliseconds) {};
        queues_ = std::make_unique<QueueStore>(options);
        std::string error;
        ASSERT_TRUE(queues_->ensureSchema(error)) << error;

        context_.reset(new SessionContext{mux_, heartbeats_, control_, images_, *queues_, tunnels_, remote_,
                                          identities_, apps_, 100, std::chrono::milliseconds(100), 2,
                                          [this](std::chrono::milliseconds) { ++sleeps_; }});
    }

    SessionOutcome runSession() {
        DeviceSession session(*context_, {kDevice, kAddress, kBundle, {"HOST-1", kPairRecord}});
        return session.run();
    }
};

TEST_F(SessionTest, FullRunLaunchesAttachesAndKillsHeartbeatOnce) {
    SessionOutcome outcome = runSession();

    ASSERT_TRUE(outcome.succeeded()) << outcome.failure.describe();
    EXPECT_EQ(outcome.pid, 4242u);
    EXPECT_TRUE(outcome.memoryLimitLifted);

    ASSERT_EQ(mux_.added.size(), 1u);
    EXPECT_EQ(mux_.added[0], "ABCD@10.0.0.7");
    EXPECT_EQ(mux_.calls, (std::vector<std::string>{"save:ABCD", "add:ABCD"}));
    EXPECT_EQ(mux_.savedRecord, kPairRecord);
    EXPECT_EQ(control_.stores, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(control_.kills, std::vector<DeviceId>{kDevice});

    EXPECT_EQ(remote_.discoveredOn, "fd12::1:60105");
    ASSERT_EQ(remote_.launches.size(), 1u);
    EXPECT_EQ(remote_.launches[0], "fd12::1:50001/com.example.app");
    ASSERT_EQ(remote_.attaches.size(), 1u);
    EXPECT_EQ(remote_.attaches[0], "fd12::1:50002");
    EXPECT_EQ(remote_.attachedPid, 4242u);
    EXPECT_EQ(remote_.detaches, 2);
    EXPECT_EQ(identities_.touched, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(sleeps_, 0);
}

TEST_F(SessionTest, MissingImageQueuesMountWithoutKillingHeartbeat) {
    images_.mounted = false;

    SessionOutcome outcome = runSession();

    EXPECT_EQ(outcome.kind, SessionOutcome::Kind::MountQueued);
    EXPECT_GT(outcome.mountOrdinal, 0);
    EXPECT_EQ(control_.stores.size(), 1u);
    EXPECT_TRUE(control_.kills.empty());
    EXPECT_EQ(tunnels_.lookups, 0);
    EXPECT_TRUE(remote_.discoveredOn.empty());

    auto status = queues_->queryStatus(QueueKind::Mount, kDevice);
    EXPECT_EQ(status.state, QueueState::Queued);
    EXPECT_EQ(status.position, 0u);
}

TEST_F(SessionTest, TunnelThatNeverAppearsTimesOut) {
    tunnels_.available = false;

    SessionOutcome outcome = runSession();

    EXPECT_EQ(outcome.kind, SessionOutcome::Kind::Failed);
    EXPECT_EQ(outcome.failure.kind, FailureKind::Timeout);
    EXPECT_EQ(outcome.failure.stage, Stage::AwaitingTunnel);
    EXPECT_EQ(tunnels_.lookups, 100);
    EXPECT_EQ(sleeps_, 99);
    EXPECT_EQ(control_.kills.size(), 1u);
    EXPECT_TRUE(remote_.discoveredOn.empty());
}

TEST_F(SessionTest, MissingDebugProxyMeansNotMounted) {
    remote_.withDebugProxy = false;

    SessionOutcome outcome = runSession();

    EXPECT_EQ(outcome.failure.kind, FailureKind::NotMounted);
    EXPECT_EQ(outcome.failure.stage, Stage::ServiceDiscovery);
    EXPECT_TRUE(remote_.launches.empty());
    EXPECT_EQ(control_.kills.size(), 1u);
}

TEST_F(SessionTest, RejectedRegistrationNeverStartsHeartbeat) {
    mux_.addOk = false;

    SessionOutcome outcome = runSession();

    EXPECT_EQ(outcome.failure.kind, FailureKind::Protocol);
    EXPECT_EQ(outcome.failure.stage, Stage::Registering);
    EXPECT_EQ(heartbeats_.started, 0);
    EXPECT_TRUE(control_.stores.empty());
    EXPECT_TRUE(control_.kills.empty());
}

TEST_F(SessionTest, LaunchFailureIsTaggedAndSkipsAttach) {
    remote_.launchOk = false;

    SessionOutcome outcome = runSession();

    EXPECT_EQ(outcome.failure.kind, FailureKind::Protocol);
    EXPECT_EQ(outcome.failure.stage, Stage::ProcessLaunch);
    EXPECT_NE(outcome.failure.describe().find("process launch"), std::string::npos);
    EXPECT_TRUE(remote_.attaches.empty());
    EXPECT_EQ(control_.kills.size(), 1u);
    EXPECT_TRUE(identities_.touched.empty());
}

TEST_F(SessionTest, ServiceReportsMountingRequiredThenGatesOnMountQueue) {
    images_.mounted = false;
    JitService service(*context_);

    LaunchResponse first = service.launchApp(kAddress, kBundle);
    EXPECT_FALSE(first.ok);
    EXPECT_TRUE(first.mountingRequired);
    EXPECT_NE(first.message.find("Mounting required"), std::string::npos);
    EXPECT_EQ(mux_.added.size(), 1u);

    // While the mount entry waits, no device traffic happens.
    LaunchResponse second = service.launchApp(kAddress, kBundle);
    EXPECT_TRUE(second.mountingRequired);
    EXPECT_EQ(second.position, 0u);
    EXPECT_EQ(mux_.added.size(), 1u);
    EXPECT_TRUE(control_.kills.empty());
}

TEST_F(SessionTest, ServiceLaunchSucceedsForRegisteredDevice) {
    JitService service(*context_);
    LaunchResponse response = service.launchApp(kAddress, kBundle);
    ASSERT_TRUE(response) << response.message;
    EXPECT_EQ(response.pid, 4242u);
    EXPECT_EQ(control_.kills.size(), 1u);
}

TEST_F(SessionTest, ServiceRejectsUnknownAddress) {
    JitService service(*context_);
    LaunchResponse response = service.launchApp("10.0.0.99", kBundle);
    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("No device registered"), std::string::npos);
    EXPECT_TRUE(mux_.added.empty());
}

TEST_F(SessionTest, QueuedLaunchIsProcessedAndCompleted) {
    JitService service(*context_);
    LaunchResponse queued = service.enqueueLaunch(kAddress, kBundle);
    ASSERT_TRUE(queued) << queued.message;
    EXPECT_EQ(queued.position, 0u);

    auto claim = queues_->claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    LaunchResponse response = service.processClaimed(*claim.entry);
    EXPECT_TRUE(response.ok) << response.message;
    EXPECT_EQ(queues_->queryStatus(QueueKind::Launch, kDevice).state, QueueState::NotQueued);
}

TEST_F(SessionTest, FailedQueuedLaunchIsReportedOnce) {
    remote_.launchOk = false;
    JitService service(*context_);
    ASSERT_TRUE(service.enqueueLaunch(kAddress, kBundle));

    auto claim = queues_->claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    EXPECT_FALSE(service.processClaimed(*claim.entry).ok);

    StatusReport first = service.status(kAddress);
    EXPECT_EQ(first.launch.state, QueueState::Failed);
    EXPECT_NE(first.launch.message.find("not installed"), std::string::npos);
    EXPECT_EQ(service.status(kAddress).launch.state, QueueState::NotQueued);
}

TEST_F(SessionTest, ReleaseKillsHeartbeatAndRemovesDevice) {
    JitService service(*context_);
    LaunchResponse response = service.release(kAddress);
    EXPECT_TRUE(response.ok);
    EXPECT_EQ(control_.kills, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(mux_.removed, std::vector<DeviceId>{kDevice});
}

TEST_F(SessionTest, SessionWithoutPairingRecordNeverRegisters) {
    DeviceSession session(*context_, {kDevice, kAddress, kBundle, {}});
    SessionOutcome outcome = session.run();

    EXPECT_EQ(outcome.failure.kind, FailureKind::Credential);
    EXPECT_EQ(outcome.failure.stage, Stage::Registering);
    EXPECT_TRUE(mux_.calls.empty());
    EXPECT_EQ(heartbeats_.started, 0);
}

TEST_F(SessionTest, RejectedPairRecordIsCredentialFailure) {
    mux_.saveOk = false;

    SessionOutcome outcome = runSession();

    EXPECT_EQ(outcome.failure.kind, FailureKind::Credential);
    EXPECT_EQ(outcome.failure.stage, Stage::Registering);
    EXPECT_TRUE(mux_.added.empty());
    EXPECT_EQ(heartbeats_.started, 0);
    EXPECT_TRUE(control_.kills.empty());
}

TEST_F(SessionTest, ServiceHandsResolvedPairingToMultiplexer) {
    JitService service(*context_);
    ASSERT_TRUE(service.launchApp(kAddress, kBundle));
    EXPECT_EQ(mux_.savedRecord, kPairRecord);
}

TEST_F(SessionTest, QueuedEntryForUnregisteredAddressFailsTheEntry) {
    JitService service(*context_);
    ASSERT_TRUE(service.enqueueLaunch(kAddress, kBundle));
    identities_.owner.clear();

    auto claim = queues_->claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    LaunchResponse response = service.processClaimed(*claim.entry);

    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("No device registered"), std::string::npos);
    EXPECT_TRUE(mux_.calls.empty());
    EXPECT_EQ(heartbeats_.started, 0);

    auto status = queues_->queryStatus(QueueKind::Launch, kDevice);
    EXPECT_EQ(status.state, QueueState::Failed);
    EXPECT_NE(status.message.find("No device registered"), std::string::npos);
}

TEST_F(SessionTest, QueuedEntryWhoseAddressMovedToAnotherDeviceFails) {
    JitService service(*context_);
    ASSERT_TRUE(service.enqueueLaunch(kAddress, kBundle));
    identities_.owner = "EFGH";

    auto claim = queues_->claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    LaunchResponse response = service.processClaimed(*claim.entry);

    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("EFGH"), std::string::npos);
    EXPECT_TRUE(mux_.calls.empty());
    EXPECT_EQ(queues_->queryStatus(QueueKind::Launch, kDevice).state, QueueState::Failed);
}

TEST_F(SessionTest, QueuedEntryRegistersWithPairingRecord) {
    JitService service(*context_);
    ASSERT_TRUE(service.enqueueLaunch(kAddress, kBundle));

    auto claim = queues_->claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    ASSERT_TRUE(service.processClaimed(*claim.entry));
    EXPECT_EQ(mux_.calls, (std::vector<std::string>{"save:ABCD", "add:ABCD"}));
    EXPECT_EQ(mux_.savedRecord, kPairRecord);
}

TEST_F(SessionTest, ServiceListsDebuggableApps) {
    JitService service(*context_);
    AppsResponse response = service.listApps(kAddress);

    ASSERT_TRUE(response) << response.message;
    EXPECT_EQ(response.bundleIds, (std::vector<std::string>{"com.example.app", "com.example.tool"}));
    EXPECT_EQ(mux_.calls, (std::vector<std::string>{"save:ABCD", "add:ABCD"}));
    EXPECT_EQ(apps_.queried, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(control_.stores, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(control_.kills, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(identities_.touched, std::vector<DeviceId>{kDevice});
    EXPECT_EQ(images_.probes, 0);
    EXPECT_EQ(tunnels_.lookups, 0);
}

TEST_F(SessionTest, NoDebuggableAppsIsAnError) {
    apps_.bundles.clear();
    JitService service(*context_);
    AppsResponse response = service.listApps(kAddress);

    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.message, "No apps with get-task-allow found");
    EXPECT_EQ(control_.kills.size(), 1u);
}

TEST_F(SessionTest, AppCatalogFailureIsTaggedAndKillsHeartbeat) {
    apps_.ok = false;
    JitService service(*context_);
    AppsResponse response = service.listApps(kAddress);

    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("app listing"), std::string::npos);
    EXPECT_EQ(control_.kills, std::vector<DeviceId>{kDevice});
    EXPECT_TRUE(identities_.touched.empty());
}

TEST_F(SessionTest, AppListingWaitsForQueuedLaunch) {
    JitService service(*context_);
    ASSERT_TRUE(service.enqueueLaunch(kAddress, kBundle));

    AppsResponse response = service.listApps(kAddress);
    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("busy launching"), std::string::npos);
    EXPECT_TRUE(mux_.calls.empty());
    EXPECT_TRUE(apps_.queried.empty());
}

TEST_F(SessionTest, AppListingWaitsForMount) {
    images_.mounted = false;
    JitService service(*context_);
    ASSERT_TRUE(service.launchApp(kAddress, kBundle).mountingRequired);
    mux_.calls.clear();

    AppsResponse response = service.listApps(kAddress);
    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("Mounting required"), std::string::npos);
    EXPECT_TRUE(mux_.calls.empty());
    EXPECT_TRUE(apps_.queried.empty());
}

TEST_F(SessionTest, AppListingRejectsUnknownAddress) {
    JitService service(*context_);
    AppsResponse response = service.listApps("10.0.0.99");
    EXPECT_FALSE(response.ok);
    EXPECT_NE(response.message.find("No device registered"), std::string::npos);
    EXPECT_TRUE(apps_.queried.empty());
}
