/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "jitstream/failure.hpp"
#include "jitstream/heartbeat.hpp"
#include "jitstream/identity.hpp"
#include "jitstream/lockdown.hpp"
#include "jitstream/mux.hpp"
#include "jitstream/queue_store.hpp"
#include "jitstream/remote_services.hpp"
#include "jitstream/tunnel.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

struct SessionRequest {
    DeviceId deviceId;
    std::string address;    // as the device was reached, for the multiplexer
    std::string bundleId;
    PairingRecord pairing;  // handed to the multiplexer before AddDevice
};

struct SessionOutcome {
    enum class Kind : std::uint8_t { Success, MountQueued, Failed };

    Kind kind = Kind::Failed;
    Pid pid = 0;
    bool memoryLimitLifted = false;
    Ordinal mountOrdinal = 0;
    Failure failure;

    [[nodiscard]] bool succeeded() const noexcept { return kind == Kind::Success; }

    static SessionOutcome failed(Failure failure) {
        SessionOutcome outcome;
        outcome.failure = std::move(failure);
        return outcome;
    }
};

struct AppListOutcome {
    bool ok = false;
    std::vector<std::string> bundleIds;
    Failure failure;
    explicit operator bool() const noexcept { return ok; }
};

// Everything a session talks to. All references must outlive the session.
struct SessionContext {
    MuxRegistrar& mux;
    HeartbeatStarter& heartbeats;
    HeartbeatControl& orchestrator;
    ImageProbe& images;
    QueueStore& queues;
    TunnelDirectory& tunnels;
    RemoteServices& remote;
    IdentityResolver& identities;
    AppCatalog& apps;

    int tunnelAttempts = 100;
    std::chrono::milliseconds tunnelInterval{100};
    int detachCommands = 2;
    Sleeper sleep;   // empty: std::this_thread::sleep_for
};

/*
 * One launch-and-attach run for one device:
 *   Registering -> AwaitingTunnel -> TunnelEstablished -> ServiceDiscovery
 *   -> ProcessLaunch -> DebugAttach -> Done
 * Any failing step ends the run with a failure tagged by that step. Once the
 * heartbeat has been stored, every exit except the mount hand-off kills it.
 *
 * listApps() shares the Registering step, then reads the installed apps
 * (AppListing) and ends the keep-alive.
 */
class DeviceSession final {
public:
    DeviceSession(SessionContext& context, SessionRequest request) noexcept
        : context_(context), request_(std::move(request)) {}

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    [[nodiscard]] SessionOutcome run() noexcept;
    [[nodiscard]] AppListOutcome listApps() noexcept;

    [[nodiscard]] Stage stage() const noexcept { return stage_; }

private:
    SessionContext& context_;
    SessionRequest request_;
    Stage stage_ = Stage::Registering;
    bool heartbeatStored_ = false;

    [[nodiscard]] SessionOutcome execute();
    [[nodiscard]] std::optional<Failure> registerDevice();
    [[nodiscard]] SessionOutcome abort(Failure failure) noexcept;
    void enter(Stage stage) noexcept;
};

}
