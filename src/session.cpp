/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/session.hpp"
#include "jitstream/logger.hpp"

namespace jitstream {

SessionOutcome DeviceSession::run() noexcept {
    try {
        return execute();
    } catch (const std::exception& e) {
        return abort(Failure::protocol(stage_, e.what()));
    }
}

void DeviceSession::enter(Stage stage) noexcept {
    stage_ = stage;
    try {
        LOG_DEBUG(request_.deviceId + ": " + stageName(stage));
    } catch (const std::exception&) {
        // stage transitions are informational only
    }
}

SessionOutcome DeviceSession::abort(Failure failure) noexcept {
    if (heartbeatStored_) {
        context_.orchestrator.kill(request_.deviceId);
        heartbeatStored_ = false;
    }
    try {
        LOG_WARN(request_.deviceId + " failed (" + failureKindName(failure.kind) + ") during " +
                 stageName(failure.stage) + ": " + failure.detail);
    } catch (const std::exception&) {
        // the failure still reaches the caller through the outcome
    }
    return SessionOutcome::failed(std::move(failure));
}

AppListOutcome DeviceSession::listApps() noexcept {
    AppListOutcome outcome;
    try {
        if (auto failed = registerDevice()) {
            outcome.failure = abort(std::move(*failed)).failure;
            return outcome;
        }

        enter(Stage::AppListing);
        auto listing = context_.apps.debuggableApps(request_.deviceId);
        if (!listing) {
            outcome.failure = abort(Failure::protocol(Stage::AppListing, listing.error)).failure;
            return outcome;
        }

        enter(Stage::Done);
        context_.orchestrator.kill(request_.deviceId);
        heartbeatStored_ = false;
        context_.identities.touch(request_.deviceId);
        outcome.ok = true;
        outcome.bundleIds = std::move(listing.bundleIds);
        return outcome;
    } catch (const std::exception& e) {
        outcome.ok = false;
        outcome.failure = abort(Failure::protocol(stage_, e.what())).failure;
        return outcome;
    }
}

std::optional<Failure> DeviceSession::registerDevice() {
    const DeviceId& device = request_.deviceId;

    enter(Stage::Registering);
    if (request_.pairing.data.empty()) {
        return Failure{FailureKind::Credential, Stage::Registering, "no pairing record for " + device};
    }
    LOG_DEBUG(device + ": handing over pairing record of host " + request_.pairing.hostId);
    auto saved = context_.mux.savePairRecord(device, request_.pairing.data);
    if (!saved) {
        return Failure{FailureKind::Credential, Stage::Registering, saved.error};
    }
    auto registered = context_.mux.addDevice(device, request_.address);
    if (!registered) {
        return Failure::protocol(Stage::Registering, registered.error);
    }
    auto heartbeat = context_.heartbeats.start(device);
    if (!heartbeat) {
        return Failure::protocol(Stage::Registering, heartbeat.error);
    }
    context_.orchestrator.store(device, heartbeat.handle);
    heartbeatStored_ = true;
    return std::nullopt;
}

SessionOutcome DeviceSession::execute() {
    const DeviceId& device = request_.deviceId;

    if (auto failed = registerDevice()) {
        return abort(std::move(*failed));
    }

    enter(Stage::MountCheck);
    auto probe = context_.images.developerImageMounted(device);
    if (!probe) {
        return abort(Failure::protocol(Stage::MountCheck, probe.error));
    }
    if (!probe.mounted) {
        EntryMetadata metadata;
        metadata.address = request_.address;
        auto queued = context_.queues.enqueue(QueueKind::Mount, device, metadata);
        if (!queued) {
            return abort(queued.failure);
        }
        // The mount worker needs the device to stay known to the multiplexer.
        heartbeatStored_ = false;
        LOG_INFO(device + ": developer image missing, mount entry " + std::to_string(queued.ordinal));
        SessionOutcome outcome;
        outcome.kind = SessionOutcome::Kind::MountQueued;
        outcome.mountOrdinal = queued.ordinal;
        return outcome;
    }

    enter(Stage::AwaitingTunnel);
    auto tunnel = waitForTunnel(context_.tunnels, device, context_.tunnelAttempts,
                                context_.tunnelInterval, context_.sleep);
    if (!tunnel) {
        return abort({FailureKind::Timeout, Stage::AwaitingTunnel,
                      "no tunnel after " + std::to_string(context_.tunnelAttempts) + " lookups"});
    }

    enter(Stage::TunnelEstablished);
    auto discovery = context_.remote.discover(*tunnel);
    if (!discovery) {
        return abort(Failure::protocol(Stage::TunnelEstablished, discovery.error));
    }

    enter(Stage::ServiceDiscovery);
    auto control = discovery.services.port(kProcessControlService);
    auto debug = discovery.services.port(kDebugProxyService);
    if (!control || !debug) {
        return abort({FailureKind::NotMounted, Stage::ServiceDiscovery,
                      std::string(control ? kDebugProxyService : kProcessControlService) + " not advertised"});
    }

    enter(Stage::ProcessLaunch);
    auto launched = context_.remote.launch({tunnel->address, *control}, request_.bundleId);
    if (!launched) {
        return abort(Failure::protocol(Stage::ProcessLaunch, launched.error));
    }

    enter(Stage::DebugAttach);
    auto attached = context_.remote.attach({tunnel->address, *debug}, launched.pid, context_.detachCommands);
    if (!attached) {
        return abort(Failure::protocol(Stage::DebugAttach, attached.error));
    }

    enter(Stage::Done);
    context_.orchestrator.kill(device);
    heartbeatStored_ = false;
    context_.identities.touch(device);
    LOG_INFO(device + ": " + request_.bundleId + " running with JIT as pid " + std::to_string(launched.pid));

    SessionOutcome outcome;
    outcome.kind = SessionOutcome::Kind::Success;
    outcome.pid = launched.pid;
    outcome.memoryLimitLifted = launched.memoryLimitLifted;
    return outcome;
}

}
