/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/service.hpp"
#include "jitstream/logger.hpp"

namespace jitstream {

namespace {
LaunchResponse failedWith(const Failure& failure) {
    LaunchResponse response;
    response.message = failure.describe();
    return response;
}

LaunchResponse failedWith(std::string message) {
    LaunchResponse response;
    response.message = std::move(message);
    return response;
}
}

std::optional<LaunchResponse> JitService::mountGate(const DeviceId& device) {
    QueueStatus mount = context_.queues.queryStatus(QueueKind::Mount, device);
    LaunchResponse response;
    switch (mount.state) {
        case QueueState::NotQueued:
            return std::nullopt;
        case QueueState::Queued:
            response.mountingRequired = true;
            response.position = mount.position;
            response.message = "Mounting required; position " + std::to_string(mount.position) + " in mount queue";
            return response;
        case QueueState::InProgress:
            response.mountingRequired = true;
            response.message = "Developer disk image is being mounted";
            return response;
        case QueueState::Failed:
            return failedWith("Mounting failed: " + mount.message);
        case QueueState::BackendError:
        default:
            return failedWith(Failure::backend(Stage::QueueCheck, mount.message));
    }
}

LaunchResponse JitService::runSession(const Identity& identity, const std::string& address,
                                      const std::string& bundleId) {
    const DeviceId& device = identity.deviceId;
    DeviceSession session(context_, {device, address, bundleId, identity.pairing});
    SessionOutcome outcome = session.run();

    LaunchResponse response;
    switch (outcome.kind) {
        case SessionOutcome::Kind::Success:
            response.ok = true;
            response.pid = outcome.pid;
            response.message = "Launched " + bundleId + " with JIT enabled";
            if (!outcome.memoryLimitLifted) {
                response.message += " (memory limit unchanged)";
            }
            return response;
        case SessionOutcome::Kind::MountQueued: {
            QueueStatus mount = context_.queues.queryStatus(QueueKind::Mount, device);
            response.mountingRequired = true;
            response.position = mount.state == QueueState::Queued ? mount.position : 0;
            response.message = "Mounting required; developer disk image queued for mounting";
            return response;
        }
        case SessionOutcome::Kind::Failed:
        default:
            return failedWith(outcome.failure);
    }
}

LaunchResponse JitService::launchApp(const std::string& sourceAddress, const std::string& bundleId) noexcept {
    try {
        Identity identity = context_.identities.resolve(sourceAddress);
        if (!identity) {
            return failedWith(identity.failure);
        }
        if (auto gated = mountGate(identity.deviceId)) {
            return *gated;
        }

        QueueStatus launch = context_.queues.queryStatus(QueueKind::Launch, identity.deviceId);
        switch (launch.state) {
            case QueueState::NotQueued:
                break;
            case QueueState::Queued: {
                LaunchResponse response;
                response.position = launch.position;
                response.message = "Already queued for launch at position " + std::to_string(launch.position);
                return response;
            }
            case QueueState::InProgress:
                return failedWith("A launch is already in progress for this device");
            case QueueState::Failed:
                return failedWith("Previous launch failed: " + launch.message);
            case QueueState::BackendError:
            default:
                return failedWith(Failure::backend(Stage::QueueCheck, launch.message));
        }

        return runSession(identity, sourceAddress, bundleId);
    } catch (const std::exception& e) {
        return failedWith(Failure::protocol(Stage::Identity, e.what()));
    }
}

LaunchResponse JitService::enqueueLaunch(const std::string& sourceAddress, const std::string& bundleId) noexcept {
    try {
        Identity identity = context_.identities.resolve(sourceAddress);
        if (!identity) {
            return failedWith(identity.failure);
        }
        if (auto gated = mountGate(identity.deviceId)) {
            return *gated;
        }

        EntryMetadata metadata;
        metadata.address = sourceAddress;
        metadata.bundleId = bundleId;
        auto queued = context_.queues.enqueue(QueueKind::Launch, identity.deviceId, metadata);
        if (!queued) {
            return failedWith(queued.failure);
        }

        QueueStatus launch = context_.queues.queryStatus(QueueKind::Launch, identity.deviceId);
        LaunchResponse response;
        response.ok = true;
        if (launch.state == QueueState::Queued) {
            response.position = launch.position;
            response.message = "Queued for launch at position " + std::to_string(launch.position);
        } else {
            response.message = describeStatus(launch);
        }
        return response;
    } catch (const std::exception& e) {
        return failedWith(Failure::backend(Stage::QueueCheck, e.what()));
    }
}

LaunchResponse JitService::processClaimed(const QueueEntry& entry) noexcept {
    LaunchResponse response;
    try {
        const std::string address = entry.address.value_or("");
        Identity identity = context_.identities.resolve(address);
        if (identity && identity.deviceId != entry.deviceId) {
            identity.ok = false;
            identity.failure = {FailureKind::NotRegistered, Stage::Identity,
                                address + " now belongs to " + identity.deviceId};
        }
        if (!identity) {
            response = failedWith(identity.failure);
        } else if (auto gated = mountGate(entry.deviceId)) {
            response = *gated;
        } else {
            response = runSession(identity, address, entry.bundleId.value_or(""));
        }
    } catch (const std::exception& e) {
        response = failedWith(Failure::protocol(Stage::Registering, e.what()));
    }

    bool recorded = response.ok ? context_.queues.complete(QueueKind::Launch, entry.ordinal)
                                : context_.queues.fail(QueueKind::Launch, entry.ordinal, response.message);
    if (!recorded) {
        LOG_ERROR("Could not record outcome of launch entry " + std::to_string(entry.ordinal) +
                  " for " + entry.deviceId);
    }
    return response;
}

AppsResponse JitService::listApps(const std::string& sourceAddress) noexcept {
    AppsResponse response;
    try {
        Identity identity = context_.identities.resolve(sourceAddress);
        if (!identity) {
            response.message = identity.failure.describe();
            return response;
        }
        if (auto gated = mountGate(identity.deviceId)) {
            response.message = gated->message;
            return response;
        }
        QueueStatus launch = context_.queues.queryStatus(QueueKind::Launch, identity.deviceId);
        if (launch.state == QueueState::BackendError) {
            response.message = Failure::backend(Stage::QueueCheck, launch.message).describe();
            return response;
        }
        if (launch.state == QueueState::Queued || launch.state == QueueState::InProgress) {
            response.message = "Device is busy launching an app: " + describeStatus(launch);
            return response;
        }
        if (launch.state == QueueState::Failed) {
            // Reading the failure consumed it; report it instead of dropping it.
            response.message = "Previous launch failed: " + launch.message;
            return response;
        }

        DeviceSession session(context_, {identity.deviceId, sourceAddress, {}, identity.pairing});
        AppListOutcome outcome = session.listApps();
        if (!outcome) {
            response.message = outcome.failure.describe();
            return response;
        }
        if (outcome.bundleIds.empty()) {
            response.message = "No apps with get-task-allow found";
            return response;
        }
        response.ok = true;
        response.bundleIds = std::move(outcome.bundleIds);
        response.message = std::to_string(response.bundleIds.size()) + " debuggable app(s)";
        return response;
    } catch (const std::exception& e) {
        response.ok = false;
        response.message = Failure::protocol(Stage::AppListing, e.what()).describe();
        return response;
    }
}

StatusReport JitService::status(const std::string& sourceAddress) noexcept {
    StatusReport report;
    try {
        Identity identity = context_.identities.resolve(sourceAddress);
        if (!identity) {
            report.message = identity.failure.describe();
            return report;
        }
        report.mount = context_.queues.queryStatus(QueueKind::Mount, identity.deviceId);
        report.launch = context_.queues.queryStatus(QueueKind::Launch, identity.deviceId);
        report.message = "mount: " + describeStatus(report.mount) + "; launch: " + describeStatus(report.launch);
        return report;
    } catch (const std::exception& e) {
        report.message = Failure::backend(Stage::QueueCheck, e.what()).describe();
        return report;
    }
}

LaunchResponse JitService::release(const std::string& sourceAddress) noexcept {
    try {
        Identity identity = context_.identities.resolve(sourceAddress);
        if (!identity) {
            return failedWith(identity.failure);
        }
        context_.orchestrator.kill(identity.deviceId);
        auto removed = context_.mux.removeDevice(identity.deviceId);
        if (!removed) {
            return failedWith(Failure::protocol(Stage::Registering, removed.error));
        }
        LaunchResponse response;
        response.ok = true;
        response.message = "Released " + identity.deviceId;
        return response;
    } catch (const std::exception& e) {
        return failedWith(Failure::protocol(Stage::Registering, e.what()));
    }
}

}
