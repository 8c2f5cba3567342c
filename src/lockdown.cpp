/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/lockdown.hpp"
#include "jitstream/logger.hpp"
#include "jitstream/plist.hpp"
#include <libimobiledevice/heartbeat.h>
#include <libimobiledevice/installation_proxy.h>
#include <libimobiledevice/libimobiledevice.h>
#include <libimobiledevice/mobile_image_mounter.h>
#include <memory>
#include <thread>

namespace jitstream {

namespace {
constexpr std::uint32_t kFirstMarcoTimeoutMs = 15000;
constexpr std::uint32_t kMarcoSlackMs = 5000;

struct DeviceDeleter {
    void operator()(idevice_private* dev) const noexcept { idevice_free(dev); }
};
struct HeartbeatDeleter {
    void operator()(heartbeat_client_private* client) const noexcept { heartbeat_client_free(client); }
};
struct InstproxyDeleter {
    void operator()(instproxy_client_private* client) const noexcept { instproxy_client_free(client); }
};
struct MounterDeleter {
    void operator()(mobile_image_mounter_client_private* client) const noexcept {
        mobile_image_mounter_hangup(client);
        mobile_image_mounter_free(client);
    }
};

using DevicePtr = std::unique_ptr<idevice_private, DeviceDeleter>;
using HeartbeatPtr = std::unique_ptr<heartbeat_client_private, HeartbeatDeleter>;
using InstproxyPtr = std::unique_ptr<instproxy_client_private, InstproxyDeleter>;
using MounterPtr = std::unique_ptr<mobile_image_mounter_client_private, MounterDeleter>;

DevicePtr openNetworkDevice(const DeviceId& device, std::string& error) {
    idevice_t raw = nullptr;
    idevice_error_t rc = idevice_new_with_options(&raw, device.c_str(), IDEVICE_LOOKUP_NETWORK);
    if (rc != IDEVICE_E_SUCCESS || !raw) {
        error = "device " + device + " not known to the multiplexer (" + std::to_string(rc) + ")";
        return nullptr;
    }
    return DevicePtr(raw);
}

// Returns the interval the device asked for, or 0 on error.
std::uint32_t receiveMarco(heartbeat_client_t client, std::uint32_t timeoutMs) {
    plist_t raw = nullptr;
    heartbeat_error_t rc = heartbeat_receive_with_timeout(client, &raw, timeoutMs);
    PlistPtr marco(raw);
    if (rc != HEARTBEAT_E_SUCCESS || !marco) {
        LOG_DEBUG("Heartbeat receive failed: " + std::to_string(rc));
        return 0;
    }

    plist_t interval = plist_dict_get_item(static_cast<plist_t>(marco.get()), "Interval");
    if (!interval || plist_get_node_type(interval) != PLIST_UINT) {
        return 10;
    }
    std::uint64_t seconds = 0;
    plist_get_uint_val(interval, &seconds);
    return seconds == 0 ? 10 : static_cast<std::uint32_t>(seconds);
}

bool sendPolo(heartbeat_client_t client) {
    PlistPtr polo(plist_new_dict());
    plist_dict_set_item(static_cast<plist_t>(polo.get()), "Command", plist_new_string("Polo"));
    heartbeat_error_t rc = heartbeat_send(client, static_cast<plist_t>(polo.get()));
    if (rc != HEARTBEAT_E_SUCCESS) {
        LOG_DEBUG("Heartbeat send failed: " + std::to_string(rc));
        return false;
    }
    return true;
}

void keepAlive(DeviceId device, std::shared_ptr<idevice_private> dev, std::shared_ptr<heartbeat_client_private> client,
               HeartbeatHandle handle) {
    ThreadLabel label("hb:" + device);
    LOG_DEBUG("Heartbeat loop started for " + device);

    std::uint32_t timeout = kFirstMarcoTimeoutMs;
    std::size_t rounds = 0;
    while (!handle.cancelled()) {
        std::uint32_t interval = receiveMarco(client.get(), timeout);
        if (interval == 0 || !sendPolo(client.get())) {
            LOG_INFO("Heartbeat for " + device + " ended after " + std::to_string(rounds) + " round(s)");
            break;
        }
        ++rounds;
        timeout = interval * 1000 + kMarcoSlackMs;
    }

    if (handle.cancelled()) {
        LOG_DEBUG("Heartbeat for " + device + " cancelled");
    }
    client.reset();
    dev.reset();
}

bool imageSignaturePresent(mobile_image_mounter_client_t client, const char* type) {
    plist_t raw = nullptr;
    mobile_image_mounter_error_t rc = mobile_image_mounter_lookup_image(client, type, &raw);
    PlistPtr result(raw);
    if (rc != MOBILE_IMAGE_MOUNTER_E_SUCCESS || !result) {
        LOG_DEBUG(std::string("Image lookup for ") + type + " failed: " + std::to_string(rc));
        return false;
    }
    plist_t signatures = plist_dict_get_item(static_cast<plist_t>(result.get()), "ImageSignature");
    if (!signatures) {
        return false;
    }
    if (plist_get_node_type(signatures) == PLIST_ARRAY) {
        return plist_array_get_size(signatures) > 0;
    }
    return plist_get_node_type(signatures) == PLIST_DATA;
}

bool allowsTaskPort(plist_t app) {
    plist_t entitlements = plist_dict_get_item(app, "Entitlements");
    if (!entitlements || plist_get_node_type(entitlements) != PLIST_DICT) {
        return false;
    }
    plist_t allow = plist_dict_get_item(entitlements, "get-task-allow");
    if (!allow || plist_get_node_type(allow) != PLIST_BOOLEAN) {
        return false;
    }
    std::uint8_t value = 0;
    plist_get_bool_val(allow, &value);
    return value != 0;
}
}

std::vector<std::string> debuggableBundleIds(plist_t apps) {
    std::vector<std::string> out;
    if (!apps || plist_get_node_type(apps) != PLIST_ARRAY) {
        return out;
    }
    std::uint32_t count = plist_array_get_size(apps);
    for (std::uint32_t i = 0; i < count; ++i) {
        plist_t app = plist_array_get_item(apps, i);
        if (!app || plist_get_node_type(app) != PLIST_DICT || !allowsTaskPort(app)) {
            continue;
        }
        if (auto bundle = dictString(app, "CFBundleIdentifier")) {
            out.push_back(*bundle);
        }
    }
    return out;
}

HeartbeatStart LockdownHeartbeat::start(const DeviceId& device) noexcept {
    HeartbeatStart result;
    try {
        DevicePtr dev = openNetworkDevice(device, result.error);
        if (!dev) {
            return result;
        }

        heartbeat_client_t raw = nullptr;
        heartbeat_error_t rc = heartbeat_client_start_service(dev.get(), &raw, label_.c_str());
        if (rc != HEARTBEAT_E_SUCCESS || !raw) {
            result.error = "failed to start heartbeat service (" + std::to_string(rc) + ")";
            return result;
        }
        HeartbeatPtr client(raw);

        std::shared_ptr<idevice_private> sharedDev(std::move(dev));
        std::shared_ptr<heartbeat_client_private> sharedClient(std::move(client));
        std::thread(keepAlive, device, sharedDev, sharedClient, result.handle).detach();

        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string("failed to spawn heartbeat loop: ") + e.what();
        return result;
    }
}

ProbeResult LockdownImageProbe::developerImageMounted(const DeviceId& device) noexcept {
    ProbeResult result;
    try {
        DevicePtr dev = openNetworkDevice(device, result.error);
        if (!dev) {
            return result;
        }

        mobile_image_mounter_client_t raw = nullptr;
        mobile_image_mounter_error_t rc = mobile_image_mounter_start_service(dev.get(), &raw, label_.c_str());
        if (rc != MOBILE_IMAGE_MOUNTER_E_SUCCESS || !raw) {
            result.error = "failed to connect to the image mounter (" + std::to_string(rc) + ")";
            return result;
        }
        MounterPtr mounter(raw);

        // iOS 17+ mounts a personalized image; older releases the classic one.
        result.mounted = imageSignaturePresent(mounter.get(), "Personalized") ||
                         imageSignaturePresent(mounter.get(), "Developer");
        result.ok = true;
        LOG_DEBUG("Developer image on " + device + (result.mounted ? " mounted" : " not mounted"));
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string("image probe failed: ") + e.what();
        return result;
    }
}

AppListing LockdownAppCatalog::debuggableApps(const DeviceId& device) noexcept {
    AppListing result;
    try {
        DevicePtr dev = openNetworkDevice(device, result.error);
        if (!dev) {
            return result;
        }

        instproxy_client_t raw = nullptr;
        instproxy_error_t rc = instproxy_client_start_service(dev.get(), &raw, label_.c_str());
        if (rc != INSTPROXY_E_SUCCESS || !raw) {
            result.error = "failed to connect to the installation proxy (" + std::to_string(rc) + ")";
            return result;
        }
        InstproxyPtr proxy(raw);

        PlistPtr options(instproxy_client_options_new());
        instproxy_client_options_add(static_cast<plist_t>(options.get()), "ApplicationType", "User", nullptr);
        instproxy_client_options_set_return_attributes(static_cast<plist_t>(options.get()), "CFBundleIdentifier",
                                                       "Entitlements", nullptr);

        plist_t apps = nullptr;
        rc = instproxy_browse(proxy.get(), static_cast<plist_t>(options.get()), &apps);
        PlistPtr owned(apps);
        if (rc != INSTPROXY_E_SUCCESS || !owned) {
            result.error = "installed app lookup failed (" + std::to_string(rc) + ")";
            return result;
        }

        result.bundleIds = debuggableBundleIds(static_cast<plist_t>(owned.get()));
        result.ok = true;
        LOG_DEBUG(device + ": " + std::to_string(result.bundleIds.size()) + " debuggable app(s)");
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string("app lookup failed: ") + e.what();
        return result;
    }
}

}
