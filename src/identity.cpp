/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/identity.hpp"
#include "jitstream/database.hpp"
#include "jitstream/logger.hpp"
#include "jitstream/plist.hpp"
#include <arpa/inet.h>
#include <fstream>
#include <iterator>
#include <sqlite3.h>

namespace jitstream {

std::string normalizeAddress(const std::string& address) {
    in_addr v4{};
    if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
        return "::ffff:" + address;
    }
    return address;
}

bool loadPairingRecord(const std::filesystem::path& dir, const DeviceId& device,
                       PairingRecord& out, std::string& error) noexcept {
    try {
        auto path = dir / (device + ".plist");
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            error = "no pairing record at " + path.string();
            return false;
        }
        Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        PlistPtr root = parsePlist(data);
        if (!root || plist_get_node_type(static_cast<plist_t>(root.get())) != PLIST_DICT) {
            error = "pairing record " + path.string() + " is not a plist dictionary";
            return false;
        }
        auto hostId = dictString(static_cast<plist_t>(root.get()), "HostID");
        auto buid = dictString(static_cast<plist_t>(root.get()), "SystemBUID");
        if (!hostId || !buid) {
            error = "pairing record " + path.string() + " lacks HostID or SystemBUID";
            return false;
        }
        out.hostId = *hostId;
        out.data = std::move(data);
        return true;
    } catch (const std::exception& e) {
        error = std::string("pairing record unreadable: ") + e.what();
        return false;
    }
}

Identity DeviceRegistry::resolve(const std::string& sourceAddress) noexcept {
    Identity identity;
    try {
        std::string error;
        auto db = Database::open(database_, busyTimeout_, error);
        if (!db) {
            identity.failure = Failure::backend(Stage::Identity, error);
            return identity;
        }

        std::string address = normalizeAddress(sourceAddress);
        int rc = SQLITE_OK;
        auto lookup = db->prepare("SELECT udid FROM devices WHERE ip = ?1", rc);
        if (!lookup) {
            identity.failure = Failure::backend(Stage::Identity, "prepare: " + db->errorMessage());
            return identity;
        }
        lookup->bind(1, address);
        rc = lookup->step();
        if (rc == SQLITE_DONE) {
            identity.failure = {FailureKind::NotRegistered, Stage::Identity,
                                "no device registered for " + address};
            return identity;
        }
        if (rc != SQLITE_ROW) {
            identity.failure = Failure::backend(Stage::Identity, "lookup: " + db->errorMessage());
            return identity;
        }
        identity.deviceId = lookup->columnText(0);

        if (!loadPairingRecord(pairingDir_, identity.deviceId, identity.pairing, error)) {
            identity.failure = {FailureKind::Credential, Stage::Identity, error};
            return identity;
        }
        identity.ok = true;
        return identity;
    } catch (const std::exception& e) {
        identity.ok = false;
        identity.failure = Failure::backend(Stage::Identity, e.what());
        return identity;
    }
}

void DeviceRegistry::touch(const DeviceId& device) noexcept {
    try {
        std::string error;
        auto db = Database::open(database_, busyTimeout_, error);
        if (!db) {
            LOG_WARN("Could not record last use of " + device + ": " + error);
            return;
        }
        int rc = SQLITE_OK;
        auto update = db->prepare("UPDATE devices SET last_used = CURRENT_TIMESTAMP WHERE udid = ?1", rc);
        if (!update) {
            LOG_WARN("Could not record last use of " + device + ": " + db->errorMessage());
            return;
        }
        update->bind(1, device);
        if (update->step() != SQLITE_DONE) {
            LOG_WARN("Could not record last use of " + device + ": " + db->errorMessage());
        }
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Could not record last use: ") + e.what());
    }
}

bool DeviceRegistry::registerDevice(const DeviceId& device, const std::string& address,
                                    std::string& error) noexcept {
    try {
        auto db = Database::open(database_, busyTimeout_, error);
        if (!db) {
            return false;
        }
        int rc = SQLITE_OK;
        auto insert = db->prepare(
            "INSERT OR REPLACE INTO devices (udid, ip, last_used) VALUES (?1, ?2, CURRENT_TIMESTAMP)", rc);
        if (!insert) {
            error = "prepare: " + db->errorMessage();
            return false;
        }
        insert->bind(1, device);
        insert->bind(2, normalizeAddress(address));
        if (insert->step() != SQLITE_DONE) {
            error = "register: " + db->errorMessage();
            return false;
        }
        LOG_INFO("Registered " + device + " at " + normalizeAddress(address));
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

}
