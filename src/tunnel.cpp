/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/tunnel.hpp"
#include "jitstream/logger.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace jitstream {

namespace {
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t totalSize = size * nmemb;
    userp->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

// tunneld has reported ports both as numbers and as strings.
std::uint16_t portOf(const json& value) {
    if (value.is_number_unsigned() || value.is_number_integer()) {
        auto port = value.get<long long>();
        return (port > 0 && port <= 65535) ? static_cast<std::uint16_t>(port) : 0;
    }
    if (value.is_string()) {
        try {
            long port = std::stol(value.get<std::string>());
            return (port > 0 && port <= 65535) ? static_cast<std::uint16_t>(port) : 0;
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}
}

bool parseTunneldListing(const std::string& body, std::vector<TunnelDescriptor>& out, std::string& error) {
    json listing;
    try {
        listing = json::parse(body);
    } catch (const json::parse_error& e) {
        error = std::string("tunneld returned invalid JSON: ") + e.what();
        return false;
    }
    if (!listing.is_object()) {
        error = "unexpected tunneld response format";
        return false;
    }

    for (auto it = listing.begin(); it != listing.end(); ++it) {
        if (!it.value().is_array()) {
            continue;
        }
        for (const auto& entry : it.value()) {
            if (!entry.is_object()) {
                continue;
            }
            auto address = entry.find("tunnel-address");
            auto port = entry.find("tunnel-port");
            if (address == entry.end() || !address->is_string() || port == entry.end()) {
                continue;
            }

            TunnelDescriptor tunnel;
            tunnel.deviceId = it.key();
            tunnel.address = address->get<std::string>();
            tunnel.port = portOf(*port);
            auto iface = entry.find("interface");
            if (iface != entry.end() && iface->is_string()) {
                tunnel.interface = iface->get<std::string>();
            }
            if (tunnel.port == 0 || tunnel.address.empty()) {
                continue;
            }
            out.push_back(std::move(tunnel));
        }
    }
    return true;
}

TunneldDirectory::TunneldDirectory(std::string url) : url_(std::move(url)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

TunneldDirectory::~TunneldDirectory() {
    curl_global_cleanup();
}

bool TunneldDirectory::list(std::vector<TunnelDescriptor>& out, std::string& error) noexcept {
    try {
        CURL* curl = curl_easy_init();
        if (!curl) {
            error = "Failed to initialize CURL";
            return false;
        }

        std::string body;
        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            error = "Unable to reach tunneld: " + std::string(curl_easy_strerror(res));
            return false;
        }
        if (status != 200) {
            error = "tunneld answered HTTP " + std::to_string(status);
            return false;
        }
        return parseTunneldListing(body, out, error);
    } catch (const std::exception& e) {
        error = std::string("tunneld query failed: ") + e.what();
        return false;
    }
}

std::optional<TunnelDescriptor> TunneldDirectory::lookup(const DeviceId& device) noexcept {
    std::vector<TunnelDescriptor> tunnels;
    std::string error;
    if (!list(tunnels, error)) {
        LOG_WARN(error);
        return std::nullopt;
    }
    for (auto& tunnel : tunnels) {
        if (tunnel.deviceId == device) {
            return tunnel;
        }
    }
    return std::nullopt;
}

std::optional<TunnelDescriptor> waitForTunnel(TunnelDirectory& directory, const DeviceId& device,
                                              int attempts, std::chrono::milliseconds interval,
                                              const Sleeper& sleep) {
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto tunnel = directory.lookup(device);
        if (tunnel) {
            LOG_DEBUG("Tunnel for " + device + " found on attempt " + std::to_string(attempt) +
                      ": [" + tunnel->address + "]:" + std::to_string(tunnel->port));
            return tunnel;
        }
        if (attempt < attempts) {
            if (sleep) {
                sleep(interval);
            } else {
                std::this_thread::sleep_for(interval);
            }
        }
    }
    LOG_WARN("No tunnel for " + device + " after " + std::to_string(attempts) + " attempts");
    return std::nullopt;
}

}
