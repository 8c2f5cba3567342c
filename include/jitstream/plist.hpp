/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <plist/plist.h>

#include "jitstream/net.hpp"

namespace jitstream {

struct PlistDeleter {
    void operator()(void* node) const noexcept { plist_free(static_cast<plist_t>(node)); }
};

// Owning libplist node. get() yields a plist_t.
using PlistPtr = std::unique_ptr<void, PlistDeleter>;

[[nodiscard]] inline PlistPtr adopt(plist_t node) noexcept { return PlistPtr(node); }

// Parses XML or binary; empty on failure.
[[nodiscard]] PlistPtr parsePlist(const std::uint8_t* data, std::size_t size) noexcept;
[[nodiscard]] inline PlistPtr parsePlist(const Bytes& data) noexcept { return parsePlist(data.data(), data.size()); }

[[nodiscard]] std::string toXml(plist_t node);
[[nodiscard]] Bytes toBinary(plist_t node);

[[nodiscard]] std::optional<std::string> dictString(plist_t dict, const char* key);
[[nodiscard]] std::optional<std::uint64_t> dictUint(plist_t dict, const char* key) noexcept;

}
