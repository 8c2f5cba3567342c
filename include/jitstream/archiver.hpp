/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "jitstream/net.hpp"
#include "jitstream/plist.hpp"

namespace jitstream {

/*
 * NSKeyedArchiver encoding of plain plist trees, as the instruments services
 * expect them: dictionaries become NSDictionary, arrays NSArray, scalars and
 * strings are stored inline in $objects.
 */
[[nodiscard]] Bytes archive(plist_t root);
[[nodiscard]] Bytes archiveString(const std::string& value);

// Inverse of archive() for the shapes the device sends back. Unknown classes
// are returned as dictionaries with their UID references resolved. Returns
// an empty pointer for $null or on malformed input; ok tells them apart.
[[nodiscard]] PlistPtr unarchive(const Bytes& data, bool& ok);

// Depth-first search for a string value stored under key.
[[nodiscard]] std::optional<std::string> findStringValue(plist_t node, const char* key);

}
