/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/plist.hpp"

namespace jitstream {

PlistPtr parsePlist(const std::uint8_t* data, std::size_t size) noexcept {
    if (!data || size == 0) {
        return nullptr;
    }
    plist_t node = nullptr;
    plist_err_t rc = plist_from_memory(reinterpret_cast<const char*>(data),
                                       static_cast<uint32_t>(size), &node, nullptr);
    if (rc != PLIST_ERR_SUCCESS) {
        if (node) {
            plist_free(node);
        }
        return nullptr;
    }
    return adopt(node);
}

std::string toXml(plist_t node) {
    char* xml = nullptr;
    uint32_t length = 0;
    if (plist_to_xml(node, &xml, &length) != PLIST_ERR_SUCCESS || !xml) {
        return "";
    }
    std::string out(xml, length);
    plist_mem_free(xml);
    return out;
}

Bytes toBinary(plist_t node) {
    char* bin = nullptr;
    uint32_t length = 0;
    if (plist_to_bin(node, &bin, &length) != PLIST_ERR_SUCCESS || !bin) {
        return {};
    }
    Bytes out(reinterpret_cast<std::uint8_t*>(bin), reinterpret_cast<std::uint8_t*>(bin) + length);
    plist_mem_free(bin);
    return out;
}

std::optional<std::string> dictString(plist_t dict, const char* key) {
    if (!dict || plist_get_node_type(dict) != PLIST_DICT) {
        return std::nullopt;
    }
    plist_t item = plist_dict_get_item(dict, key);
    if (!item || plist_get_node_type(item) != PLIST_STRING) {
        return std::nullopt;
    }
    char* value = nullptr;
    plist_get_string_val(item, &value);
    if (!value) {
        return std::nullopt;
    }
    std::string out(value);
    plist_mem_free(value);
    return out;
}

std::optional<std::uint64_t> dictUint(plist_t dict, const char* key) noexcept {
    if (!dict || plist_get_node_type(dict) != PLIST_DICT) {
        return std::nullopt;
    }
    plist_t item = plist_dict_get_item(dict, key);
    if (!item || plist_get_node_type(item) != PLIST_UINT) {
        return std::nullopt;
    }
    uint64_t value = 0;
    plist_get_uint_val(item, &value);
    return value;
}

}
