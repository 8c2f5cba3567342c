/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "jitstream/lockdown.hpp"
#include "jitstream/plist.hpp"

using namespace jitstream;

namespace {
plist_t app(const char* bundle, plist_t entitlements) {
    plist_t dict = plist_new_dict();
    plist_dict_set_item(dict, "CFBundleIdentifier", plist_new_string(bundle));
    if (entitlements) {
        plist_dict_set_item(dict, "Entitlements", entitlements);
    }
    return dict;
}

plist_t entitlements(plist_t taskAllow) {
    plist_t dict = plist_new_dict();
    plist_dict_set_item(dict, "application-identifier", plist_new_string("TEAM.com.example"));
    if (taskAllow) {
        plist_dict_set_item(dict, "get-task-allow", taskAllow);
    }
    return dict;
}
}

TEST(AppCatalog, OnlyGetTaskAllowTrueIsDebuggable) {
    PlistPtr apps = adopt(plist_new_array());
    plist_t list = static_cast<plist_t>(apps.get());
    plist_array_append_item(list, app("com.example.dev", entitlements(plist_new_bool(1))));
    plist_array_append_item(list, app("com.example.store", entitlements(plist_new_bool(0))));
    plist_array_append_item(list, app("com.example.plain", entitlements(nullptr)));
    plist_array_append_item(list, app("com.example.bare", nullptr));
    plist_array_append_item(list, app("com.example.stringly", entitlements(plist_new_string("true"))));
    plist_array_append_item(list, app("com.example.second", entitlements(plist_new_bool(1))));

    EXPECT_EQ(debuggableBundleIds(list), (std::vector<std::string>{"com.example.dev", "com.example.second"}));
}

TEST(AppCatalog, EntriesWithoutBundleIdAreSkipped) {
    PlistPtr apps = adopt(plist_new_array());
    plist_t list = static_cast<plist_t>(apps.get());
    plist_t nameless = plist_new_dict();
    plist_dict_set_item(nameless, "Entitlements", entitlements(plist_new_bool(1)));
    plist_array_append_item(list, nameless);
    plist_array_append_item(list, plist_new_string("not a dict"));

    EXPECT_TRUE(debuggableBundleIds(list).empty());
}

TEST(AppCatalog, NonArrayBrowseResultYieldsNothing) {
    EXPECT_TRUE(debuggableBundleIds(nullptr).empty());
    PlistPtr dict = adopt(plist_new_dict());
    EXPECT_TRUE(debuggableBundleIds(static_cast<plist_t>(dict.get())).empty());
}

TEST(AppCatalog, UnknownDeviceIsReportedNotThrown) {
    LockdownAppCatalog catalog("jitstream-test");
    AppListing listing = catalog.debuggableApps("0000-NOT-A-DEVICE");
    EXPECT_FALSE(listing);
    EXPECT_FALSE(listing.error.empty());
}
