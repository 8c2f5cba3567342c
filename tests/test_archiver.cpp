/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <cstdlib>

#include "jitstream/archiver.hpp"

using namespace jitstream;

namespace {
std::string stringOf(plist_t node) {
    char* text = nullptr;
    plist_get_string_val(node, &text);
    std::string out = text ? text : "";
    std::free(text);
    return out;
}

plist_t classEntry(const char* name) {
    plist_t cls = plist_new_dict();
    plist_dict_set_item(cls, "$classname", plist_new_string(name));
    plist_t chain = plist_new_array();
    plist_array_append_item(chain, plist_new_string(name));
    plist_array_append_item(chain, plist_new_string("NSObject"));
    plist_dict_set_item(cls, "$classes", chain);
    return cls;
}
}

TEST(KeyedArchiver, StringSurvivesArchiving) {
    bool ok = false;
    PlistPtr value = unarchive(archiveString("launchSuspendedProcessWithDevicePath:"), ok);
    ASSERT_TRUE(ok);
    ASSERT_TRUE(value);
    ASSERT_EQ(plist_get_node_type(static_cast<plist_t>(value.get())), PLIST_STRING);
    EXPECT_EQ(stringOf(static_cast<plist_t>(value.get())), "launchSuspendedProcessWithDevicePath:");
}

TEST(KeyedArchiver, ArchiveUsesNSKeyedArchiverLayout) {
    PlistPtr options = adopt(plist_new_dict());
    plist_dict_set_item(static_cast<plist_t>(options.get()), "StartSuspendedKey", plist_new_bool(1));

    Bytes archived = archive(static_cast<plist_t>(options.get()));
    PlistPtr root = parsePlist(archived);
    ASSERT_TRUE(root);
    plist_t top = static_cast<plist_t>(root.get());
    EXPECT_EQ(dictString(top, "$archiver").value_or(""), "NSKeyedArchiver");
    EXPECT_EQ(dictUint(top, "$version").value_or(0), 100000u);

    plist_t objects = plist_dict_get_item(top, "$objects");
    ASSERT_NE(objects, nullptr);
    ASSERT_GT(plist_array_get_size(objects), 0u);
    EXPECT_EQ(stringOf(plist_array_get_item(objects, 0)), "$null");
}

TEST(KeyedArchiver, NestedContainersUnarchive) {
    PlistPtr tree = adopt(plist_new_dict());
    plist_t dict = static_cast<plist_t>(tree.get());
    plist_dict_set_item(dict, "pid", plist_new_uint(812));
    plist_t args = plist_new_array();
    plist_array_append_item(args, plist_new_string("-v"));
    plist_dict_set_item(dict, "args", args);

    bool ok = false;
    PlistPtr value = unarchive(archive(dict), ok);
    ASSERT_TRUE(ok);
    plist_t out = static_cast<plist_t>(value.get());
    ASSERT_EQ(plist_get_node_type(out), PLIST_DICT);
    EXPECT_EQ(dictUint(out, "pid").value_or(0), 812u);
    plist_t outArgs = plist_dict_get_item(out, "args");
    ASSERT_NE(outArgs, nullptr);
    ASSERT_EQ(plist_array_get_size(outArgs), 1u);
    EXPECT_EQ(stringOf(plist_array_get_item(outArgs, 0)), "-v");
}

TEST(KeyedArchiver, ErrorDescriptionIsFoundInsideNSError) {
    // NSError { NSDomain, NSCode, NSUserInfo = { NSLocalizedDescription } }
    PlistPtr top = adopt(plist_new_dict());
    plist_t root = static_cast<plist_t>(top.get());
    plist_dict_set_item(root, "$archiver", plist_new_string("NSKeyedArchiver"));
    plist_dict_set_item(root, "$version", plist_new_uint(100000));
    plist_t ref = plist_new_dict();
    plist_dict_set_item(ref, "root", plist_new_uid(1));
    plist_dict_set_item(root, "$top", ref);

    plist_t objects = plist_new_array();
    plist_array_append_item(objects, plist_new_string("$null"));
    plist_t error = plist_new_dict();
    plist_dict_set_item(error, "NSDomain", plist_new_uid(2));
    plist_dict_set_item(error, "NSCode", plist_new_uint(1));
    plist_dict_set_item(error, "NSUserInfo", plist_new_uid(3));
    plist_dict_set_item(error, "$class", plist_new_uid(6));
    plist_array_append_item(objects, error);
    plist_array_append_item(objects, plist_new_string("DTXMessage"));
    plist_t info = plist_new_dict();
    plist_t keys = plist_new_array();
    plist_array_append_item(keys, plist_new_uid(4));
    plist_t values = plist_new_array();
    plist_array_append_item(values, plist_new_uid(5));
    plist_dict_set_item(info, "NS.keys", keys);
    plist_dict_set_item(info, "NS.objects", values);
    plist_dict_set_item(info, "$class", plist_new_uid(7));
    plist_array_append_item(objects, info);
    plist_array_append_item(objects, plist_new_string("NSLocalizedDescription"));
    plist_array_append_item(objects, plist_new_string("The application is not installed"));
    plist_array_append_item(objects, classEntry("NSError"));
    plist_array_append_item(objects, classEntry("NSDictionary"));
    plist_dict_set_item(root, "$objects", objects);

    bool ok = false;
    PlistPtr value = unarchive(toBinary(root), ok);
    ASSERT_TRUE(ok);
    ASSERT_TRUE(value);
    EXPECT_EQ(plist_get_node_type(static_cast<plist_t>(value.get())), PLIST_DICT);
    EXPECT_EQ(findStringValue(static_cast<plist_t>(value.get()), "NSLocalizedDescription").value_or(""),
              "The application is not installed");
}

TEST(KeyedArchiver, GarbageIsRejected) {
    bool ok = true;
    PlistPtr value = unarchive(Bytes{'n', 'o', 'p', 'e'}, ok);
    EXPECT_FALSE(ok);
    EXPECT_FALSE(value);
}
