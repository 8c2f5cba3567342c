/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/archiver.hpp"
#include <cstdlib>
#include <map>
#include <vector>

namespace jitstream {

namespace {
constexpr int kMaxDepth = 32;

class KeyedArchiver {
public:
    KeyedArchiver() {
        objects_.push_back(adopt(plist_new_string("$null")));
    }

    std::uint64_t add(plist_t node) {
        if (!node) {
            return 0;
        }
        switch (plist_get_node_type(node)) {
            case PLIST_DICT:
                return addDictionary(node);
            case PLIST_ARRAY:
                return addArray(node);
            default: {
                std::uint64_t uid = objects_.size();
                objects_.push_back(adopt(plist_copy(node)));
                return uid;
            }
        }
    }

    Bytes finish(std::uint64_t root) {
        PlistPtr top = adopt(plist_new_dict());
        plist_t topNode = static_cast<plist_t>(top.get());
        plist_dict_set_item(topNode, "$version", plist_new_uint(100000));
        plist_dict_set_item(topNode, "$archiver", plist_new_string("NSKeyedArchiver"));

        plist_t rootRef = plist_new_dict();
        plist_dict_set_item(rootRef, "root", plist_new_uid(root));
        plist_dict_set_item(topNode, "$top", rootRef);

        plist_t objects = plist_new_array();
        for (auto& object : objects_) {
            plist_array_append_item(objects, object.release());
        }
        objects_.clear();
        plist_dict_set_item(topNode, "$objects", objects);
        return toBinary(topNode);
    }

private:
    std::vector<PlistPtr> objects_;
    std::map<std::string, std::uint64_t> classes_;

    std::uint64_t reserve() {
        objects_.emplace_back();
        return objects_.size() - 1;
    }

    std::uint64_t classFor(const std::string& name) {
        auto it = classes_.find(name);
        if (it != classes_.end()) {
            return it->second;
        }
        plist_t cls = plist_new_dict();
        plist_dict_set_item(cls, "$classname", plist_new_string(name.c_str()));
        plist_t chain = plist_new_array();
        plist_array_append_item(chain, plist_new_string(name.c_str()));
        plist_array_append_item(chain, plist_new_string("NSObject"));
        plist_dict_set_item(cls, "$classes", chain);

        std::uint64_t uid = objects_.size();
        objects_.push_back(adopt(cls));
        classes_.emplace(name, uid);
        return uid;
    }

    std::uint64_t addDictionary(plist_t dict) {
        std::uint64_t uid = reserve();
        plist_t keys = plist_new_array();
        plist_t values = plist_new_array();

        plist_dict_iter iter = nullptr;
        plist_dict_new_iter(dict, &iter);
        while (iter) {
            char* key = nullptr;
            plist_t value = nullptr;
            plist_dict_next_item(dict, iter, &key, &value);
            if (!value) {
                std::free(key);
                break;
            }
            PlistPtr keyNode = adopt(plist_new_string(key));
            std::free(key);
            plist_array_append_item(keys, plist_new_uid(add(static_cast<plist_t>(keyNode.get()))));
            plist_array_append_item(values, plist_new_uid(add(value)));
        }
        std::free(iter);

        plist_t object = plist_new_dict();
        plist_dict_set_item(object, "NS.keys", keys);
        plist_dict_set_item(object, "NS.objects", values);
        plist_dict_set_item(object, "$class", plist_new_uid(classFor("NSDictionary")));
        objects_[uid] = adopt(object);
        return uid;
    }

    std::uint64_t addArray(plist_t array) {
        std::uint64_t uid = reserve();
        plist_t values = plist_new_array();
        uint32_t count = plist_array_get_size(array);
        for (uint32_t i = 0; i < count; ++i) {
            plist_array_append_item(values, plist_new_uid(add(plist_array_get_item(array, i))));
        }

        plist_t object = plist_new_dict();
        plist_dict_set_item(object, "NS.objects", values);
        plist_dict_set_item(object, "$class", plist_new_uid(classFor("NSArray")));
        objects_[uid] = adopt(object);
        return uid;
    }
};

class KeyedUnarchiver {
public:
    explicit KeyedUnarchiver(plist_t objects) : objects_(objects) {}

    // Empty result with ok=true means $null.
    PlistPtr resolve(std::uint64_t uid, int depth, bool& ok) {
        if (depth > kMaxDepth || uid >= plist_array_get_size(objects_)) {
            ok = false;
            return nullptr;
        }
        plist_t object = plist_array_get_item(objects_, static_cast<uint32_t>(uid));
        plist_type type = plist_get_node_type(object);

        if (type == PLIST_STRING && uid == 0) {
            return nullptr;
        }
        if (type == PLIST_UID) {
            uint64_t next = 0;
            plist_get_uid_val(object, &next);
            return resolve(next, depth + 1, ok);
        }
        if (type != PLIST_DICT) {
            return adopt(plist_copy(object));
        }

        plist_t keys = plist_dict_get_item(object, "NS.keys");
        plist_t values = plist_dict_get_item(object, "NS.objects");
        if (keys && values) {
            return resolveDictionary(keys, values, depth, ok);
        }
        if (values) {
            return resolveArray(values, depth, ok);
        }
        if (plist_t text = plist_dict_get_item(object, "NS.string")) {
            return adopt(plist_copy(text));
        }
        if (plist_t time = plist_dict_get_item(object, "NS.time")) {
            return adopt(plist_copy(time));
        }
        return resolveObject(object, depth, ok);
    }

private:
    plist_t objects_;

    PlistPtr resolveRef(plist_t ref, int depth, bool& ok) {
        if (plist_get_node_type(ref) != PLIST_UID) {
            return adopt(plist_copy(ref));
        }
        uint64_t uid = 0;
        plist_get_uid_val(ref, &uid);
        return resolve(uid, depth + 1, ok);
    }

    PlistPtr resolveDictionary(plist_t keys, plist_t values, int depth, bool& ok) {
        PlistPtr out = adopt(plist_new_dict());
        uint32_t count = plist_array_get_size(keys);
        if (plist_array_get_size(values) != count) {
            ok = false;
            return nullptr;
        }
        for (uint32_t i = 0; i < count && ok; ++i) {
            PlistPtr key = resolveRef(plist_array_get_item(keys, i), depth, ok);
            PlistPtr value = resolveRef(plist_array_get_item(values, i), depth, ok);
            if (!ok || !key || plist_get_node_type(static_cast<plist_t>(key.get())) != PLIST_STRING) {
                continue;
            }
            auto name = dictStringOf(static_cast<plist_t>(key.get()));
            plist_dict_set_item(static_cast<plist_t>(out.get()), name.c_str(),
                                value ? static_cast<plist_t>(value.release()) : plist_new_string("$null"));
        }
        if (!ok) {
            return nullptr;
        }
        return out;
    }

    PlistPtr resolveArray(plist_t values, int depth, bool& ok) {
        PlistPtr out = adopt(plist_new_array());
        uint32_t count = plist_array_get_size(values);
        for (uint32_t i = 0; i < count && ok; ++i) {
            PlistPtr value = resolveRef(plist_array_get_item(values, i), depth, ok);
            if (value) {
                plist_array_append_item(static_cast<plist_t>(out.get()), static_cast<plist_t>(value.release()));
            }
        }
        if (!ok) {
            return nullptr;
        }
        return out;
    }

    // NSError and friends: keep the fields, follow the references.
    PlistPtr resolveObject(plist_t object, int depth, bool& ok) {
        PlistPtr out = adopt(plist_new_dict());
        plist_dict_iter iter = nullptr;
        plist_dict_new_iter(object, &iter);
        while (iter && ok) {
            char* key = nullptr;
            plist_t value = nullptr;
            plist_dict_next_item(object, iter, &key, &value);
            if (!value) {
                std::free(key);
                break;
            }
            std::string name(key);
            std::free(key);
            if (name == "$class") {
                continue;
            }
            PlistPtr resolved = resolveRef(value, depth, ok);
            if (resolved) {
                plist_dict_set_item(static_cast<plist_t>(out.get()), name.c_str(),
                                    static_cast<plist_t>(resolved.release()));
            }
        }
        std::free(iter);
        if (!ok) {
            return nullptr;
        }
        return out;
    }

    static std::string dictStringOf(plist_t node) {
        char* value = nullptr;
        plist_get_string_val(node, &value);
        std::string out = value ? value : "";
        std::free(value);
        return out;
    }
};
}

Bytes archive(plist_t root) {
    KeyedArchiver archiver;
    std::uint64_t uid = archiver.add(root);
    return archiver.finish(uid);
}

Bytes archiveString(const std::string& value) {
    PlistPtr node = adopt(plist_new_string(value.c_str()));
    return archive(static_cast<plist_t>(node.get()));
}

PlistPtr unarchive(const Bytes& data, bool& ok) {
    ok = false;
    PlistPtr root = parsePlist(data);
    if (!root) {
        return nullptr;
    }
    plist_t top = plist_dict_get_item(static_cast<plist_t>(root.get()), "$top");
    plist_t objects = plist_dict_get_item(static_cast<plist_t>(root.get()), "$objects");
    if (!top || !objects || plist_get_node_type(objects) != PLIST_ARRAY) {
        return nullptr;
    }
    plist_t rootRef = plist_dict_get_item(top, "root");
    if (!rootRef || plist_get_node_type(rootRef) != PLIST_UID) {
        return nullptr;
    }
    uint64_t uid = 0;
    plist_get_uid_val(rootRef, &uid);

    ok = true;
    KeyedUnarchiver unarchiver(objects);
    PlistPtr value = unarchiver.resolve(uid, 0, ok);
    if (!ok) {
        return nullptr;
    }
    return value;
}

std::optional<std::string> findStringValue(plist_t node, const char* key) {
    if (!node) {
        return std::nullopt;
    }
    if (plist_get_node_type(node) == PLIST_DICT) {
        if (auto direct = dictString(node, key)) {
            return direct;
        }
        plist_dict_iter iter = nullptr;
        plist_dict_new_iter(node, &iter);
        std::optional<std::string> found;
        while (iter && !found) {
            char* name = nullptr;
            plist_t value = nullptr;
            plist_dict_next_item(node, iter, &name, &value);
            std::free(name);
            if (!value) {
                break;
            }
            found = findStringValue(value, key);
        }
        std::free(iter);
        return found;
    }
    if (plist_get_node_type(node) == PLIST_ARRAY) {
        uint32_t count = plist_array_get_size(node);
        for (uint32_t i = 0; i < count; ++i) {
            if (auto found = findStringValue(plist_array_get_item(node, i), key)) {
                return found;
            }
        }
    }
    return std::nullopt;
}

}
