/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file fields.cpp
 * @brief cJSON-backed implementation of `Fields`.
 *
 * @details
 * Every cJSON constructor can return `NULL` on allocation failure; those paths
 * throw `std::bad_alloc` so the tree is never left holding a dangling child.
 * Key lookups are case-sensitive throughout.
 */

#include "causal/core/fields.hpp"

#include "causal/core/errors.hpp"

#include <new>
#include <utility>

namespace causal::core {

namespace {

cJSON* checked(cJSON* node)
{
    if (node == nullptr) {
        throw std::bad_alloc();
    }
    return node;
}

} // namespace

Fields::Fields() : root_(checked(cJSON_CreateObject())) {}

Fields::Fields(cJSON* root) : root_(root)
{
    if (!cJSON_IsObject(root_)) {
        cJSON_Delete(root_);
        root_ = nullptr;
        throw ValidationError("field mapping must be a JSON object");
    }
}

Fields::~Fields()
{
    cJSON_Delete(root_);
}

Fields::Fields(const Fields& other) : root_(checked(cJSON_Duplicate(other.root_, 1))) {}

Fields& Fields::operator=(const Fields& other)
{
    if (this != &other) {
        cJSON* copy = checked(cJSON_Duplicate(other.root_, 1));
        cJSON_Delete(root_);
        root_ = copy;
    }
    return *this;
}

// A moved-from instance holds an empty object, never a null root.
Fields::Fields(Fields&& other) noexcept : root_(other.root_)
{
    other.root_ = cJSON_CreateObject();
}

Fields& Fields::operator=(Fields&& other) noexcept
{
    if (this != &other) {
        std::swap(root_, other.root_);
    }
    return *this;
}

Fields Fields::parse(const std::string& json)
{
    cJSON* parsed = cJSON_Parse(json.c_str());
    if (parsed == nullptr) {
        throw ValidationError("malformed JSON field mapping");
    }
    return Fields(parsed);
}

Fields& Fields::set(const std::string& key, const std::string& value)
{
    put(key, checked(cJSON_CreateString(value.c_str())));
    return *this;
}

Fields& Fields::set(const std::string& key, const char* value)
{
    if (value == nullptr) {
        return set_null(key);
    }
    put(key, checked(cJSON_CreateString(value)));
    return *this;
}

Fields& Fields::set(const std::string& key, bool value)
{
    put(key, checked(cJSON_CreateBool(value ? 1 : 0)));
    return *this;
}

Fields& Fields::set(const std::string& key, const Fields& nested)
{
    put(key, checked(cJSON_Duplicate(nested.root_, 1)));
    return *this;
}

Fields& Fields::set_null(const std::string& key)
{
    put(key, checked(cJSON_CreateNull()));
    return *this;
}

Fields& Fields::set_number(const std::string& key, double value)
{
    put(key, checked(cJSON_CreateNumber(value)));
    return *this;
}

void Fields::put(const std::string& key, cJSON* item)
{
    if (root_ == nullptr) {
        cJSON_Delete(item);
        throw std::bad_alloc();
    }

    cJSON_bool attached = 0;
    if (cJSON_GetObjectItemCaseSensitive(root_, key.c_str()) != nullptr) {
        attached = cJSON_ReplaceItemInObjectCaseSensitive(root_, key.c_str(), item);
    } else {
        attached = cJSON_AddItemToObject(root_, key.c_str(), item);
    }

    // Both calls fail only when copying the key string fails.
    if (!attached) {
        cJSON_Delete(item);
        throw std::bad_alloc();
    }
}

bool Fields::contains(const std::string& key) const
{
    return cJSON_GetObjectItemCaseSensitive(root_, key.c_str()) != nullptr;
}

std::optional<std::string> Fields::get_string(const std::string& key) const
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root_, key.c_str());
    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        return std::string(item->valuestring);
    }
    return std::nullopt;
}

std::optional<double> Fields::get_number(const std::string& key) const
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root_, key.c_str());
    if (cJSON_IsNumber(item)) {
        return item->valuedouble;
    }
    return std::nullopt;
}

std::optional<bool> Fields::get_bool(const std::string& key) const
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root_, key.c_str());
    if (cJSON_IsBool(item)) {
        return cJSON_IsTrue(item) != 0;
    }
    return std::nullopt;
}

std::optional<Fields> Fields::get_object(const std::string& key) const
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root_, key.c_str());
    if (!cJSON_IsObject(item)) {
        return std::nullopt;
    }
    return Fields(checked(cJSON_Duplicate(item, 1)));
}

void Fields::erase(const std::string& key)
{
    cJSON_DeleteItemFromObjectCaseSensitive(root_, key.c_str());
}

void Fields::merge(const Fields& other)
{
    if (this == &other) {
        return;
    }

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, other.root_)
    {
        put(item->string, checked(cJSON_Duplicate(item, 1)));
    }
}

std::size_t Fields::size() const
{
    return static_cast<std::size_t>(cJSON_GetArraySize(root_));
}

bool Fields::empty() const
{
    return size() == 0;
}

std::vector<std::string> Fields::keys() const
{
    std::vector<std::string> out;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root_)
    {
        out.emplace_back(item->string);
    }
    return out;
}

std::string Fields::to_json() const
{
    char* raw_output = cJSON_PrintUnformatted(root_);
    if (raw_output == nullptr) {
        throw std::bad_alloc();
    }
    std::string json(raw_output);
    cJSON_free(raw_output);
    return json;
}

} // namespace causal::core
