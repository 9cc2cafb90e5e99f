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
 * @file fields.hpp
 * @brief Owned JSON field mapping carried by every action message.
 *
 * @details
 * Start and finish messages, success-field accumulators and serializer inputs are
 * all `Fields`: a JSON object backed by a cJSON tree. The wrapper owns the tree
 * (RAII), deep-copies on copy and transfers on move, so no caller ever pairs
 * `cJSON_Delete` by hand.
 */

#pragma once

#include <cJSON.h>
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace causal::core {

/**
 * @class Fields
 * @brief An owned JSON object with last-write-wins key semantics.
 */
class Fields {
  public:
    /// Creates an empty object.
    Fields();

    /**
     * @brief Adopts an existing cJSON object.
     *
     * @param root A `cJSON` object node; ownership transfers to the new instance.
     * @throws ValidationError if @p root is null or not an object (the node is
     * freed in that case).
     */
    explicit Fields(cJSON* root);

    ~Fields();

    Fields(const Fields& other);
    Fields& operator=(const Fields& other);
    Fields(Fields&& other) noexcept;
    Fields& operator=(Fields&& other) noexcept;

    /**
     * @brief Parses JSON text into a mapping.
     *
     * @throws ValidationError on malformed text or a non-object top level value.
     *
     * @code
     * auto fields = Fields::parse(R"({"user": "alice", "attempt": 2})");
     * @endcode
     */
    static Fields parse(const std::string& json);

    Fields& set(const std::string& key, const std::string& value);
    Fields& set(const std::string& key, const char* value);
    Fields& set(const std::string& key, bool value);
    Fields& set(const std::string& key, const Fields& nested);

    /// Any arithmetic type other than bool is stored as a JSON number.
    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Fields& set(const std::string& key, T value)
    {
        return set_number(key, static_cast<double>(value));
    }

    /// Sets @p key to JSON `null`.
    Fields& set_null(const std::string& key);

    bool contains(const std::string& key) const;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_number(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    /// Returns a deep copy of a nested object value, if @p key holds one.
    std::optional<Fields> get_object(const std::string& key) const;

    /// Removes @p key; a missing key is not an error.
    void erase(const std::string& key);

    /**
     * @brief Copies every key of @p other into this mapping.
     *
     * Keys present in both take the value from @p other.
     */
    void merge(const Fields& other);

    std::size_t size() const;
    bool empty() const;

    /// Keys in insertion order.
    std::vector<std::string> keys() const;

    /// Compact single-line JSON text.
    std::string to_json() const;

    /// Read access to the underlying tree for encoders built on cJSON.
    const cJSON* raw() const
    {
        return root_;
    }

  private:
    Fields& set_number(const std::string& key, double value);

    /// Inserts or replaces @p key, taking ownership of @p item.
    void put(const std::string& key, cJSON* item);

    cJSON* root_;
};

} // namespace causal::core
