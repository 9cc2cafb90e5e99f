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
 * @file id_generator.cpp
 * @brief RFC 4122 Version 4 task identifiers.
 */

#include "causal/infra/id_generator.hpp"

#include <cstdint>
#include <cstdio>
#include <random>

namespace causal::infra {

namespace {

bool is_lower_hex(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * Two 64-bit draws from a thread-local MT19937_64 seeded by `std::random_device`
 * supply the 128 bits; the version nibble is forced to `4` and the variant bits
 * to `10`.
 */
std::string IdGenerator::task_uuid()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>((hi & 0x0FFF) | 0x4000),
                  static_cast<unsigned>(((lo >> 48) & 0x3FFF) | 0x8000),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));

    return std::string(buffer);
}

bool IdGenerator::is_task_uuid(const std::string& id)
{
    if (id.size() != 36) {
        return false;
    }

    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-')
                return false;
        } else if (!is_lower_hex(id[i])) {
            return false;
        }
    }

    // Version nibble and RFC 4122 variant.
    if (id[14] != '4') {
        return false;
    }
    char variant = id[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace causal::infra
