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
 * @file string.cpp
 * @brief Implementation of demangling and UTF-8 sanitization.
 *
 * @details
 * The UTF-8 scan is a single forward pass. At each position the lead byte
 * determines the expected sequence length and the legal range of the first
 * continuation byte (RFC 3629, Table 3-7 of the Unicode standard); a sequence
 * that fails any check contributes exactly one `?` and the scan resumes at the
 * following byte.
 */

#include "causal/infra/string.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace causal::infra {

std::string String::demangle(const char* mangled)
{
    if (mangled == nullptr) {
        return "";
    }

    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);

    if (status != 0 || !demangled) {
        return mangled;
    }
    return std::string(demangled.get());
}

std::string String::to_safe_utf8(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());

    const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());
    const size_t size = raw.size();
    size_t i = 0;

    while (i < size) {
        unsigned char lead = bytes[i];

        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        size_t length = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead == 0xE0) {
            length = 3;
            lo = 0xA0;
        } else if (lead >= 0xE1 && lead <= 0xEC) {
            length = 3;
        } else if (lead == 0xED) {
            // Excludes UTF-16 surrogates.
            length = 3;
            hi = 0x9F;
        } else if (lead >= 0xEE && lead <= 0xEF) {
            length = 3;
        } else if (lead == 0xF0) {
            length = 4;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            length = 4;
        } else if (lead == 0xF4) {
            length = 4;
            hi = 0x8F;
        }

        bool valid = length != 0 && i + length <= size;
        if (valid) {
            valid = bytes[i + 1] >= lo && bytes[i + 1] <= hi;
            for (size_t k = 2; valid && k < length; ++k) {
                valid = bytes[i + k] >= 0x80 && bytes[i + k] <= 0xBF;
            }
        }

        if (valid) {
            out.append(raw, i, length);
            i += length;
        } else {
            out.push_back('?');
            ++i;
        }
    }

    return out;
}

} // namespace causal::infra
