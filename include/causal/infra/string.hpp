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
 * @file string.hpp
 * @brief Text primitives used when turning failures into message fields.
 *
 * @details
 * A failed action reports the type and the text of the exception that ended it.
 * Both pass through this class: compiler type names are demangled and free-form
 * text is coerced into valid UTF-8 so the JSON encoder never sees broken input.
 */

#pragma once

#include <string>

namespace causal::infra {

/**
 * @class String
 * @brief A static container for lossy-safe text conversions.
 */
class String {
  public:
    /**
     * @brief Converts an ABI type name (`typeid(x).name()`) to its source spelling.
     *
     * Returns @p mangled unchanged if the runtime cannot demangle it.
     *
     * @code
     * String::demangle(typeid(std::invalid_argument).name()); // "std::invalid_argument"
     * @endcode
     */
    static std::string demangle(const char* mangled);

    /**
     * @brief Returns @p raw with every byte that is not part of a well-formed
     * UTF-8 sequence replaced by `?`.
     *
     * Overlong encodings, surrogates and code points above U+10FFFF count as
     * malformed. Valid input is returned byte-for-byte.
     */
    static std::string to_safe_utf8(const std::string& raw);
};

} // namespace causal::infra
