/**
 * @file type_spec.h
 * @brief Parsed type descriptor: base name plus pointer arity.
 * 
 * A TypeSpec is computed once from a textual type such as
 * "unsigned char *" and then handed to an engine for resolution.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dualffi {

/**
 * @brief Base type name with 0, 1 or 2 levels of indirection.
 * 
 * When the innermost "T *" is itself a native pointer type (see
 * is_atomic_pointer_name()), it stays in `base` with `atomic` set and
 * does not count towards `indirection`.
 */
struct TypeSpec {
    std::string base;
    int         indirection = 0;
    bool        atomic = false;

    /**
     * @brief Parse a textual type.
     * 
     * Accepts "T", "T *", "T **" with any spacing around the stars.
     * 
     * @throws std::invalid_argument on an empty base, trailing text after
     *         the stars, or more than two levels of indirection.
     */
    static TypeSpec parse(std::string_view text);

    /// Canonical text, e.g. "char **".
    std::string to_string() const;
};

/**
 * @brief True for pointer types that are a single native type.
 * 
 * "void *", "char *" and "wchar_t *".
 */
bool is_atomic_pointer_name(std::string_view canonical) noexcept;

/**
 * @brief True for types whose array elements decode as C strings.
 * 
 * "char *", "unsigned char *", "wchar_t *"; on Windows also LPSTR,
 * LPCSTR, LPWSTR and LPCWSTR.
 */
bool is_string_pointer_type(std::string_view type_name);

/// True for the wide members of the string pointer set.
bool is_wide_string_type(std::string_view type_name);

const std::vector<std::string>& string_pointer_types();

}  // namespace dualffi
