/**
 * @file error.h
 * @brief Exception types raised by the dualffi core.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include <stdexcept>
#include <string>

namespace dualffi {

/**
 * @brief A named shared library does not exist on this system.
 * 
 * Raised by the loader and propagated unchanged through binding modules.
 */
class LibraryNotFoundError : public std::runtime_error {
public:
    explicit LibraryNotFoundError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Neither foreign-call engine could be instantiated.
 * 
 * Fatal at bootstrap; never retried.
 */
class FFIEngineError : public std::runtime_error {
public:
    explicit FFIEngineError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief A single engine candidate refused to start.
 * 
 * Only select_engine() catches this, to move on to the next candidate.
 */
class EngineUnavailable : public std::runtime_error {
public:
    explicit EngineUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief A type name matched neither the built-in table nor the library.
 */
class UnresolvedTypeError : public std::invalid_argument {
public:
    explicit UnresolvedTypeError(const std::string& type_name)
        : std::invalid_argument("unresolved native type '" + type_name + "'"),
          type_name_(type_name) {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

}  // namespace dualffi
