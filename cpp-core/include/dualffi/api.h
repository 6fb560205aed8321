/**
 * @file api.h
 * @brief Free-function primitives bound to the process-wide engine.
 *
 * Binding modules use these instead of talking to an Engine directly,
 * so they never depend on which engine is active.
 *
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/buffer.h"
#include "dualffi/engine.h"
#include "dualffi/error.h"
#include "dualffi/library.h"
#include "dualffi/native_type.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace dualffi {

Buffer buffer_from_bytes(const Bytes& data);
Buffer buffer_from_unicode(std::wstring_view text);
Buffer buffer_pointer(const Buffer& buffer);

Bytes bytes_from_buffer(const Buffer& buffer,
                        std::optional<std::size_t> maxlen = std::nullopt);
Bytes bytes_from_buffer(const Pointer& pointer,
                        std::optional<std::size_t> maxlen = std::nullopt);

Bytes byte_string_from_buffer(const Buffer& buffer);
Buffer byte_array(const Bytes& byte_string);

Pointer null();
bool is_null(const Pointer& pointer);

/// Last error number recorded for the calling thread.
int get_errno();
void set_errno(int value);

Buffer new_value(const Library& library, std::string_view type_name,
                 const Value& init = Value());
Pointer cast(const Library& library, std::string_view type_name, const Pointer& pointer);
std::size_t size_of(const Library& library, std::string_view type_name);

Value deref(const Pointer& pointer);
Value unwrap(const Pointer& pointer);

Buffer make_struct(const Library& library, std::string_view name);
Bytes struct_bytes(const Pointer& struct_pointer);
Buffer struct_from_buffer(const Library& library, std::string_view name,
                          const Pointer& source);
Buffer struct_from_buffer(const Library& library, std::string_view name,
                          const Buffer& source);

std::vector<Value> array_from_pointer(const Library& library, std::string_view type_name,
                                      const Pointer& pointer, std::size_t size);

namespace detail {

template <typename T, typename Variant>
struct is_alternative;

template <typename T, typename... Ts>
struct is_alternative<T, std::variant<Ts...>>
    : std::integral_constant<bool, (std::is_same<T, Ts>::value || ...)> {};

template <typename T>
struct always_false : std::false_type {};

std::string text_from_value(const Value& value);
std::wstring wide_text_from_value(const Value& value);
Bytes bytes_from_value(const Value& value);

}  // namespace detail

/**
 * @brief Coerce a foreign value into the host type T.
 *
 * - std::string: text up to the first null (from a Pointer or Bytes).
 * - std::wstring: wide text up to the first null.
 * - Bytes: the value's bytes (a Pointer is read up to its terminator).
 * - arithmetic T: static_cast of the scalar payload.
 *
 * A value already holding T is returned unchanged.
 *
 * @throws std::invalid_argument if the value cannot be converted.
 */
template <typename T>
T native(const Value& value) {
    if constexpr (detail::is_alternative<T, Value>::value) {
        if (const T* same = std::get_if<T>(&value)) {
            return *same;
        }
    }

    if constexpr (std::is_same<T, std::string>::value) {
        return detail::text_from_value(value);
    } else if constexpr (std::is_same<T, std::wstring>::value) {
        return detail::wide_text_from_value(value);
    } else if constexpr (std::is_same<T, Bytes>::value) {
        return detail::bytes_from_value(value);
    } else if constexpr (std::is_arithmetic<T>::value) {
        return std::visit([](const auto& payload) -> T {
            using Payload = std::decay_t<decltype(payload)>;
            if constexpr (std::is_arithmetic<Payload>::value) {
                return static_cast<T>(payload);
            } else {
                throw std::invalid_argument("native: value has no scalar payload");
            }
        }, value);
    } else {
        static_assert(detail::always_false<T>::value, "native: unsupported host type");
    }
}

/**
 * @brief Coerce a whole buffer into the host type T.
 *
 * Bytes copies the full buffer; text stops at the first null; arithmetic
 * types read element 0.
 */
template <typename T>
T native(const Buffer& buffer) {
    if constexpr (std::is_same<T, Bytes>::value) {
        return bytes_from_buffer(buffer);
    } else if constexpr (std::is_same<T, std::string>::value) {
        const Bytes text = byte_string_from_buffer(buffer);
        return std::string(text.begin(), text.end());
    } else if constexpr (std::is_same<T, std::wstring>::value) {
        const auto* begin = static_cast<const wchar_t*>(buffer.data());
        if (!begin) return std::wstring();
        const std::size_t units = buffer.size() / sizeof(wchar_t);
        std::wstring text(begin, units);
        return text.substr(0, text.find(L'\0'));
    } else {
        return native<T>(deref(buffer.pointer()));
    }
}

}  // namespace dualffi
