/**
 * @file native_type.h
 * @brief Resolved native type descriptors, pointers and decoded values.
 *
 * Both engines resolve a type name into a NativeType: a base TypeInfo
 * (scalar, opaque handle or struct) plus an indirection count. Foreign
 * memory is addressed through Pointer, and anything read back out of it
 * is returned as a Value.
 *
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace dualffi {

/// Immutable byte sequence copied out of foreign memory.
using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Primitive encoding of a base type.
 */
enum class ScalarKind : std::uint8_t {
    Void,
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float,
    Double,
    Pointer,  ///< Opaque handle (void*-sized, no known pointee)
    Struct,
};

const char* to_string(ScalarKind kind) noexcept;

/**
 * @brief Layout of a base (non-indirected) type.
 */
struct TypeInfo {
    std::string name;
    ScalarKind  kind = ScalarKind::Void;
    std::size_t size = 0;
    std::size_t alignment = 1;
};

/**
 * @brief Compile-time mapping from a C++ type to its ScalarKind.
 */
template <typename T>
constexpr ScalarKind scalar_kind_of() {
    if constexpr (std::is_void<T>::value) {
        return ScalarKind::Void;
    } else if constexpr (std::is_pointer<T>::value) {
        return ScalarKind::Pointer;
    } else if constexpr (std::is_floating_point<T>::value) {
        static_assert(sizeof(T) == 4 || sizeof(T) == 8, "unsupported floating point width");
        return sizeof(T) == 4 ? ScalarKind::Float : ScalarKind::Double;
    } else if constexpr (std::is_integral<T>::value || std::is_enum<T>::value) {
        constexpr bool is_signed = std::is_signed<T>::value;
        switch (sizeof(T)) {
            case 1: return is_signed ? ScalarKind::Int8 : ScalarKind::UInt8;
            case 2: return is_signed ? ScalarKind::Int16 : ScalarKind::UInt16;
            case 4: return is_signed ? ScalarKind::Int32 : ScalarKind::UInt32;
            default: return is_signed ? ScalarKind::Int64 : ScalarKind::UInt64;
        }
    } else {
        static_assert(std::is_class<T>::value, "unsupported native type");
        return ScalarKind::Struct;
    }
}

template <typename T>
TypeInfo type_info_of(std::string name) {
    if constexpr (std::is_void<T>::value) {
        return TypeInfo{std::move(name), ScalarKind::Void, 0, 1};
    } else {
        return TypeInfo{std::move(name), scalar_kind_of<T>(), sizeof(T), alignof(T)};
    }
}

/**
 * @brief A base type reached through 0, 1 or 2 pointer hops.
 *
 * atomic_pointer marks types such as "char *" that an engine treats as
 * a single native type rather than as an indirection over "char".
 */
struct NativeType {
    TypeInfo base;
    int      indirection = 0;
    bool     atomic_pointer = false;

    bool is_pointer() const noexcept { return indirection > 0; }

    /// Size of one element of this type.
    std::size_t size() const noexcept {
        return indirection > 0 ? sizeof(void*) : base.size;
    }

    std::size_t alignment() const noexcept {
        return indirection > 0 ? alignof(void*) : base.alignment;
    }

    /// Type one hop down. @throws std::invalid_argument if not a pointer.
    NativeType pointee() const;

    NativeType pointer_to() const;

    std::string to_string() const;
};

/// NativeType of `void` with no indirection.
NativeType void_type();

/**
 * @brief Non-owning address of foreign memory plus the type stored there.
 *
 * Null when address() is nullptr. Lifetime of the memory is the caller's
 * responsibility.
 */
class Pointer {
public:
    Pointer() : target_(void_type()) {}

    Pointer(void* address, NativeType target)
        : address_(address), target_(std::move(target)) {}

    void* address() const noexcept { return address_; }

    /// Type of the value stored at address().
    const NativeType& target() const noexcept { return target_; }

    explicit operator bool() const noexcept { return address_ != nullptr; }

    /**
     * @brief Pointer to element `index` of an array of target().
     */
    Pointer at(std::size_t index) const;

    bool operator==(const Pointer& other) const noexcept {
        return address_ == other.address_;
    }
    bool operator!=(const Pointer& other) const noexcept {
        return address_ != other.address_;
    }

private:
    void*      address_ = nullptr;
    NativeType target_;
};

/**
 * @brief A value read out of foreign memory.
 *
 * monostate stands for a null string element; signed and unsigned
 * integers keep their signedness; structs are copied out as Bytes.
 */
using Value = std::variant<
    std::monostate,
    std::int64_t,
    std::uint64_t,
    double,
    Pointer,
    Bytes,
    std::wstring>;

/**
 * @brief Decode the value of `type` stored at `address`.
 *
 * Pointer types yield a Pointer one hop down; structs yield their bytes.
 * @throws std::invalid_argument for void.
 */
Value load_value(const NativeType& type, const void* address);

/**
 * @brief Encode `value` as `type` at `address`.
 *
 * @throws std::invalid_argument if the value cannot represent the type.
 */
void store_value(const NativeType& type, void* address, const Value& value);

}  // namespace dualffi
