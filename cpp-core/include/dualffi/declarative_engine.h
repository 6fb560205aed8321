/**
 * @file declarative_engine.h
 * @brief Engine backed by compiled type declarations.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/engine.h"

namespace dualffi {

/**
 * @brief Resolves type names against Declarations only.
 * 
 * Type text goes straight to the library's Declarations (then the
 * built-ins); nothing outside a declaration is visible. Byte buffers
 * hold exactly their payload. new_value() needs a pointer type or a
 * declared handle type.
 */
class DeclarativeEngine final : public Engine {
public:
    DeclarativeEngine() = default;

    EngineKind kind() const noexcept override { return EngineKind::Declarative; }

    NativeType resolve(const Library* library, std::string_view type_name) const override;

    Buffer buffer_from_bytes(const Bytes& data) const override;
    Buffer buffer_from_unicode(std::wstring_view text) const override;
    Buffer buffer_pointer(const Buffer& buffer) const override;
    Bytes bytes_from_buffer(const Buffer& buffer,
                            std::optional<std::size_t> maxlen) const override;
    Bytes bytes_from_pointer(const Pointer& pointer,
                             std::optional<std::size_t> maxlen) const override;
    Bytes byte_string_from_buffer(const Buffer& buffer) const override;
    Buffer byte_array(const Bytes& byte_string) const override;
    Pointer null() const override;
    bool is_null(const Pointer& pointer) const override;
    int get_errno() const override;
    void set_errno(int value) const override;

    Buffer new_value(const Library* library, std::string_view type_name,
                     const Value& init) const override;
    Pointer cast(const Library* library, std::string_view type_name,
                 const Pointer& pointer) const override;
    std::size_t size_of(const Library* library, std::string_view type_name) const override;
    Value deref(const Pointer& pointer) const override;
    Value unwrap(const Pointer& pointer) const override;

    Buffer make_struct(const Library& library, std::string_view name) const override;
    Bytes struct_bytes(const Pointer& struct_pointer) const override;
    Buffer struct_from_buffer(const Library& library, std::string_view name,
                              const Pointer& source) const override;
    std::vector<Value> array_from_pointer(const Library& library, std::string_view type_name,
                                          const Pointer& pointer,
                                          std::size_t size) const override;
};

}  // namespace dualffi
