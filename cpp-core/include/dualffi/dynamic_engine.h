/**
 * @file dynamic_engine.h
 * @brief Engine that resolves types through libffi at call time.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/engine.h"

#include <ffi.h>

#include <string>
#include <unordered_map>

namespace dualffi {

/**
 * @brief Resolves type names through a fixed libffi table, then the
 *        library's DynamicTypes.
 * 
 * "void *", "char *" and "wchar_t *" are single native types here, so
 * new_value("char *") allocates a pointer slot rather than a char.
 * Byte buffers carry a null terminator past their payload.
 */
class DynamicEngine final : public Engine {
public:
    /**
     * @brief Probe libffi and build the base type table.
     * 
     * @throws EngineUnavailable if libffi cannot prepare a call interface.
     */
    DynamicEngine();

    EngineKind kind() const noexcept override { return EngineKind::Dynamic; }

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

    /**
     * @brief Describe a libffi type as a TypeInfo named `name`.
     * 
     * @throws std::invalid_argument for types with no ScalarKind
     *         (long double, complex).
     */
    static TypeInfo type_info_from_ffi(const std::string& name, const ffi_type& type);

private:
    NativeType resolve_base(const Library* library, const std::string& name) const;

    void add_scalar(const std::string& name, ffi_type* type);
    void add_atomic_pointer(const std::string& name, const std::string& pointee);

    std::unordered_map<std::string, NativeType> base_types_;
};

}  // namespace dualffi
