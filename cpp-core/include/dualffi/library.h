/**
 * @file library.h
 * @brief Library handle and the per-library type tables of both engines.
 *
 * A Library wraps a native module handle supplied by the loader. Binding
 * modules attach their type declarations to it:
 * - Declarations: types whose layout the C++ compiler computed, consumed
 *   by the declarative engine.
 * - DynamicTypes: libffi type descriptors assembled at runtime, consumed
 *   by the dynamic engine when a name is not in its built-in table.
 *
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/native_type.h"

#include <ffi.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace dualffi {

/**
 * @brief Compiled type table of the declarative engine.
 *
 * Lookup accepts "T", "struct T" and pointer forms "T *" / "T **"
 * built over any declared name. Entries not found here are looked up in
 * builtins().
 */
class Declarations {
public:
    Declarations() = default;

    /// Declare a scalar or handle type under `name`.
    template <typename T>
    void declare(const std::string& name) {
        add(name, NativeType{type_info_of<T>(name), 0, false});
    }

    /**
     * @brief Declare struct `T` under `name` and "struct name".
     */
    template <typename T>
    void declare_struct(const std::string& name) {
        static_assert(std::is_class<T>::value, "declare_struct needs a struct type");
        static_assert(std::is_trivially_copyable<T>::value,
                      "declared structs are copied with memcpy");
        NativeType type{type_info_of<T>(name), 0, false};
        add(name, type);
        add("struct " + name, type);
    }

    /**
     * @brief Declare `name` as another spelling of `target`.
     *
     * `target` may be any type this table can look up, e.g. "char *".
     *
     * @throws UnresolvedTypeError if `target` is unknown.
     */
    void declare_alias(const std::string& name, std::string_view target);

    /**
     * @brief Look up a textual type.
     *
     * @return Resolved type, or std::nullopt if neither this table nor
     *         builtins() declares it.
     */
    std::optional<NativeType> lookup(std::string_view type_name) const;

    std::size_t size() const noexcept { return entries_.size(); }

    /// C scalar names, their long spellings and fixed-width integer names.
    static const Declarations& builtins();

private:
    void add(const std::string& name, NativeType type);
    const NativeType* find_exact(const std::string& name) const;

    std::unordered_map<std::string, NativeType> entries_;
    bool builtin_fallback_ = true;  // false for builtins() itself
};

/**
 * @brief Runtime type table of the dynamic engine.
 *
 * Struct layouts are computed by libffi from the field types.
 */
class DynamicTypes {
public:
    DynamicTypes();
    ~DynamicTypes();

    DynamicTypes(DynamicTypes&&) noexcept;
    DynamicTypes& operator=(DynamicTypes&&) noexcept;
    DynamicTypes(const DynamicTypes&) = delete;
    DynamicTypes& operator=(const DynamicTypes&) = delete;

    /**
     * @brief Declare `name` as a primitive libffi type.
     *
     * Use &ffi_type_pointer for opaque handles.
     */
    void define(const std::string& name, ffi_type* type);

    /**
     * @brief Declare a struct from its field types, in declaration order.
     *
     * Also registered as "struct name".
     *
     * @return The struct's ffi_type, usable as a field of another struct.
     * @throws std::invalid_argument if `fields` is empty or libffi
     *         rejects the layout.
     */
    ffi_type* define_struct(const std::string& name, const std::vector<ffi_type*>& fields);

    /// Field offsets of a struct defined with define_struct().
    std::vector<std::size_t> field_offsets(std::string_view name) const;

    ffi_type* find(std::string_view name) const;

private:
    struct StructLayout;

    std::unordered_map<std::string, ffi_type*> entries_;
    std::vector<std::unique_ptr<StructLayout>> structs_;
};

/**
 * @brief Handle to a loaded native module plus its declared types.
 *
 * A handle adopted through the constructor is never closed here; one
 * obtained from open() is closed with the Library. Move-only.
 */
class Library {
public:
    /**
     * @brief Adopt a handle obtained by an external loader.
     *
     * @param name Library name used in diagnostics.
     * @param handle dlopen() / LoadLibrary() handle, or nullptr for a pure
     *        type table.
     */
    explicit Library(std::string name, void* handle = nullptr);

    /**
     * @brief Load `path` with dlopen(), or LoadLibraryA() on Windows.
     *
     * @throws LibraryNotFoundError if the library cannot be loaded.
     */
    static Library open(const std::string& path);

    const std::string& name() const noexcept { return name_; }
    void* handle() const noexcept { return handle_.get(); }

    /// Address of an exported symbol, or nullptr when absent.
    void* symbol(const std::string& symbol_name) const;

    Declarations& declarations() noexcept { return declarations_; }
    const Declarations& declarations() const noexcept { return declarations_; }

    DynamicTypes& dynamic_types() noexcept { return dynamic_types_; }
    const DynamicTypes& dynamic_types() const noexcept { return dynamic_types_; }

private:
    Library(std::shared_ptr<void> handle, std::string name);

    std::string           name_;
    std::shared_ptr<void> handle_;
    Declarations          declarations_;
    DynamicTypes          dynamic_types_;
};

/**
 * @brief Replace the declarative type table attached to `library`.
 */
void register_declarations(Library& library, Declarations declarations);

}  // namespace dualffi
