/**
 * @file library.cpp
 * @brief Library handles, compiled declarations and libffi type tables.
 *
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/library.h"
#include "dualffi/error.h"
#include "dualffi/type_spec.h"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <dlfcn.h>
#endif

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

namespace dualffi {

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

void Declarations::add(const std::string& name, NativeType type) {
    entries_[TypeSpec::parse(name).to_string()] = std::move(type);
}

void Declarations::declare_alias(const std::string& name, std::string_view target) {
    auto type = lookup(target);
    if (!type) {
        throw UnresolvedTypeError(std::string(target));
    }
    add(name, *type);
}

const NativeType* Declarations::find_exact(const std::string& name) const {
    auto it = entries_.find(name);
    if (it != entries_.end()) return &it->second;

    // builtins() must not consult itself while it is being built.
    if (builtin_fallback_) {
        const Declarations& base = builtins();
        auto builtin = base.entries_.find(name);
        if (builtin != base.entries_.end()) return &builtin->second;
    }
    return nullptr;
}

std::optional<NativeType> Declarations::lookup(std::string_view type_name) const {
    const std::string name = TypeSpec::parse(type_name).to_string();

    if (const NativeType* exact = find_exact(name)) {
        return *exact;
    }

    // "T *" is a pointer over whatever "T" is declared as.
    if (name.back() == '*') {
        std::string inner = name.substr(0, name.size() - 1);
        while (!inner.empty() && inner.back() == ' ') inner.pop_back();
        if (auto pointee = lookup(inner)) {
            return pointee->pointer_to();
        }
        return std::nullopt;
    }

    constexpr std::string_view kStructPrefix = "struct ";
    if (name.compare(0, kStructPrefix.size(), kStructPrefix) == 0) {
        return lookup(std::string_view(name).substr(kStructPrefix.size()));
    }
    return std::nullopt;
}

const Declarations& Declarations::builtins() {
    static const Declarations table = [] {
        Declarations d;
        d.builtin_fallback_ = false;
        d.declare<void>("void");
        d.declare<char>("char");
        d.declare<signed char>("signed char");
        d.declare<unsigned char>("unsigned char");
        d.declare<short>("short");
        d.declare<unsigned short>("unsigned short");
        d.declare<int>("int");
        d.declare<unsigned int>("unsigned int");
        d.declare<long>("long");
        d.declare<unsigned long>("unsigned long");
        d.declare<long long>("long long");
        d.declare<unsigned long long>("unsigned long long");
        d.declare<float>("float");
        d.declare<double>("double");
        d.declare<wchar_t>("wchar_t");
        d.declare<std::size_t>("size_t");
        d.declare<std::make_signed<std::size_t>::type>("ssize_t");
        d.declare<std::intptr_t>("intptr_t");
        d.declare<std::uintptr_t>("uintptr_t");
        d.declare<std::int8_t>("int8_t");
        d.declare<std::uint8_t>("uint8_t");
        d.declare<std::int16_t>("int16_t");
        d.declare<std::uint16_t>("uint16_t");
        d.declare<std::int32_t>("int32_t");
        d.declare<std::uint32_t>("uint32_t");
        d.declare<std::int64_t>("int64_t");
        d.declare<std::uint64_t>("uint64_t");

        d.declare_alias("signed", "int");
        d.declare_alias("signed int", "int");
        d.declare_alias("unsigned", "unsigned int");
        d.declare_alias("short int", "short");
        d.declare_alias("unsigned short int", "unsigned short");
        d.declare_alias("long int", "long");
        d.declare_alias("unsigned long int", "unsigned long");
        d.declare_alias("long long int", "long long");
        d.declare_alias("unsigned long long int", "unsigned long long");
#ifdef _WIN32
        d.declare<unsigned char>("BYTE");
        d.declare<unsigned long>("ULONG");
        d.declare<unsigned long>("DWORD");
        d.declare_alias("LPSTR", "char *");
        d.declare_alias("LPCSTR", "char *");
        d.declare_alias("LPWSTR", "wchar_t *");
        d.declare_alias("LPCWSTR", "wchar_t *");
#endif
        return d;
    }();
    return table;
}

// ---------------------------------------------------------------------------
// DynamicTypes
// ---------------------------------------------------------------------------

struct DynamicTypes::StructLayout {
    ffi_type                 type{};
    std::vector<ffi_type*>   elements;  // null-terminated for libffi
    std::vector<std::size_t> offsets;
};

DynamicTypes::DynamicTypes() = default;
DynamicTypes::~DynamicTypes() = default;
DynamicTypes::DynamicTypes(DynamicTypes&&) noexcept = default;
DynamicTypes& DynamicTypes::operator=(DynamicTypes&&) noexcept = default;

void DynamicTypes::define(const std::string& name, ffi_type* type) {
    if (!type) {
        throw std::invalid_argument("DynamicTypes: null ffi_type for '" + name + "'");
    }
    entries_[name] = type;
}

ffi_type* DynamicTypes::define_struct(const std::string& name,
                                      const std::vector<ffi_type*>& fields) {
    if (fields.empty()) {
        throw std::invalid_argument("DynamicTypes: struct '" + name + "' has no fields");
    }

    auto layout = std::make_unique<StructLayout>();
    layout->elements.reserve(fields.size() + 1);
    for (ffi_type* field : fields) {
        if (!field) {
            throw std::invalid_argument("DynamicTypes: null field type in struct '" + name + "'");
        }
        layout->elements.push_back(field);
    }
    layout->elements.push_back(nullptr);
    layout->offsets.resize(fields.size());

    layout->type.size = 0;
    layout->type.alignment = 0;
    layout->type.type = FFI_TYPE_STRUCT;
    layout->type.elements = layout->elements.data();

    // Fills in size and alignment as a side effect.
    if (ffi_get_struct_offsets(FFI_DEFAULT_ABI, &layout->type, layout->offsets.data()) != FFI_OK) {
        throw std::invalid_argument("DynamicTypes: libffi rejected layout of struct '" + name + "'");
    }

    ffi_type* type = &layout->type;
    structs_.push_back(std::move(layout));
    entries_[name] = type;
    entries_["struct " + name] = type;
    return type;
}

std::vector<std::size_t> DynamicTypes::field_offsets(std::string_view name) const {
    ffi_type* type = find(name);
    for (const auto& layout : structs_) {
        if (&layout->type == type) return layout->offsets;
    }
    throw std::invalid_argument("DynamicTypes: '" + std::string(name) + "' is not a defined struct");
}

ffi_type* DynamicTypes::find(std::string_view name) const {
    auto it = entries_.find(std::string(name));
    return it == entries_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// Library
// ---------------------------------------------------------------------------

Library::Library(std::string name, void* handle)
    : name_(std::move(name)),
      handle_(handle, [](void*) {}) {}

Library::Library(std::shared_ptr<void> handle, std::string name)
    : name_(std::move(name)), handle_(std::move(handle)) {}

#ifdef _WIN32

Library Library::open(const std::string& path) {
    HMODULE module = ::LoadLibraryA(path.c_str());
    if (!module) {
        throw LibraryNotFoundError("unable to load library '" + path + "': error " +
                                   std::to_string(::GetLastError()));
    }
    return Library(std::shared_ptr<void>(module, [](void* h) {
                       ::FreeLibrary(static_cast<HMODULE>(h));
                   }),
                   path);
}

void* Library::symbol(const std::string& symbol_name) const {
    if (!handle_) return nullptr;
    FARPROC address = ::GetProcAddress(static_cast<HMODULE>(handle_.get()), symbol_name.c_str());
    return reinterpret_cast<void*>(address);
}

#else

Library Library::open(const std::string& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* reason = dlerror();
        throw LibraryNotFoundError("unable to load library '" + path + "'" +
                                   (reason ? std::string(": ") + reason : std::string()));
    }
    return Library(std::shared_ptr<void>(handle, [](void* h) { dlclose(h); }), path);
}

void* Library::symbol(const std::string& symbol_name) const {
    if (!handle_) return nullptr;
    return dlsym(handle_.get(), symbol_name.c_str());
}

#endif

void register_declarations(Library& library, Declarations declarations) {
    library.declarations() = std::move(declarations);
}

}  // namespace dualffi
