/**
 * @file test_support.h
 * @brief Native layouts and a library declaring them for both engines.
 */

#pragma once

#include "dualffi/library.h"

#include <ffi.h>

#include <cstdint>

namespace dualffi_test {

struct KeyLengths {
    uint32_t min_length;
    uint32_t max_length;
    uint32_t increment;
};

struct TaggedValue {
    uint8_t  tag;
    uint64_t value;
};

inline dualffi::Library make_test_library() {
    dualffi::Library library("testlib");

    auto& declarations = library.declarations();
    declarations.declare_struct<KeyLengths>("KEY_LENGTHS");
    declarations.declare_struct<TaggedValue>("TAGGED_VALUE");
    declarations.declare<void*>("HANDLE");

    auto& dynamic = library.dynamic_types();
    dynamic.define_struct("KEY_LENGTHS", {&ffi_type_uint32, &ffi_type_uint32, &ffi_type_uint32});
    dynamic.define_struct("TAGGED_VALUE", {&ffi_type_uint8, &ffi_type_uint64});
    dynamic.define("HANDLE", &ffi_type_pointer);

    return library;
}

}  // namespace dualffi_test
