/**
 * @file native_type.cpp
 * @brief Scalar load/store shared by both engines.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/native_type.h"

#include <cstring>
#include <stdexcept>

namespace dualffi {

namespace {

template <typename T>
T read_as(const void* address) {
    T out;
    std::memcpy(&out, address, sizeof(T));
    return out;
}

template <typename T>
void write_as(void* address, T value) {
    std::memcpy(address, &value, sizeof(T));
}

template <typename T>
T scalar_payload(const Value& value, const NativeType& type) {
    if (const auto* v = std::get_if<std::int64_t>(&value)) return static_cast<T>(*v);
    if (const auto* v = std::get_if<std::uint64_t>(&value)) return static_cast<T>(*v);
    if (const auto* v = std::get_if<double>(&value)) return static_cast<T>(*v);
    throw std::invalid_argument("store_value: '" + type.to_string() + "' needs a scalar value");
}

void* pointer_payload(const Value& value, const NativeType& type) {
    if (std::holds_alternative<std::monostate>(value)) return nullptr;
    if (const auto* p = std::get_if<Pointer>(&value)) return p->address();
    throw std::invalid_argument("store_value: '" + type.to_string() + "' needs a pointer value");
}

}  // namespace

const char* to_string(ScalarKind kind) noexcept {
    switch (kind) {
        case ScalarKind::Void:    return "void";
        case ScalarKind::Int8:    return "int8";
        case ScalarKind::UInt8:   return "uint8";
        case ScalarKind::Int16:   return "int16";
        case ScalarKind::UInt16:  return "uint16";
        case ScalarKind::Int32:   return "int32";
        case ScalarKind::UInt32:  return "uint32";
        case ScalarKind::Int64:   return "int64";
        case ScalarKind::UInt64:  return "uint64";
        case ScalarKind::Float:   return "float";
        case ScalarKind::Double:  return "double";
        case ScalarKind::Pointer: return "pointer";
        case ScalarKind::Struct:  return "struct";
    }
    return "unknown";
}

NativeType NativeType::pointee() const {
    if (indirection == 0) {
        throw std::invalid_argument("'" + to_string() + "' is not a pointer type");
    }
    NativeType out = *this;
    --out.indirection;
    if (out.indirection == 0) out.atomic_pointer = false;
    return out;
}

NativeType NativeType::pointer_to() const {
    NativeType out = *this;
    ++out.indirection;
    return out;
}

std::string NativeType::to_string() const {
    std::string out = base.name;
    if (indirection > 0) {
        if (out.empty() || out.back() != '*') out += ' ';
        out.append(static_cast<std::size_t>(indirection), '*');
    }
    return out;
}

NativeType void_type() {
    return NativeType{type_info_of<void>("void"), 0, false};
}

Pointer Pointer::at(std::size_t index) const {
    auto* base = static_cast<unsigned char*>(address_);
    return Pointer(base + index * target_.size(), target_);
}

Value load_value(const NativeType& type, const void* address) {
    if (!address) {
        throw std::invalid_argument("load_value: null address for '" + type.to_string() + "'");
    }
    if (type.indirection > 0) {
        return Pointer(read_as<void*>(address), type.pointee());
    }

    switch (type.base.kind) {
        case ScalarKind::Int8:    return static_cast<std::int64_t>(read_as<std::int8_t>(address));
        case ScalarKind::UInt8:   return static_cast<std::uint64_t>(read_as<std::uint8_t>(address));
        case ScalarKind::Int16:   return static_cast<std::int64_t>(read_as<std::int16_t>(address));
        case ScalarKind::UInt16:  return static_cast<std::uint64_t>(read_as<std::uint16_t>(address));
        case ScalarKind::Int32:   return static_cast<std::int64_t>(read_as<std::int32_t>(address));
        case ScalarKind::UInt32:  return static_cast<std::uint64_t>(read_as<std::uint32_t>(address));
        case ScalarKind::Int64:   return read_as<std::int64_t>(address);
        case ScalarKind::UInt64:  return read_as<std::uint64_t>(address);
        case ScalarKind::Float:   return static_cast<double>(read_as<float>(address));
        case ScalarKind::Double:  return read_as<double>(address);
        case ScalarKind::Pointer: return Pointer(read_as<void*>(address), void_type());
        case ScalarKind::Struct: {
            const auto* bytes = static_cast<const std::uint8_t*>(address);
            return Bytes(bytes, bytes + type.base.size);
        }
        case ScalarKind::Void:
            break;
    }
    throw std::invalid_argument("load_value: cannot read a value of type '" + type.to_string() + "'");
}

void store_value(const NativeType& type, void* address, const Value& value) {
    if (!address) {
        throw std::invalid_argument("store_value: null address for '" + type.to_string() + "'");
    }
    if (type.indirection > 0) {
        write_as<void*>(address, pointer_payload(value, type));
        return;
    }

    switch (type.base.kind) {
        case ScalarKind::Int8:   write_as(address, scalar_payload<std::int8_t>(value, type)); return;
        case ScalarKind::UInt8:  write_as(address, scalar_payload<std::uint8_t>(value, type)); return;
        case ScalarKind::Int16:  write_as(address, scalar_payload<std::int16_t>(value, type)); return;
        case ScalarKind::UInt16: write_as(address, scalar_payload<std::uint16_t>(value, type)); return;
        case ScalarKind::Int32:  write_as(address, scalar_payload<std::int32_t>(value, type)); return;
        case ScalarKind::UInt32: write_as(address, scalar_payload<std::uint32_t>(value, type)); return;
        case ScalarKind::Int64:  write_as(address, scalar_payload<std::int64_t>(value, type)); return;
        case ScalarKind::UInt64: write_as(address, scalar_payload<std::uint64_t>(value, type)); return;
        case ScalarKind::Float:  write_as(address, scalar_payload<float>(value, type)); return;
        case ScalarKind::Double: write_as(address, scalar_payload<double>(value, type)); return;
        case ScalarKind::Pointer:
            write_as<void*>(address, pointer_payload(value, type));
            return;
        case ScalarKind::Struct: {
            const auto* bytes = std::get_if<Bytes>(&value);
            if (!bytes || bytes->size() > type.base.size) {
                throw std::invalid_argument("store_value: struct '" + type.base.name +
                                            "' needs at most " + std::to_string(type.base.size) +
                                            " bytes");
            }
            std::memcpy(address, bytes->data(), bytes->size());
            return;
        }
        case ScalarKind::Void:
            break;
    }
    throw std::invalid_argument("store_value: cannot write a value of type '" + type.to_string() + "'");
}

}  // namespace dualffi
