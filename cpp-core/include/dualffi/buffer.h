/**
 * @file buffer.h
 * @brief Owned, zero-initialised block of foreign memory.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/native_type.h"

#include <cstddef>

namespace dualffi {

/**
 * @brief Fixed-length array of `count` elements of one NativeType.
 * 
 * Every buffer, struct instance and boxed value handed out by an engine
 * is a Buffer. Storage is zeroed on allocation and wiped before release.
 * `padding` reserves zero bytes past size(), e.g. a null terminator that
 * is not part of the payload.
 * 
 * Pointers obtained from pointer() do not keep the Buffer alive.
 */
class Buffer {
public:
    Buffer() : element_(void_type()) {}

    /**
     * @throws std::invalid_argument if `element` has no size.
     */
    Buffer(NativeType element, std::size_t count, std::size_t padding = 0);

    ~Buffer();

    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    // Copy would alias foreign memory that native code may hold on to
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    void* data() noexcept { return storage_; }
    const void* data() const noexcept { return storage_; }

    /// Payload size in bytes, excluding padding.
    std::size_t size() const noexcept { return size_; }

    /// Allocated bytes, including padding.
    std::size_t capacity() const noexcept { return capacity_; }

    std::size_t count() const noexcept { return count_; }
    bool empty() const noexcept { return storage_ == nullptr; }

    const NativeType& element() const noexcept { return element_; }

    /// Pointer to element 0.
    Pointer pointer() const { return Pointer(storage_, element_); }

private:
    void release() noexcept;

    NativeType     element_;
    std::size_t    count_ = 0;
    std::size_t    size_ = 0;
    std::size_t    capacity_ = 0;
    unsigned char* storage_ = nullptr;
};

}  // namespace dualffi
