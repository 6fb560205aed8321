/**
 * @file buffer.cpp
 * @brief Buffer allocation and release.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/buffer.h"

#include <sodium.h>

#include <new>
#include <stdexcept>
#include <utility>

namespace dualffi {

Buffer::Buffer(NativeType element, std::size_t count, std::size_t padding)
    : element_(std::move(element)),
      count_(count)
{
    const std::size_t element_size = element_.size();
    if (element_size == 0) {
        throw std::invalid_argument("Buffer: element type '" + element_.to_string() +
                                    "' has no size");
    }

    size_ = element_size * count_;
    capacity_ = size_ + padding;

    // Zero-length buffers still get an address so pointer() is never null.
    storage_ = new unsigned char[capacity_ == 0 ? 1 : capacity_]();
}

Buffer::~Buffer() {
    release();
}

Buffer::Buffer(Buffer&& other) noexcept
    : element_(std::move(other.element_)),
      count_(other.count_),
      size_(other.size_),
      capacity_(other.capacity_),
      storage_(other.storage_)
{
    other.count_ = 0;
    other.size_ = 0;
    other.capacity_ = 0;
    other.storage_ = nullptr;
}

Buffer& Buffer::operator=(Buffer&& other) noexcept {
    if (this != &other) {
        release();

        element_ = std::move(other.element_);
        count_ = other.count_;
        size_ = other.size_;
        capacity_ = other.capacity_;
        storage_ = other.storage_;

        other.count_ = 0;
        other.size_ = 0;
        other.capacity_ = 0;
        other.storage_ = nullptr;
    }
    return *this;
}

void Buffer::release() noexcept {
    if (storage_) {
        sodium_memzero(storage_, capacity_);
        delete[] storage_;
        storage_ = nullptr;
    }
}

}  // namespace dualffi
