#pragma once
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::utils {
//---------------------------------------------------------------------------
/// Minimal growable buffer for raw data, used for stream accumulation
template <typename T>
class DataVector {
    private:
    /// Current capacity
    uint64_t _capacity;
    /// Current size
    uint64_t _size;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    constexpr DataVector() : _capacity(0), _size(0) {}

    /// Constructor with size
    explicit DataVector(uint64_t size) : _capacity(0), _size(0) {
        resize(size);
    }

    /// Constructor from other pointers
    DataVector(const T* start, const T* end) : _capacity(0), _size(0) {
        assert(end - start >= 0);
        resize(static_cast<uint64_t>(end - start));
        if (_size)
            std::memcpy(data(), start, _size * sizeof(T));
    }

    /// Get the data
    [[nodiscard]] constexpr T* data() {
        return _data.get();
    }

    /// Get the data
    [[nodiscard]] constexpr const T* cdata() const {
        return _data.get();
    }

    /// Get the size
    [[nodiscard]] constexpr uint64_t size() const {
        return _size;
    }

    /// Get the capacity
    [[nodiscard]] constexpr uint64_t capacity() const {
        return _capacity;
    }

    /// Is the vector empty
    [[nodiscard]] constexpr bool empty() const {
        return !_size;
    }

    /// Clear the size
    constexpr void clear() {
        _size = 0;
    }

    /// Increase the capacity
    void reserve(uint64_t cap) {
        if (_capacity < cap) {
            auto swap = std::unique_ptr<T[]>(new T[cap]());
            if (_data && _size)
                std::memcpy(swap.get(), data(), _size * sizeof(T));
            _data.swap(swap);
            _capacity = cap;
        }
    }

    /// Change the number of elements
    void resize(uint64_t size) {
        if (size > _capacity) {
            reserve(size);
        }
        _size = size;
    }

    /// Append elements, grows geometrically
    void append(const T* start, uint64_t count) {
        if (!count)
            return;
        if (_size + count > _capacity)
            reserve(std::max(_size + count, _capacity << 1));
        std::memcpy(data() + _size, start, count * sizeof(T));
        _size += count;
    }

    /// Drop the first count elements and move the remainder to the front
    void consume(uint64_t count) {
        if (count > _size)
            throw std::runtime_error("Cannot consume more elements than stored!");
        if (count < _size)
            std::memmove(data(), data() + count, (_size - count) * sizeof(T));
        _size -= count;
    }
};
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
