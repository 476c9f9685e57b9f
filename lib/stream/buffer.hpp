// SPDX-License-Identifier: MIT

// lib/stream/buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/memory_pool.hpp"

namespace streamkit {

class Buffer;

/// Zero-copy slice of `buffer`.
///
/// Fails with OutOfRange if `offset` is negative. An offset past the end
/// yields an empty slice at the end. `length` defaults to the remaining bytes;
/// a negative length clamps to zero and an overflowing one clamps to the
/// remaining bytes.
Result<std::shared_ptr<Buffer>> SliceBuffer(const std::shared_ptr<Buffer>& buffer,
                                            int64_t offset,
                                            std::optional<int64_t> length = std::nullopt);

/// Contiguous region of bytes, owned or borrowed.
///
/// Buffers are always handled through std::shared_ptr. A slice references its
/// parent's memory without copying and holds the parent alive, so a slice can
/// never outlive the bytes it points at. Mutability is fixed at construction:
/// an immutable buffer never hands out a mutable pointer, and slices inherit
/// their parent's mutability.
///
/// Thread safety: reading from a buffer is safe from any thread. Mutation is
/// the exclusive owner's business and must happen before slices are shared.
class Buffer {
public:
    /// Non-owning immutable view. The caller keeps `data` alive.
    Buffer(const std::byte* data, int64_t size)
        : data_(data), size_(size) {}

    /// Non-owning view over mutable memory.
    Buffer(std::byte* data, int64_t size, bool is_mutable)
        : data_(data), mutable_data_(is_mutable ? data : nullptr),
          size_(size), is_mutable_(is_mutable) {}

    virtual ~Buffer() = default;

    // Non-copyable, non-movable (identity matters for parent references)
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) = delete;
    Buffer& operator=(Buffer&&) = delete;

    /// Take ownership of a string's bytes.
    static std::shared_ptr<Buffer> FromString(std::string data);

    /// Take ownership of a byte vector.
    static std::shared_ptr<Buffer> FromVector(std::vector<std::byte> data);

    /// Wrap foreign memory. `owner` is pinned for the buffer's whole lifetime
    /// and released when the last reference (including slices) goes away.
    static std::shared_ptr<Buffer> Wrap(uintptr_t address, int64_t size,
                                        std::shared_ptr<void> owner,
                                        bool is_mutable = false);

    int64_t Size() const noexcept { return size_; }
    bool Empty() const noexcept { return size_ == 0; }
    bool IsMutable() const noexcept { return is_mutable_; }

    /// Address of the first byte.
    uintptr_t Address() const noexcept { return reinterpret_cast<uintptr_t>(data_); }

    const std::byte* Data() const noexcept { return data_; }

    std::span<const std::byte> Span() const noexcept {
        return {data_, static_cast<size_t>(size_)};
    }

    /// Writable pointer; fails with CapabilityViolation on immutable buffers.
    Result<std::byte*> MutableData();

    /// Writable span; fails with CapabilityViolation on immutable buffers.
    Result<std::span<std::byte>> MutableSpan();

    /// Buffer this one was sliced from, or nullptr.
    const std::shared_ptr<Buffer>& Parent() const noexcept { return parent_; }

    /// Exact size and byte-for-byte comparison.
    bool Equals(const Buffer& other) const noexcept;

    /// Copy the contents out.
    std::vector<std::byte> ToBytes() const;
    std::string ToString() const;

    /// Lowercase hexadecimal rendering of the contents.
    std::string ToHex() const;

protected:
    Buffer() = default;

    void SetMemory(std::byte* data, int64_t size, bool is_mutable) {
        data_ = data;
        mutable_data_ = is_mutable ? data : nullptr;
        size_ = size;
        is_mutable_ = is_mutable;
    }

    const std::byte* data_ = nullptr;
    std::byte* mutable_data_ = nullptr;
    int64_t size_ = 0;
    bool is_mutable_ = false;
    std::shared_ptr<Buffer> parent_;

    friend Result<std::shared_ptr<Buffer>> SliceBuffer(
        const std::shared_ptr<Buffer>& buffer, int64_t offset,
        std::optional<int64_t> length);
};

/// Mutable pool-backed buffer whose size can change.
///
/// Capacity is rounded up to kBufferAlignment. Growing zero-fills the new
/// bytes. Resizing may move the memory: slices taken before a resize are not
/// updated and must not be used afterwards.
class ResizableBuffer : public Buffer {
public:
    explicit ResizableBuffer(std::shared_ptr<MemoryPool> pool);
    ~ResizableBuffer() override;

    /// Change the logical size. Shrinking releases memory when shrink_to_fit.
    Result<void> Resize(int64_t new_size, bool shrink_to_fit = true);

    /// Ensure capacity for at least `capacity` bytes without changing Size().
    Result<void> Reserve(int64_t capacity);

    int64_t capacity() const noexcept { return capacity_; }
    const std::shared_ptr<MemoryPool>& pool() const noexcept { return pool_; }

private:
    Result<void> Reallocate(int64_t new_capacity);

    std::shared_ptr<MemoryPool> pool_;
    std::byte* memory_ = nullptr;
    int64_t capacity_ = 0;
};

/// Allocate a fixed-size mutable buffer from `pool`.
Result<std::shared_ptr<Buffer>> AllocateBuffer(
    int64_t size, std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

/// Allocate a resizable buffer of `size` bytes from `pool`.
Result<std::shared_ptr<ResizableBuffer>> AllocateResizableBuffer(
    int64_t size, std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

/// Copy the contents of several buffers into one new buffer.
Result<std::shared_ptr<Buffer>> ConcatenateBuffers(
    const std::vector<std::shared_ptr<Buffer>>& buffers,
    std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

}  // namespace streamkit
