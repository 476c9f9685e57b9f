// SPDX-License-Identifier: MIT

// lib/stream/memory_pool.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string_view>

#include "lib/stream/error.hpp"

namespace streamkit {

/// Alignment of every block handed out by a MemoryPool.
inline constexpr size_t kBufferAlignment = 64;

/// Abstract allocator for buffer memory.
///
/// Buffers allocated from a pool hold a shared_ptr to it, so a pool always
/// outlives the memory it handed out.
class MemoryPool {
public:
    virtual ~MemoryPool() = default;

    /// Allocate `size` bytes aligned to kBufferAlignment. A zero-size
    /// allocation returns a valid, non-null sentinel pointer.
    virtual Result<std::byte*> Allocate(int64_t size) = 0;

    /// Grow or shrink a block, preserving min(old_size, new_size) bytes.
    virtual Result<std::byte*> Reallocate(std::byte* ptr, int64_t old_size,
                                          int64_t new_size) = 0;

    /// Return a block obtained from Allocate/Reallocate.
    virtual void Free(std::byte* ptr, int64_t size) = 0;

    /// Bytes currently outstanding.
    virtual int64_t BytesAllocated() const = 0;

    /// High-water mark of BytesAllocated().
    virtual int64_t MaxMemory() const = 0;

    virtual std::string_view BackendName() const = 0;
};

/// MemoryPool backed by a PMR memory resource.
///
/// The resource is held by shared_ptr so that several pools (or a pool and
/// other users of the resource) can share it. An optional byte limit turns
/// the pool into a bounded arena: allocations that would exceed it fail with
/// AllocationFailure instead of reaching the resource.
///
/// Thread safety: accounting is atomic; the underlying resource decides
/// whether Allocate/Free may race (synchronized_pool_resource is safe).
class PmrMemoryPool : public MemoryPool {
public:
    /// Construct with a default synchronized_pool_resource.
    PmrMemoryPool();

    /// Construct with a caller-provided resource and optional byte limit.
    explicit PmrMemoryPool(std::shared_ptr<std::pmr::memory_resource> resource,
                           std::optional<int64_t> limit = std::nullopt);

    Result<std::byte*> Allocate(int64_t size) override;
    Result<std::byte*> Reallocate(std::byte* ptr, int64_t old_size,
                                  int64_t new_size) override;
    void Free(std::byte* ptr, int64_t size) override;

    int64_t BytesAllocated() const override {
        return bytes_allocated_.load(std::memory_order_relaxed);
    }
    int64_t MaxMemory() const override {
        return max_memory_.load(std::memory_order_relaxed);
    }
    std::string_view BackendName() const override { return "pmr"; }

    /// Byte limit, if any.
    std::optional<int64_t> limit() const noexcept { return limit_; }

    /// Get shared pointer to the underlying memory resource.
    std::shared_ptr<std::pmr::memory_resource> GetResourcePtr() const {
        return resource_;
    }

private:
    bool Reserve(int64_t size);
    void Unreserve(int64_t size);

    std::shared_ptr<std::pmr::memory_resource> resource_;
    std::optional<int64_t> limit_;
    std::atomic<int64_t> bytes_allocated_{0};
    std::atomic<int64_t> max_memory_{0};
};

/// Process-wide default pool (PmrMemoryPool over synchronized_pool_resource).
std::shared_ptr<MemoryPool> DefaultMemoryPool();

}  // namespace streamkit
