// SPDX-License-Identifier: MIT

// lib/stream/memory_pool.cpp
#include "lib/stream/memory_pool.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <new>

namespace streamkit {

namespace {

// Returned for zero-size allocations so callers never see nullptr.
alignas(kBufferAlignment) std::byte zero_size_area[1];

}  // namespace

PmrMemoryPool::PmrMemoryPool()
    : resource_(std::make_shared<std::pmr::synchronized_pool_resource>()) {}

PmrMemoryPool::PmrMemoryPool(std::shared_ptr<std::pmr::memory_resource> resource,
                             std::optional<int64_t> limit)
    : resource_(std::move(resource)), limit_(limit) {}

bool PmrMemoryPool::Reserve(int64_t size) {
    int64_t current = bytes_allocated_.load(std::memory_order_relaxed);
    int64_t next;
    do {
        next = current + size;
        if (limit_ && next > *limit_) return false;
    } while (!bytes_allocated_.compare_exchange_weak(current, next,
                                                     std::memory_order_relaxed));

    int64_t peak = max_memory_.load(std::memory_order_relaxed);
    while (next > peak &&
           !max_memory_.compare_exchange_weak(peak, next, std::memory_order_relaxed)) {
    }
    return true;
}

void PmrMemoryPool::Unreserve(int64_t size) {
    bytes_allocated_.fetch_sub(size, std::memory_order_relaxed);
}

Result<std::byte*> PmrMemoryPool::Allocate(int64_t size) {
    if (size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative allocation size {}", size));
    }
    if (size == 0) return zero_size_area;

    if (!Reserve(size)) {
        return MakeError(ErrorCode::AllocationFailure,
                         fmt::format("allocation of {} bytes exceeds pool limit of {} "
                                     "({} bytes in use)",
                                     size, *limit_, BytesAllocated()));
    }
    try {
        void* p = resource_->allocate(static_cast<size_t>(size), kBufferAlignment);
        return static_cast<std::byte*>(p);
    } catch (const std::bad_alloc&) {
        Unreserve(size);
        return MakeError(ErrorCode::AllocationFailure,
                         fmt::format("memory resource refused {} bytes", size));
    }
}

Result<std::byte*> PmrMemoryPool::Reallocate(std::byte* ptr, int64_t old_size,
                                             int64_t new_size) {
    if (new_size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative allocation size {}", new_size));
    }
    if (new_size == old_size) return ptr;

    auto fresh = Allocate(new_size);
    if (!fresh) return fresh;

    if (old_size > 0 && new_size > 0) {
        std::memcpy(*fresh, ptr, static_cast<size_t>(std::min(old_size, new_size)));
    }
    Free(ptr, old_size);
    return fresh;
}

void PmrMemoryPool::Free(std::byte* ptr, int64_t size) {
    if (ptr == zero_size_area || size == 0) return;
    resource_->deallocate(ptr, static_cast<size_t>(size), kBufferAlignment);
    Unreserve(size);
}

std::shared_ptr<MemoryPool> DefaultMemoryPool() {
    static std::shared_ptr<MemoryPool> pool = std::make_shared<PmrMemoryPool>();
    return pool;
}

}  // namespace streamkit
