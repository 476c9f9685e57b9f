// SPDX-License-Identifier: MIT

// lib/stream/memory_map.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "lib/stream/file_mode.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

// MemoryMappedFile - seekable stream over a shared file mapping.
//
// Reads return zero-copy buffers that pin the mapping they came from, so a
// buffer stays valid after the stream is closed or resized. Writes go straight
// into the mapping and never extend the file; use Resize() to change its
// length. Buffers obtained before a Resize() keep the old mapping alive but
// are not guaranteed to observe later writes.
class MemoryMappedFile : public Stream {
public:
    /// Create (or truncate) `path` with exactly `size` bytes, mapped read-write.
    static Result<std::shared_ptr<MemoryMappedFile>> Create(
        const std::filesystem::path& path, int64_t size);

    /// Map an existing file.
    static Result<std::shared_ptr<MemoryMappedFile>> Open(
        const std::filesystem::path& path, FileMode mode);

    ~MemoryMappedFile() override;

    bool Readable() const noexcept override { return ModeReads(mode_); }
    bool Writable() const noexcept override { return ModeWrites(mode_); }
    bool Seekable() const noexcept override { return true; }

    std::string_view Name() const noexcept override { return "MemoryMappedFile"; }

    /// Resize the backing file and the mapping. Requires a writable mapping.
    Result<void> Resize(int64_t new_size);

    FileMode mode() const noexcept { return mode_; }
    const std::filesystem::path& path() const noexcept { return path_; }

protected:
    MemoryMappedFile(int fd, FileMode mode, std::filesystem::path path);

    Result<std::shared_ptr<Buffer>> DoRead(int64_t nbytes) override;
    Result<int64_t> DoReadInto(std::span<std::byte> out) override;
    Result<std::shared_ptr<Buffer>> DoReadAt(int64_t position, int64_t nbytes) override;
    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoSeek(int64_t position) override;
    Result<int64_t> DoTell() override { return position_; }
    Result<int64_t> DoSize() override { return MappedSize(); }
    Result<void> DoFlush() override;
    Result<void> DoClose() override;

private:
    // One mmap'd range; unmapped when the last holder (stream or buffer) drops it.
    struct Region {
        std::byte* data = nullptr;
        size_t size = 0;
        ~Region();
    };

    static Result<std::shared_ptr<MemoryMappedFile>> Map(int fd, FileMode mode,
                                                         std::filesystem::path path);
    Result<void> Remap(int64_t size);
    int64_t MappedSize() const noexcept {
        return region_ ? static_cast<int64_t>(region_->size) : 0;
    }
    std::shared_ptr<Buffer> View(int64_t position, int64_t nbytes) const;

    int fd_;
    FileMode mode_;
    std::filesystem::path path_;
    std::shared_ptr<Region> region_;
    int64_t position_ = 0;
};

/// Create a memory-mapped file of `size` bytes.
Result<std::shared_ptr<Stream>> CreateMemoryMap(const std::filesystem::path& path,
                                                int64_t size);

/// Map an existing file with a mode string.
Result<std::shared_ptr<Stream>> OpenMemoryMap(const std::filesystem::path& path,
                                              std::string_view mode);

}  // namespace streamkit
