// SPDX-License-Identifier: MIT

// lib/stream/file_stream.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "lib/stream/file_mode.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

// LocalFile - stream over a POSIX file descriptor.
//
// Read:      readable, seekable, random access via pread (ReadAt does not
//            touch the file offset)
// Write:     writable, sequential; created or truncated on open
// ReadWrite: readable, writable, seekable; the file must exist
//
// Close() always closes the descriptor. Destruction closes it only when the
// handle owns it (opened by path, or adopted with own = true).
class LocalFile : public Stream {
public:
    static Result<std::shared_ptr<LocalFile>> Open(
        const std::filesystem::path& path, FileMode mode,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    /// Adopt an already-open descriptor opened with a compatible mode.
    static Result<std::shared_ptr<LocalFile>> FromDescriptor(
        int fd, FileMode mode, bool own = false,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    ~LocalFile() override;

    bool Readable() const noexcept override { return ModeReads(mode_); }
    bool Writable() const noexcept override { return ModeWrites(mode_); }
    bool Seekable() const noexcept override { return mode_ != FileMode::Write; }

    std::string_view Name() const noexcept override { return "LocalFile"; }

    int fd() const noexcept { return fd_; }
    FileMode mode() const noexcept { return mode_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    bool owns_descriptor() const noexcept { return own_; }

protected:
    LocalFile(int fd, FileMode mode, bool own, std::filesystem::path path,
              std::shared_ptr<MemoryPool> pool);

    Result<int64_t> DoReadInto(std::span<std::byte> out) override;
    Result<std::shared_ptr<Buffer>> DoReadAt(int64_t position, int64_t nbytes) override;
    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoSeek(int64_t position) override;
    Result<int64_t> DoTell() override;
    Result<int64_t> DoSize() override;
    Result<void> DoClose() override;

private:
    Result<int64_t> PreadInto(int64_t position, std::span<std::byte> out);
    std::unexpected<Error> OsError(std::string_view op, int err) const;

    int fd_;
    FileMode mode_;
    bool own_;
    std::filesystem::path path_;
};

/// Open a local file with a mode string ("r", "rb", "w", "wb", "r+", "rb+", "r+b").
Result<std::shared_ptr<Stream>> OpenLocalFile(const std::filesystem::path& path,
                                              std::string_view mode);

}  // namespace streamkit
