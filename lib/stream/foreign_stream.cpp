// SPDX-License-Identifier: MIT

// lib/stream/foreign_stream.cpp
#include "lib/stream/foreign_stream.hpp"

#include <fmt/format.h>

namespace streamkit {

namespace {

// Interpret a file object's own mode attribute ("rb", "wb", "ab", "r+b", ...).
FileMode ModeFromAttribute(std::string_view mode) {
    if (mode.find('+') != std::string_view::npos) return FileMode::ReadWrite;
    if (!mode.empty() && (mode.front() == 'w' || mode.front() == 'a' || mode.front() == 'x')) {
        return FileMode::Write;
    }
    return FileMode::Read;
}

}  // namespace

ForeignFile::ForeignFile(ForeignHandle handle, FileMode mode)
    : handle_(std::move(handle)), mode_(mode) {}

ForeignFile::~ForeignFile() {
    if (handle_.own) CloseFromDestructor(*this);
}

Result<std::shared_ptr<ForeignFile>> ForeignFile::Create(ForeignHandle handle, FileMode mode) {
    if (ModeReads(mode) && !handle.read) {
        return MakeError(ErrorCode::TypeMismatch,
                         "readable file expected: foreign handle has no read callable");
    }
    if (ModeWrites(mode) && !handle.write) {
        return MakeError(ErrorCode::TypeMismatch,
                         "writable file expected: foreign handle has no write callable");
    }
    if (handle.is_text) {
        return MakeError(ErrorCode::BinaryExpected, "binary file expected, got text file");
    }

    struct MakeSharedEnabler : public ForeignFile {
        MakeSharedEnabler(ForeignHandle h, FileMode m) : ForeignFile(std::move(h), m) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(handle), mode);
}

bool ForeignFile::IsClosed() const noexcept {
    if (Stream::IsClosed()) return true;
    return handle_.closed && handle_.closed();
}

Result<int64_t> ForeignFile::DoReadInto(std::span<std::byte> out) {
    size_t total = 0;
    while (total < out.size()) {
        auto n = handle_.read(out.subspan(total));
        if (!n) return std::unexpected(n.error());
        if (*n <= 0) break;
        total += static_cast<size_t>(*n);
    }
    return static_cast<int64_t>(total);
}

Result<std::shared_ptr<Buffer>> ForeignFile::DoReadAt(int64_t position, int64_t nbytes) {
    auto saved = handle_.tell();
    if (!saved) return std::unexpected(saved.error());
    if (auto r = handle_.seek(position, Whence::Start); !r) return std::unexpected(r.error());

    auto buffer = Stream::DoRead(nbytes);
    if (auto r = handle_.seek(*saved, Whence::Start); !r) return std::unexpected(r.error());
    return buffer;
}

Result<int64_t> ForeignFile::DoWrite(std::span<const std::byte> data) {
    size_t total = 0;
    while (total < data.size()) {
        auto n = handle_.write(data.subspan(total));
        if (!n) return std::unexpected(n.error());
        if (*n <= 0) {
            return MakeError(ErrorCode::IoError,
                             fmt::format("{}: handle accepted no bytes after {} of {}",
                                         Name(), total, data.size()));
        }
        total += static_cast<size_t>(*n);
    }
    return static_cast<int64_t>(total);
}

Result<int64_t> ForeignFile::DoSeek(int64_t position) {
    return handle_.seek(position, Whence::Start);
}

Result<int64_t> ForeignFile::DoTell() {
    if (!handle_.tell) return Unsupported("tell");
    return handle_.tell();
}

Result<int64_t> ForeignFile::DoSize() {
    auto current = handle_.tell();
    if (!current) return current;
    auto size = handle_.seek(0, Whence::End);
    if (!size) return size;
    if (auto r = handle_.seek(*current, Whence::Start); !r) return r;
    return size;
}

Result<void> ForeignFile::DoFlush() {
    if (!handle_.flush) return {};
    return handle_.flush();
}

Result<void> ForeignFile::DoClose() {
    if (!handle_.close) return {};
    return handle_.close();
}

Result<std::shared_ptr<Stream>> WrapForeignHandle(ForeignHandle handle,
                                                  std::optional<std::string_view> mode) {
    FileMode resolved = FileMode::Read;
    if (mode) {
        auto parsed = ParseFileMode(*mode);
        if (!parsed) return std::unexpected(parsed.error());
        resolved = *parsed;

        if (ModeReads(resolved) && handle.readable && !handle.readable()) {
            return MakeError(ErrorCode::TypeMismatch,
                             fmt::format("readable file expected for mode '{}'", *mode));
        }
        if (ModeWrites(resolved) && handle.writable && !handle.writable()) {
            return MakeError(ErrorCode::TypeMismatch,
                             fmt::format("writable file expected for mode '{}'", *mode));
        }
    } else if (handle.mode) {
        resolved = ModeFromAttribute(*handle.mode);
    } else if (handle.writable && handle.writable()) {
        resolved = FileMode::Write;
    }

    auto file = ForeignFile::Create(std::move(handle), resolved);
    if (!file) return std::unexpected(file.error());
    return std::shared_ptr<Stream>(std::move(*file));
}

}  // namespace streamkit
