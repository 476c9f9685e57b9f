// SPDX-License-Identifier: MIT

// lib/stream/file_stream.cpp
#include "lib/stream/file_stream.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <cerrno>

namespace streamkit {

namespace {

int OpenFlags(FileMode mode) {
    switch (mode) {
        case FileMode::Read: return O_RDONLY;
        case FileMode::Write: return O_WRONLY | O_CREAT | O_TRUNC;
        case FileMode::ReadWrite: return O_RDWR;
    }
    return O_RDONLY;
}

}  // namespace

LocalFile::LocalFile(int fd, FileMode mode, bool own, std::filesystem::path path,
                     std::shared_ptr<MemoryPool> pool)
    : fd_(fd), mode_(mode), own_(own), path_(std::move(path)) {
    pool_ = std::move(pool);
}

LocalFile::~LocalFile() {
    if (own_) CloseFromDestructor(*this);
}

Result<std::shared_ptr<LocalFile>> LocalFile::Open(const std::filesystem::path& path,
                                                   FileMode mode,
                                                   std::shared_ptr<MemoryPool> pool) {
    int fd;
    do {
        fd = ::open(path.c_str(), OpenFlags(mode) | O_CLOEXEC, 0666);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("failed to open local file '{}'", path.string()), err);
    }

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        ::close(fd);
        return MakeError(ErrorCode::IoError,
                         fmt::format("cannot open directory '{}' as a file", path.string()),
                         EISDIR);
    }

    struct MakeSharedEnabler : public LocalFile {
        MakeSharedEnabler(int f, FileMode m, std::filesystem::path p,
                          std::shared_ptr<MemoryPool> mp)
            : LocalFile(f, m, true, std::move(p), std::move(mp)) {}
    };
    return std::make_shared<MakeSharedEnabler>(fd, mode, path, std::move(pool));
}

Result<std::shared_ptr<LocalFile>> LocalFile::FromDescriptor(
    int fd, FileMode mode, bool own, std::shared_ptr<MemoryPool> pool) {
    if (fd < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("invalid file descriptor {}", fd));
    }

    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("descriptor {} is not open", fd), err);
    }
    int access = flags & O_ACCMODE;
    bool can_read = access == O_RDONLY || access == O_RDWR;
    bool can_write = access == O_WRONLY || access == O_RDWR;
    if ((ModeReads(mode) && !can_read) || (ModeWrites(mode) && !can_write)) {
        return MakeError(ErrorCode::TypeMismatch,
                         fmt::format("descriptor {} was not opened for mode '{}'",
                                     fd, ModeString(mode)));
    }

    struct MakeSharedEnabler : public LocalFile {
        MakeSharedEnabler(int f, FileMode m, bool o, std::shared_ptr<MemoryPool> mp)
            : LocalFile(f, m, o, {}, std::move(mp)) {}
    };
    return std::make_shared<MakeSharedEnabler>(fd, mode, own, std::move(pool));
}

std::unexpected<Error> LocalFile::OsError(std::string_view op, int err) const {
    if (path_.empty()) {
        return MakeError(ErrorCode::IoError,
                         fmt::format("{}: {} failed on descriptor {}", Name(), op, fd_), err);
    }
    return MakeError(ErrorCode::IoError,
                     fmt::format("{}: {} failed on '{}'", Name(), op, path_.string()), err);
}

Result<int64_t> LocalFile::DoReadInto(std::span<std::byte> out) {
    size_t total = 0;
    while (total < out.size()) {
        ssize_t n = ::read(fd_, out.data() + total, out.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return OsError("read", errno);
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    return static_cast<int64_t>(total);
}

Result<int64_t> LocalFile::PreadInto(int64_t position, std::span<std::byte> out) {
    size_t total = 0;
    while (total < out.size()) {
        ssize_t n = ::pread(fd_, out.data() + total, out.size() - total,
                            static_cast<off_t>(position + static_cast<int64_t>(total)));
        if (n < 0) {
            if (errno == EINTR) continue;
            return OsError("pread", errno);
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    return static_cast<int64_t>(total);
}

Result<std::shared_ptr<Buffer>> LocalFile::DoReadAt(int64_t position, int64_t nbytes) {
    auto buffer = AllocateResizableBuffer(nbytes, pool_);
    if (!buffer) return std::unexpected(buffer.error());

    if (nbytes > 0) {
        auto n = PreadInto(position, *(*buffer)->MutableSpan());
        if (!n) return std::unexpected(n.error());
        if (*n < nbytes) {
            if (auto r = (*buffer)->Resize(*n); !r) return std::unexpected(r.error());
        }
    }
    return std::shared_ptr<Buffer>(std::move(*buffer));
}

Result<int64_t> LocalFile::DoWrite(std::span<const std::byte> data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::write(fd_, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return OsError("write", errno);
        }
        total += static_cast<size_t>(n);
    }
    return static_cast<int64_t>(total);
}

Result<int64_t> LocalFile::DoSeek(int64_t position) {
    off_t r = ::lseek(fd_, static_cast<off_t>(position), SEEK_SET);
    if (r < 0) return OsError("lseek", errno);
    return static_cast<int64_t>(r);
}

Result<int64_t> LocalFile::DoTell() {
    off_t r = ::lseek(fd_, 0, SEEK_CUR);
    if (r < 0) return OsError("lseek", errno);
    return static_cast<int64_t>(r);
}

Result<int64_t> LocalFile::DoSize() {
    struct stat st{};
    if (::fstat(fd_, &st) < 0) return OsError("fstat", errno);
    return static_cast<int64_t>(st.st_size);
}

Result<void> LocalFile::DoClose() {
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0 && errno != EINTR) return OsError("close", errno);
    return {};
}

Result<std::shared_ptr<Stream>> OpenLocalFile(const std::filesystem::path& path,
                                              std::string_view mode) {
    auto parsed = ParseFileMode(mode);
    if (!parsed) return std::unexpected(parsed.error());
    auto file = LocalFile::Open(path, *parsed);
    if (!file) return std::unexpected(file.error());
    return std::shared_ptr<Stream>(std::move(*file));
}

}  // namespace streamkit
