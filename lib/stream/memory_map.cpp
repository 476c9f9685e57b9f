// SPDX-License-Identifier: MIT

// lib/stream/memory_map.cpp
#include "lib/stream/memory_map.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace streamkit {

MemoryMappedFile::Region::~Region() {
    if (data) ::munmap(data, size);
}

MemoryMappedFile::MemoryMappedFile(int fd, FileMode mode, std::filesystem::path path)
    : fd_(fd), mode_(mode), path_(std::move(path)) {}

MemoryMappedFile::~MemoryMappedFile() {
    CloseFromDestructor(*this);
}

Result<std::shared_ptr<MemoryMappedFile>> MemoryMappedFile::Map(
    int fd, FileMode mode, std::filesystem::path path) {
    struct stat st{};
    if (::fstat(fd, &st) < 0) {
        int err = errno;
        ::close(fd);
        return MakeError(ErrorCode::IoError,
                         fmt::format("fstat failed on '{}'", path.string()), err);
    }

    struct MakeSharedEnabler : public MemoryMappedFile {
        MakeSharedEnabler(int f, FileMode m, std::filesystem::path p)
            : MemoryMappedFile(f, m, std::move(p)) {}
    };
    auto file = std::make_shared<MakeSharedEnabler>(fd, mode, std::move(path));
    if (auto r = file->Remap(static_cast<int64_t>(st.st_size)); !r) {
        return std::unexpected(r.error());
    }
    return file;
}

Result<std::shared_ptr<MemoryMappedFile>> MemoryMappedFile::Create(
    const std::filesystem::path& path, int64_t size) {
    if (size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative memory map size {}", size));
    }
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd < 0) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("failed to create '{}'", path.string()), err);
    }
    if (::ftruncate(fd, static_cast<off_t>(size)) < 0) {
        int err = errno;
        ::close(fd);
        return MakeError(ErrorCode::IoError,
                         fmt::format("failed to size '{}' to {} bytes", path.string(), size),
                         err);
    }
    return Map(fd, FileMode::ReadWrite, path);
}

Result<std::shared_ptr<MemoryMappedFile>> MemoryMappedFile::Open(
    const std::filesystem::path& path, FileMode mode) {
    // Shared writable mappings need a read-write descriptor, even for "w".
    int flags = mode == FileMode::Read ? O_RDONLY : O_RDWR;
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("failed to open '{}' for mapping", path.string()), err);
    }
    return Map(fd, mode, path);
}

Result<void> MemoryMappedFile::Remap(int64_t size) {
    auto region = std::make_shared<Region>();
    if (size > 0) {
        int prot = mode_ == FileMode::Read ? PROT_READ : PROT_READ | PROT_WRITE;
        void* addr = ::mmap(nullptr, static_cast<size_t>(size), prot, MAP_SHARED, fd_, 0);
        if (addr == MAP_FAILED) {
            int err = errno;
            return MakeError(ErrorCode::IoError,
                             fmt::format("{}: mmap of {} bytes failed on '{}'",
                                         Name(), size, path_.string()),
                             err);
        }
        region->data = static_cast<std::byte*>(addr);
        region->size = static_cast<size_t>(size);
    }
    region_ = std::move(region);
    position_ = std::min(position_, size);
    return {};
}

Result<void> MemoryMappedFile::Resize(int64_t new_size) {
    if (auto r = CheckOpen(); !r) return r;
    if (!Writable()) {
        return Unsupported("resize of read-only mapping");
    }
    if (new_size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: negative size {}", Name(), new_size));
    }
    if (::ftruncate(fd_, static_cast<off_t>(new_size)) < 0) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("{}: failed to resize '{}' to {} bytes",
                                     Name(), path_.string(), new_size),
                         err);
    }
    return Remap(new_size);
}

std::shared_ptr<Buffer> MemoryMappedFile::View(int64_t position, int64_t nbytes) const {
    auto address = reinterpret_cast<uintptr_t>(region_->data + position);
    return Buffer::Wrap(address, nbytes, region_, false);
}

Result<std::shared_ptr<Buffer>> MemoryMappedFile::DoRead(int64_t nbytes) {
    int64_t n = std::clamp<int64_t>(MappedSize() - position_, 0, nbytes);
    auto view = View(position_, n);
    position_ += n;
    return view;
}

Result<int64_t> MemoryMappedFile::DoReadInto(std::span<std::byte> out) {
    int64_t n = std::clamp<int64_t>(MappedSize() - position_, 0,
                                    static_cast<int64_t>(out.size()));
    if (n > 0) std::memcpy(out.data(), region_->data + position_, static_cast<size_t>(n));
    position_ += n;
    return n;
}

Result<std::shared_ptr<Buffer>> MemoryMappedFile::DoReadAt(int64_t position, int64_t nbytes) {
    int64_t start = std::min(position, MappedSize());
    int64_t n = std::clamp<int64_t>(MappedSize() - start, 0, nbytes);
    return View(start, n);
}

Result<int64_t> MemoryMappedFile::DoWrite(std::span<const std::byte> data) {
    auto n = static_cast<int64_t>(data.size());
    if (position_ + n > MappedSize()) {
        return MakeError(ErrorCode::OutOfRange,
                         fmt::format("{}: write of {} bytes at {} exceeds mapped size {}",
                                     Name(), n, position_, MappedSize()));
    }
    std::memcpy(region_->data + position_, data.data(), data.size());
    position_ += n;
    return n;
}

Result<int64_t> MemoryMappedFile::DoSeek(int64_t position) {
    if (position > MappedSize()) {
        return MakeError(ErrorCode::OutOfRange,
                         fmt::format("{}: seek to {} beyond mapped size {}",
                                     Name(), position, MappedSize()));
    }
    position_ = position;
    return position_;
}

Result<void> MemoryMappedFile::DoFlush() {
    if (region_ && region_->data &&
        ::msync(region_->data, region_->size, MS_SYNC) < 0) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("{}: msync failed on '{}'", Name(), path_.string()),
                         err);
    }
    return {};
}

Result<void> MemoryMappedFile::DoClose() {
    region_.reset();
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0 && errno != EINTR) {
        int err = errno;
        return MakeError(ErrorCode::IoError,
                         fmt::format("{}: close failed on '{}'", Name(), path_.string()),
                         err);
    }
    return {};
}

Result<std::shared_ptr<Stream>> CreateMemoryMap(const std::filesystem::path& path,
                                                int64_t size) {
    auto file = MemoryMappedFile::Create(path, size);
    if (!file) return std::unexpected(file.error());
    return std::shared_ptr<Stream>(std::move(*file));
}

Result<std::shared_ptr<Stream>> OpenMemoryMap(const std::filesystem::path& path,
                                              std::string_view mode) {
    auto parsed = ParseFileMode(mode);
    if (!parsed) return std::unexpected(parsed.error());
    auto file = MemoryMappedFile::Open(path, *parsed);
    if (!file) return std::unexpected(file.error());
    return std::shared_ptr<Stream>(std::move(*file));
}

}  // namespace streamkit
