// SPDX-License-Identifier: MIT

// lib/stream/stream.cpp
#include "lib/stream/stream.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>

namespace streamkit {

Result<void> Stream::CheckOpen() const {
    if (IsClosed()) {
        return MakeError(ErrorCode::ClosedStream,
                         fmt::format("{}: I/O operation on closed stream", Name()));
    }
    return {};
}

std::unexpected<Error> Stream::Unsupported(std::string_view op) const {
    return MakeError(ErrorCode::CapabilityViolation,
                     fmt::format("{}: {} not supported", Name(), op));
}

Result<std::shared_ptr<Buffer>> Stream::Read(std::optional<int64_t> nbytes) {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (!Readable()) return Unsupported("read on non-readable stream");

    if (!nbytes) {
        if (!Seekable()) return ReadToEnd();
        auto size = DoSize();
        if (!size) return std::unexpected(size.error());
        auto pos = DoTell();
        if (!pos) return std::unexpected(pos.error());
        nbytes = std::max<int64_t>(0, *size - *pos);
    }
    if (*nbytes < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: negative read count {}", Name(), *nbytes));
    }
    return DoRead(*nbytes);
}

Result<int64_t> Stream::ReadInto(std::span<std::byte> out) {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (!Readable()) return Unsupported("read on non-readable stream");
    if (out.empty()) return 0;
    return DoReadInto(out);
}

Result<std::shared_ptr<Buffer>> Stream::ReadAt(int64_t position, int64_t nbytes) {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (!Readable()) return Unsupported("read on non-readable stream");
    if (!Seekable()) return Unsupported("random access on sequential stream");
    if (position < 0 || nbytes < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: invalid read_at position {} / count {}",
                                     Name(), position, nbytes));
    }
    return DoReadAt(position, nbytes);
}

Result<int64_t> Stream::Write(std::span<const std::byte> data) {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (!Writable()) return Unsupported("write on non-writable stream");
    if (data.empty()) return 0;
    return DoWrite(data);
}

Result<int64_t> Stream::Write(std::string_view data) {
    return Write(std::as_bytes(std::span{data.data(), data.size()}));
}

Result<int64_t> Stream::Seek(int64_t offset, Whence whence) {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (!Seekable()) return Unsupported("seek on non-seekable stream");

    int64_t target = offset;
    switch (whence) {
        case Whence::Start:
            break;
        case Whence::Current: {
            auto pos = DoTell();
            if (!pos) return pos;
            target = *pos + offset;
            break;
        }
        case Whence::End: {
            auto size = DoSize();
            if (!size) return size;
            target = *size + offset;
            break;
        }
    }
    if (target < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: seek to negative position {}", Name(), target));
    }
    return DoSeek(target);
}

Result<int64_t> Stream::Tell() {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    return DoTell();
}

Result<int64_t> Stream::Size() {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (!Seekable()) return Unsupported("size of non-seekable stream");
    return DoSize();
}

Result<void> Stream::Flush() {
    if (auto r = CheckOpen(); !r) return r;
    if (!Writable()) return {};
    return DoFlush();
}

Result<void> Stream::Close() {
    if (IsClosed()) return {};
    auto result = DoClose();
    closed_ = true;
    return result;
}

// Default hooks

Result<std::shared_ptr<Buffer>> Stream::DoRead(int64_t nbytes) {
    auto buffer = AllocateResizableBuffer(nbytes, pool_);
    if (!buffer) return std::unexpected(buffer.error());

    int64_t total = 0;
    if (nbytes > 0) {
        std::byte* dest = *(*buffer)->MutableData();
        auto n = DoReadInto({dest, static_cast<size_t>(nbytes)});
        if (!n) return std::unexpected(n.error());
        total = *n;
    }
    if (total < nbytes) {
        if (auto r = (*buffer)->Resize(total); !r) return std::unexpected(r.error());
    }
    return std::shared_ptr<Buffer>(std::move(*buffer));
}

Result<int64_t> Stream::DoReadInto(std::span<std::byte> /*out*/) {
    return Unsupported("read");
}

Result<std::shared_ptr<Buffer>> Stream::DoReadAt(int64_t /*position*/, int64_t /*nbytes*/) {
    return Unsupported("random access");
}

Result<int64_t> Stream::DoWrite(std::span<const std::byte> /*data*/) {
    return Unsupported("write");
}

Result<int64_t> Stream::DoSeek(int64_t /*position*/) {
    return Unsupported("seek");
}

Result<int64_t> Stream::DoTell() {
    return Unsupported("tell");
}

Result<int64_t> Stream::DoSize() {
    return Unsupported("size");
}

Result<std::shared_ptr<Buffer>> Stream::ReadToEnd() {
    auto out = AllocateResizableBuffer(0, pool_);
    if (!out) return std::unexpected(out.error());
    auto& buffer = *out;

    int64_t total = 0;
    while (true) {
        int64_t wanted = total + kDefaultBufferSize;
        if (wanted > buffer->capacity()) {
            auto r = buffer->Reserve(std::max(buffer->capacity() * 2, wanted));
            if (!r) return std::unexpected(r.error());
        }
        if (auto r = buffer->Resize(wanted, false); !r) {
            return std::unexpected(r.error());
        }
        std::byte* dest = *buffer->MutableData() + total;
        auto chunk = DoReadInto({dest, static_cast<size_t>(kDefaultBufferSize)});
        if (!chunk) return std::unexpected(chunk.error());
        total += *chunk;
        if (*chunk == 0) break;
    }
    if (auto r = buffer->Resize(total); !r) return std::unexpected(r.error());
    return std::shared_ptr<Buffer>(std::move(buffer));
}

void CloseFromDestructor(Stream& stream) {
    if (stream.IsClosed()) return;
    auto r = stream.Close();
    if (!r) {
        std::fprintf(stderr, "%.*s: error closing stream from destructor: %s\n",
                     static_cast<int>(stream.Name().size()), stream.Name().data(),
                     FormatError(r.error()).c_str());
    }
}

}  // namespace streamkit
