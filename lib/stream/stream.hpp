// SPDX-License-Identifier: MIT

// lib/stream/stream.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "lib/stream/buffer.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/memory_pool.hpp"

namespace streamkit {

/// Default chunk size for buffered I/O, read-to-end and transfers.
inline constexpr int64_t kDefaultBufferSize = 64 * 1024;

/// Reference point for Seek().
enum class Whence {
    Start,    ///< Offset from the beginning of the stream
    Current,  ///< Offset from the current position
    End,      ///< Offset from the end of the stream
};

/// Capability-tagged byte stream.
///
/// Every backend and decorator derives from Stream. The public methods are
/// non-virtual: they reject I/O on a closed stream with ClosedStream, check the
/// capability flags, validate arguments, then dispatch to the protected Do*
/// hooks. A hook a backend does not override fails with CapabilityViolation,
/// so an unsupported operation always fails the same way.
///
/// State machine: Open{readable?, writable?, seekable?} -> Closed. Close() is
/// idempotent; the transition is irreversible.
///
/// Thread safety: not thread-safe. One thread at a time, except where a
/// backend documents otherwise.
class Stream {
public:
    virtual ~Stream() = default;

    // Non-copyable, non-movable
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;
    Stream(Stream&&) = delete;
    Stream& operator=(Stream&&) = delete;

    // Capability flags. Never fail, independent of the closed state.
    virtual bool Readable() const noexcept = 0;
    virtual bool Writable() const noexcept = 0;
    virtual bool Seekable() const noexcept = 0;

    virtual bool IsClosed() const noexcept { return closed_; }

    /// Read up to `nbytes`. A short or empty result signals end of stream.
    /// With no count, reads Size() - Tell() bytes on seekable streams and
    /// everything up to end of stream otherwise.
    Result<std::shared_ptr<Buffer>> Read(std::optional<int64_t> nbytes = std::nullopt);

    /// Read into caller memory. Returns the number of bytes read (0 at EOF).
    Result<int64_t> ReadInto(std::span<std::byte> out);

    /// Random-access read; does not move the current position.
    Result<std::shared_ptr<Buffer>> ReadAt(int64_t position, int64_t nbytes);

    /// Write all of `data`. Returns the number of bytes written.
    Result<int64_t> Write(std::span<const std::byte> data);
    Result<int64_t> Write(const Buffer& data) { return Write(data.Span()); }
    Result<int64_t> Write(std::string_view data);

    /// Move the position; returns the new absolute position.
    Result<int64_t> Seek(int64_t offset, Whence whence = Whence::Start);

    /// Current position.
    Result<int64_t> Tell();

    /// Total length of a seekable stream.
    Result<int64_t> Size();

    /// Push buffered data to the underlying resource. No-op on read-only streams.
    Result<void> Flush();

    /// Release the underlying resource. Idempotent.
    Result<void> Close();

    /// Short type name used in error messages.
    virtual std::string_view Name() const noexcept = 0;

protected:
    Stream() = default;

    // Hooks. Arguments are validated and the stream is open and capable
    // when these are called.
    virtual Result<std::shared_ptr<Buffer>> DoRead(int64_t nbytes);
    virtual Result<int64_t> DoReadInto(std::span<std::byte> out);
    virtual Result<std::shared_ptr<Buffer>> DoReadAt(int64_t position, int64_t nbytes);
    virtual Result<int64_t> DoWrite(std::span<const std::byte> data);
    virtual Result<int64_t> DoSeek(int64_t position);
    virtual Result<int64_t> DoTell();
    virtual Result<int64_t> DoSize();
    virtual Result<void> DoFlush() { return {}; }
    virtual Result<void> DoClose() = 0;

    /// Read until a short read. Used for unsized reads on sequential streams.
    Result<std::shared_ptr<Buffer>> ReadToEnd();

    /// Mark closed without running DoClose (finalization, detach).
    void MarkClosed() noexcept { closed_ = true; }

    Result<void> CheckOpen() const;
    std::unexpected<Error> Unsupported(std::string_view op) const;

    std::shared_ptr<MemoryPool> pool_ = DefaultMemoryPool();

private:
    bool closed_ = false;
};

/// Close `stream` from a destructor, reporting failures on stderr.
void CloseFromDestructor(Stream& stream);

}  // namespace streamkit
