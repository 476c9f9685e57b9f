// SPDX-License-Identifier: MIT

// lib/stream/foreign_stream.hpp
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/file_mode.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

/// Capability descriptor for a caller-supplied file-like object.
///
/// Any callable may be left empty; the adapter only needs the ones its
/// resolved mode uses. `read` returns the bytes copied into the span (0 at
/// end of file), `write` the bytes accepted, `seek` the new absolute position.
struct ForeignHandle {
    std::function<Result<int64_t>(std::span<std::byte>)> read;
    std::function<Result<int64_t>(std::span<const std::byte>)> write;
    std::function<Result<int64_t>(int64_t, Whence)> seek;
    std::function<Result<int64_t>()> tell;
    std::function<Result<void>()> flush;
    std::function<Result<void>()> close;
    std::function<bool()> closed;

    std::optional<std::string> mode;      // The object's own mode attribute
    std::function<bool()> readable;       // Capability predicates
    std::function<bool()> writable;

    bool is_text = false;
    bool own = false;                     // Close the handle on destruction
};

// ForeignFile - Stream adapter over a ForeignHandle.
//
// Seekable iff the handle supplies both `seek` and `tell`. Reads loop until
// the request is filled or the handle reports end of file.
class ForeignFile : public Stream {
public:
    static Result<std::shared_ptr<ForeignFile>> Create(ForeignHandle handle, FileMode mode);

    ~ForeignFile() override;

    bool Readable() const noexcept override { return ModeReads(mode_); }
    bool Writable() const noexcept override { return ModeWrites(mode_); }
    bool Seekable() const noexcept override {
        return static_cast<bool>(handle_.seek) && static_cast<bool>(handle_.tell);
    }

    bool IsClosed() const noexcept override;

    std::string_view Name() const noexcept override { return "ForeignFile"; }

    FileMode mode() const noexcept { return mode_; }

protected:
    ForeignFile(ForeignHandle handle, FileMode mode);

    Result<int64_t> DoReadInto(std::span<std::byte> out) override;
    Result<std::shared_ptr<Buffer>> DoReadAt(int64_t position, int64_t nbytes) override;
    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoSeek(int64_t position) override;
    Result<int64_t> DoTell() override;
    Result<int64_t> DoSize() override;
    Result<void> DoFlush() override;
    Result<void> DoClose() override;

private:
    ForeignHandle handle_;
    FileMode mode_;
};

/// Adapt a foreign handle.
///
/// The mode comes from `mode` when given, else from the handle's mode
/// attribute, else from its writable() predicate; failing all of those the
/// handle is opened for reading. A declared mode the
/// predicates contradict, or a missing read/write callable, fails with
/// TypeMismatch; a text handle fails with BinaryExpected.
Result<std::shared_ptr<Stream>> WrapForeignHandle(
    ForeignHandle handle, std::optional<std::string_view> mode = std::nullopt);

}  // namespace streamkit
