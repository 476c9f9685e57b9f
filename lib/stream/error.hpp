// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace streamkit {

/// Error codes for all stream, buffer, codec and transfer operations.
enum class ErrorCode {
    // State
    ClosedStream,          ///< Operation on a closed or detached handle

    // Capability
    CapabilityViolation,   ///< Operation not permitted by the stream's capability flags

    // Argument
    InvalidMode,           ///< Mode string not recognized
    InvalidArgument,       ///< Malformed argument (buffer size, count, whence target)
    OutOfRange,            ///< Offset or write outside the addressable range

    // Codec
    InvalidCodec,          ///< Unknown, unavailable or inapplicable compression codec
    CompressionError,      ///< Codec library rejected input while compressing
    DecompressionError,    ///< Corrupt or truncated compressed data

    // Type
    TypeMismatch,          ///< Foreign handle does not match the declared mode
    BinaryExpected,        ///< Text-mode foreign handle where binary is required

    // Memory
    AllocationFailure,     ///< Memory pool exhausted or allocation refused

    // I/O
    IoError,               ///< Operating-system I/O failure (os_errno set)

    // Transfer
    TransferFailure,       ///< Error raised inside the transfer worker thread
};

/// Error payload returned through Result<T>.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Value-or-error return type used by every fallible operation.
template <typename T>
using Result = std::expected<T, Error>;

/// Return a short category string for an error code (e.g. "state", "codec").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ClosedStream:
            return "state";
        case ErrorCode::CapabilityViolation:
            return "capability";
        case ErrorCode::InvalidMode:
        case ErrorCode::InvalidArgument:
        case ErrorCode::OutOfRange:
            return "argument";
        case ErrorCode::InvalidCodec:
        case ErrorCode::CompressionError:
        case ErrorCode::DecompressionError:
            return "codec";
        case ErrorCode::TypeMismatch:
        case ErrorCode::BinaryExpected:
            return "type";
        case ErrorCode::AllocationFailure:
            return "memory";
        case ErrorCode::IoError:
            return "io";
        case ErrorCode::TransferFailure:
            return "transfer";
    }
    return "unknown";
}

/// Render an error as "<category>: <message>", with errno text when set.
std::string FormatError(const Error& e);

/// Shorthand for building an unexpected Error.
inline std::unexpected<Error> MakeError(ErrorCode code, std::string message,
                                        int os_errno = 0) {
    return std::unexpected(Error{code, std::move(message), os_errno});
}

}  // namespace streamkit
