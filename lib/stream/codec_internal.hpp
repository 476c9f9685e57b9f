// SPDX-License-Identifier: MIT

// lib/stream/codec_internal.hpp
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "lib/stream/codec.hpp"

// Per-algorithm factories. Each is defined in its own source file, which is
// only compiled when the library was found.
namespace streamkit::internal {

Result<std::unique_ptr<Codec>> MakeZstdCodec(int compression_level);
Result<std::unique_ptr<Codec>> MakeGzipCodec(int compression_level);
Result<std::unique_ptr<Codec>> MakeBz2Codec(int compression_level);
Result<std::unique_ptr<Codec>> MakeBrotliCodec(int compression_level);
Result<std::unique_ptr<Codec>> MakeLz4Codec(int compression_level);
Result<std::unique_ptr<Codec>> MakeSnappyCodec(int compression_level);

/// Shared failure for algorithms without a streaming form.
inline std::unexpected<Error> NoStreamingForm(CompressionType type) {
    return MakeError(ErrorCode::InvalidCodec,
                     std::string(CompressionTypeName(type)) +
                         " codec has no streaming form");
}

/// Build a streaming context, turning a library refusal to create it into
/// CompressionError.
template <typename Context, typename Interface, typename... Args>
Result<std::shared_ptr<Interface>> MakeContext(Args&&... args) {
    try {
        return std::shared_ptr<Interface>(std::make_shared<Context>(std::forward<Args>(args)...));
    } catch (const std::runtime_error& e) {
        return MakeError(ErrorCode::CompressionError, e.what());
    } catch (const std::bad_alloc&) {
        return MakeError(ErrorCode::AllocationFailure, "out of memory creating codec context");
    }
}

}  // namespace streamkit::internal
