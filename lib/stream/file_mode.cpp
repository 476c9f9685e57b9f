// SPDX-License-Identifier: MIT

// lib/stream/file_mode.cpp
#include "lib/stream/file_mode.hpp"

#include <fmt/format.h>

namespace streamkit {

Result<FileMode> ParseFileMode(std::string_view mode) {
    if (mode == "r" || mode == "rb") return FileMode::Read;
    if (mode == "w" || mode == "wb") return FileMode::Write;
    if (mode == "r+" || mode == "rb+" || mode == "r+b") return FileMode::ReadWrite;
    return MakeError(ErrorCode::InvalidMode,
                     fmt::format("invalid file mode '{}'", mode));
}

}  // namespace streamkit
