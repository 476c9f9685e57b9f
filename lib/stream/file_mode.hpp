// SPDX-License-Identifier: MIT

// lib/stream/file_mode.hpp
#pragma once

#include <string_view>

#include "lib/stream/error.hpp"

namespace streamkit {

/// Access mode of a file-like stream.
enum class FileMode {
    Read,       ///< "r", "rb"
    Write,      ///< "w", "wb"
    ReadWrite,  ///< "r+", "rb+", "r+b"
};

/// Parse a mode string. Anything outside the recognized set is InvalidMode.
Result<FileMode> ParseFileMode(std::string_view mode);

/// Canonical binary mode string ("rb", "wb", "rb+").
constexpr std::string_view ModeString(FileMode mode) {
    switch (mode) {
        case FileMode::Read: return "rb";
        case FileMode::Write: return "wb";
        case FileMode::ReadWrite: return "rb+";
    }
    return "";
}

constexpr bool ModeReads(FileMode mode) { return mode != FileMode::Write; }
constexpr bool ModeWrites(FileMode mode) { return mode != FileMode::Read; }

}  // namespace streamkit
