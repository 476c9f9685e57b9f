// SPDX-License-Identifier: MIT

// lib/stream/error.cpp
#include "lib/stream/error.hpp"

#include <fmt/format.h>

#include <cstring>

namespace streamkit {

std::string FormatError(const Error& e) {
    if (e.os_errno != 0) {
        return fmt::format("{}: {} (errno {}: {})", error_category(e.code),
                           e.message, e.os_errno, std::strerror(e.os_errno));
    }
    return fmt::format("{}: {}", error_category(e.code), e.message);
}

}  // namespace streamkit
