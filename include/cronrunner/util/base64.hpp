#pragma once

#include "cronrunner/core/error.hpp"

#include <string>
#include <string_view>

namespace cronrunner {

/// Standard (padded) base64 alphabet. Embedded CR/LF are ignored.
[[nodiscard]] auto base64_decode(std::string_view encoded)
    -> Result<std::string>;

}  // namespace cronrunner
