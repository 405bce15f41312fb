#pragma once
#include <string>
#include <string_view>

namespace version {
    constexpr std::string_view CURRENT_VERSION = "1.0.0";

    std::string userAgent();
}
