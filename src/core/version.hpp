#pragma once

namespace cmdbridge {

constexpr const char* kVersion = "0.1.0";
constexpr const char* kServerName = "cmdbridge";

}  // namespace cmdbridge
