#pragma once

namespace ghmcp {

constexpr const char* kVersion = "0.4.0";

} // namespace ghmcp
