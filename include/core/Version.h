#pragma once

namespace ViewPane::Core {

constexpr const char* kVersion = "0.3.0";

} // namespace ViewPane::Core
