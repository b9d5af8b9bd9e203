#pragma once

#include <string>

namespace landrop::core {

namespace system {

std::string Hostname();    // without ".local" / ".localdomain" suffixes
std::string PlatformTag(); // "linux", "darwin", "win32", ...

} // namespace system

} // namespace landrop::core
