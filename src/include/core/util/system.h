#pragma once

#include <string>

namespace lanbeam::core {

namespace system {

std::string Hostname();
std::string LocalIpv4Address(); // address of the interface holding the default route
std::string OperatingSystem();  // etc: Debian GNU/Linux 12 (bookworm) (x86_64)
std::string DeviceModel();      // short platform name announced to peers, etc: Linux

} // namespace system

} // namespace lanbeam::core
