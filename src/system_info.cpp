// -----------------------------------------------------------------------------
// @file system_info.cpp
// @brief POSIX probes for the default ClientMetadata.
// -----------------------------------------------------------------------------
#include "genid/system_info.hpp"

#include <limits.h>
#include <sys/utsname.h>
#include <unistd.h>       // gethostname

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

namespace genid {

OsVersion default_os_version() {
    switch (current_os_type()) {
        case OsType::Linux:   return OsVersion{6, 0};
        case OsType::MacOS:   return OsVersion{14, 0};
        case OsType::Windows: return OsVersion{10, 0};
        default:              return OsVersion{0, 0};
    }
}

std::string detect_hostname() {
    char buf[HOST_NAME_MAX + 1] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "unknown";
    }
    return std::string(buf);
}

OsVersion detect_os_version() {
    struct utsname info;
    if (::uname(&info) != 0) return default_os_version();
    return parse_os_version(info.release, default_os_version());
}

ClientMetadata from_system() {
    return ClientMetadata(current_os_type(), detect_os_version(), detect_hostname());
}

} // namespace genid
