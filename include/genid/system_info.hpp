/**
 * @file system_info.hpp
 * @brief Build a default ClientMetadata from the host genid is running on.
 *
 * Used when a caller wants metadata-bearing identifiers but does not supply
 * its own record. Everything here is best effort: a failed query falls back
 * to a fixed value instead of reporting an error.
 */
#ifndef GENID_SYSTEM_INFO_HPP
#define GENID_SYSTEM_INFO_HPP

#include "genid/os_metadata.hpp"
#include <string>

namespace genid {

/// @brief Version assumed for the build platform when the release string is unusable.
OsVersion default_os_version();

/// @brief gethostname(2), or "unknown" if it fails or returns an empty name.
std::string detect_hostname();

/// @brief uname(2) release parsed with parse_os_version(), else default_os_version().
OsVersion detect_os_version();

/**
 * @brief Record for this machine: current_os_type(), detect_os_version(),
 *        detect_hostname(), no user agent.
 */
ClientMetadata from_system();

} // namespace genid

#endif // GENID_SYSTEM_INFO_HPP
