#include <doctest/doctest.h>
#include "genid/system_info.hpp"

using namespace genid;

TEST_CASE("from_system describes this machine") {
    ClientMetadata m = from_system();
    CHECK(m.os_type == current_os_type());
    CHECK_FALSE(m.hostname.empty());
    CHECK_FALSE(m.user_agent.has_value());
    CHECK(m.os_version.major_version <= 31);
    CHECK(m.os_version.minor_version <= 15);
}

TEST_CASE("probe pieces agree with from_system") {
    ClientMetadata m = from_system();
    CHECK(m.hostname == detect_hostname());
    CHECK(m.os_version == detect_os_version());
}

#if defined(__linux__)
TEST_CASE("linux defaults") {
    CHECK(current_os_type() == OsType::Linux);
    CHECK(default_os_version() == OsVersion{6, 0});
}
#endif
