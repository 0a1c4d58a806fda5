#include "sbridge/core/platform.hpp"
#include "sbridge/link/serial_link.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace sbridge;

TEST(SerialLinkTest, MissingDeviceIsLinkOpenFailure) {
#ifdef SBRIDGE_PLATFORM_WINDOWS
    const std::string device = "COM250";
#else
    const std::string device = "/dev/sbridge_no_such_port";
#endif

    auto opened = link::SerialLink::open(device, 115200, std::chrono::milliseconds(100));
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::LinkOpenFailure);
    EXPECT_NE(opened.error().message.find(device), std::string::npos);
}
