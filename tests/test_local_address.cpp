#include <gtest/gtest.h>

#include <boost/system/system_error.hpp>

#include "infrastructure/net/LocalAddress_Asio.hpp"

using burrow::host::domain::AddressFamily;
using burrow::host::infrastructure::net::is_local;

TEST(LocalAddress, LoopbackIsLocal) {
  EXPECT_TRUE(is_local("127.0.0.1", AddressFamily::ipv4));
  EXPECT_TRUE(is_local("0.0.0.0", AddressFamily::ipv4));
}

TEST(LocalAddress, DocumentationAddressIsNotLocal) {
  // TEST-NET-1 (RFC 5737) is never assigned to a host interface.
  EXPECT_FALSE(is_local("192.0.2.1", AddressFamily::ipv4));
}

TEST(LocalAddress, RepeatedCallsReleaseSockets) {
  // well above the usual 1024 descriptor limit
  for (int i = 0; i < 3000; ++i) {
    ASSERT_TRUE(is_local("127.0.0.1", AddressFamily::ipv4));
    ASSERT_FALSE(is_local("192.0.2.1", AddressFamily::ipv4));
  }
}

TEST(LocalAddress, MalformedAddressThrows) {
  EXPECT_THROW(is_local("not-an-ip", AddressFamily::ipv4), boost::system::system_error);
}

TEST(LocalAddress, FamilyMismatchThrows) {
  EXPECT_THROW(is_local("127.0.0.1", AddressFamily::ipv6), boost::system::system_error);
}
