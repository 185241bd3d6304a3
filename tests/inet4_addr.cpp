////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2021-2026 Vladislav Trifochkin
//
// License: see LICENSE file
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.16 Initial version.
//      2026.10.05 Added parsing and socket address tests.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "pfs/tftp/inet4_addr.hpp"
#include "pfs/tftp/socket4_addr.hpp"

TEST_CASE("inet4_addr") {
    tftp::inet4_addr any;
    tftp::inet4_addr loopback {127, 0, 0, 1};
    tftp::inet4_addr unicast {192, 168, 1, 1};

    CHECK_EQ(static_cast<std::uint32_t>(any), tftp::inet4_addr::any_addr_value);
    CHECK_EQ(static_cast<std::uint32_t>(unicast), 0xC0A80101u);

    CHECK(tftp::is_loopback(loopback));
    CHECK(tftp::is_loopback(tftp::inet4_addr{127, 1, 2, 3}));
    CHECK_FALSE(tftp::is_loopback(unicast));

    CHECK_EQ(tftp::to_string(unicast), std::string{"192.168.1.1"});
    CHECK_EQ(tftp::to_string(any), std::string{"0.0.0.0"});

    CHECK(any < loopback);
    CHECK(loopback != unicast);
}

TEST_CASE("inet4_addr parse") {
    auto a = tftp::inet4_addr::parse("10.0.200.255");
    REQUIRE(a);
    CHECK_EQ(*a, tftp::inet4_addr(10, 0, 200, 255));

    CHECK_FALSE(tftp::inet4_addr::parse(""));
    CHECK_FALSE(tftp::inet4_addr::parse("10.0.0"));
    CHECK_FALSE(tftp::inet4_addr::parse("10.0.0.1.1"));
    CHECK_FALSE(tftp::inet4_addr::parse("10.0..1"));
    CHECK_FALSE(tftp::inet4_addr::parse("10.0.0.256"));
    CHECK_FALSE(tftp::inet4_addr::parse("10.0.0.x"));
    CHECK_FALSE(tftp::inet4_addr::parse("1000.0.0.1"));
}

TEST_CASE("socket4_addr") {
    auto sa = tftp::socket4_addr::parse("127.0.0.1:69");
    REQUIRE(sa);
    CHECK_EQ(sa->addr, tftp::inet4_addr(127, 0, 0, 1));
    CHECK_EQ(sa->port, 69);
    CHECK_EQ(tftp::to_string(*sa), std::string{"127.0.0.1:69"});

    CHECK(*sa == (tftp::socket4_addr{tftp::inet4_addr{127, 0, 0, 1}, 69}));
    CHECK(*sa != (tftp::socket4_addr{tftp::inet4_addr{127, 0, 0, 1}, 70}));

    CHECK_FALSE(tftp::socket4_addr::parse("127.0.0.1"));
    CHECK_FALSE(tftp::socket4_addr::parse("127.0.0.1:"));
    CHECK_FALSE(tftp::socket4_addr::parse("127.0.0.1:0"));
    CHECK_FALSE(tftp::socket4_addr::parse("127.0.0.1:65536"));
    CHECK_FALSE(tftp::socket4_addr::parse("localhost:69"));
}
