// Unit tests for address validation and CIDR range enumeration
#include <catch2/catch_test_macros.hpp>
#include "util/netaddress.hpp"

using namespace proxyscan::util;

TEST_CASE("ValidateAndNormalizeIP", "[util][netaddress]") {
    SECTION("IPv4-mapped IPv6 becomes IPv4") {
        auto result = ValidateAndNormalizeIP("::ffff:192.168.1.1");
        REQUIRE(result.has_value());
        REQUIRE(*result == "192.168.1.1");
    }

    SECTION("IPv6 is canonicalized") {
        auto result = ValidateAndNormalizeIP("2001:0db8:0000:0000:0000:0000:0000:0001");
        REQUIRE(result.has_value());
        REQUIRE(*result == "2001:db8::1");
    }

    SECTION("Plain addresses pass through") {
        REQUIRE(ValidateAndNormalizeIP("192.168.1.1") == "192.168.1.1");
        REQUIRE(ValidateAndNormalizeIP("0.0.0.0") == "0.0.0.0");
        REQUIRE(ValidateAndNormalizeIP("::1") == "::1");
    }

    SECTION("Invalid input") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("not-an-ip").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("example.com").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("2001:db8:::1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.2.3.4:80").has_value());
    }
}

TEST_CASE("ParseIPPort", "[util][netaddress]") {
    std::string ip;
    uint16_t port = 0;

    SECTION("IPv4 with port") {
        REQUIRE(ParseIPPort("203.0.113.9:8080", ip, port));
        REQUIRE(ip == "203.0.113.9");
        REQUIRE(port == 8080);
    }

    SECTION("Bracketed IPv6 with port") {
        REQUIRE(ParseIPPort("[2001:db8::1]:3128", ip, port));
        REQUIRE(ip == "2001:db8::1");
        REQUIRE(port == 3128);
    }

    SECTION("Port 0 is accepted") {
        port = 1;
        REQUIRE(ParseIPPort("203.0.113.9:0", ip, port));
        REQUIRE(ip == "203.0.113.9");
        REQUIRE(port == 0);
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(ParseIPPort("", ip, port));
        REQUIRE_FALSE(ParseIPPort("203.0.113.9", ip, port));
        REQUIRE_FALSE(ParseIPPort("203.0.113.9:", ip, port));
        REQUIRE_FALSE(ParseIPPort("203.0.113.9:65536", ip, port));
        REQUIRE_FALSE(ParseIPPort("203.0.113.9:80x", ip, port));
        REQUIRE_FALSE(ParseIPPort("2001:db8::1:8080", ip, port));
        REQUIRE_FALSE(ParseIPPort("[2001:db8::1]", ip, port));
        REQUIRE_FALSE(ParseIPPort("[]:80", ip, port));
        REQUIRE_FALSE(ParseIPPort("host.example:80", ip, port));
    }
}

TEST_CASE("IPNetwork: parsing", "[util][netaddress][cidr]") {
    SECTION("IPv4 range") {
        auto net = IPNetwork::Parse("192.168.1.0/24");
        REQUIRE(net.has_value());
        REQUIRE(net->network().to_string() == "192.168.1.0");
        REQUIRE(net->prefix_length() == 24);
        REQUIRE(net->ToString() == "192.168.1.0/24");
    }

    SECTION("Host bits are masked off") {
        auto net = IPNetwork::Parse("10.0.0.7/30");
        REQUIRE(net.has_value());
        REQUIRE(net->ToString() == "10.0.0.4/30");

        auto v6 = IPNetwork::Parse("2001:db8::ffff/112");
        REQUIRE(v6.has_value());
        REQUIRE(v6->ToString() == "2001:db8::/112");
    }

    SECTION("Invalid ranges") {
        REQUIRE_FALSE(IPNetwork::Parse("").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("192.168.1.0").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("/24").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("192.168.1.0/").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("192.168.1.0/33").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("192.168.1.0/-1").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("192.168.1.0/24x").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("not-a-subnet").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("2001:db8::/129").has_value());
    }

    SECTION("IPv6 ranges larger than 2^32 hosts are refused") {
        REQUIRE_FALSE(IPNetwork::Parse("2001:db8::/64").has_value());
        REQUIRE_FALSE(IPNetwork::Parse("2001:db8::/95").has_value());
        REQUIRE(IPNetwork::Parse("2001:db8::/96").has_value());
    }
}

TEST_CASE("IPNetwork: host enumeration", "[util][netaddress][cidr]") {
    SECTION("/24 excludes network and broadcast") {
        auto net = IPNetwork::Parse("192.168.1.0/24");
        REQUIRE(net->host_count() == 254);
        REQUIRE(net->host_at(0).to_string() == "192.168.1.1");
        REQUIRE(net->host_at(253).to_string() == "192.168.1.254");
    }

    SECTION("/30 has two hosts") {
        auto net = IPNetwork::Parse("198.51.100.0/30");
        REQUIRE(net->host_count() == 2);
        REQUIRE(net->host_at(0).to_string() == "198.51.100.1");
        REQUIRE(net->host_at(1).to_string() == "198.51.100.2");
    }

    SECTION("/31 uses both addresses") {
        auto net = IPNetwork::Parse("10.0.0.0/31");
        REQUIRE(net->host_count() == 2);
        REQUIRE(net->host_at(0).to_string() == "10.0.0.0");
        REQUIRE(net->host_at(1).to_string() == "10.0.0.1");
    }

    SECTION("/32 is a single host") {
        auto net = IPNetwork::Parse("127.0.0.1/32");
        REQUIRE(net->host_count() == 1);
        REQUIRE(net->host_at(0).to_string() == "127.0.0.1");
    }

    SECTION("/0 does not overflow") {
        auto net = IPNetwork::Parse("0.0.0.0/0");
        REQUIRE(net.has_value());
        REQUIRE(net->host_count() == IPNetwork::MAX_HOSTS - 2);
        REQUIRE(net->host_at(net->host_count() - 1).to_string() == "255.255.255.254");
    }

    SECTION("IPv6 excludes only the subnet-router anycast address") {
        auto net = IPNetwork::Parse("2001:db8::/126");
        REQUIRE(net->host_count() == 3);
        REQUIRE(net->host_at(0).to_string() == "2001:db8::1");
        REQUIRE(net->host_at(2).to_string() == "2001:db8::3");
    }

    SECTION("IPv6 /127 and /128") {
        REQUIRE(IPNetwork::Parse("2001:db8::/127")->host_count() == 2);
        auto single = IPNetwork::Parse("::1/128");
        REQUIRE(single->host_count() == 1);
        REQUIRE(single->host_at(0).to_string() == "::1");
    }

    SECTION("IPv6 enumeration carries across bytes") {
        auto net = IPNetwork::Parse("2001:db8::/112");
        REQUIRE(net->host_count() == 65535);
        REQUIRE(net->host_at(255).to_string() == "2001:db8::100");
        REQUIRE(net->host_at(65534).to_string() == "2001:db8::ffff");
    }
}
