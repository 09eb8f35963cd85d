#include <gtest/gtest.h>

#include "setup/dns_probe.hpp"

using namespace speakerctrl::setup;

TEST(DnsProbeTest, QueryCarriesLengthPrefixAndLabels) {
  // header 12 + "\x0a" aftertouch "\x04" test "\x00" + qtype/qclass 4
  auto escaped = dns_query_escape("aftertouch.test", 0xaaaa);
  EXPECT_EQ(escaped.rfind("\\x00\\x21\\xaa\\xaa\\x01\\x00", 0), 0u);
  EXPECT_NE(escaped.find("\\x0aaftertouch\\x04test\\x00"), std::string::npos);
  EXPECT_EQ(escaped.substr(escaped.size() - 16), "\\x00\\x01\\x00\\x01");
}

TEST(DnsProbeTest, OdOutputParsesToDottedQuad) {
  EXPECT_EQ(parse_od_ipv4(" 192 168   1  50\n"),
            std::optional<std::string>("192.168.1.50"));
  EXPECT_FALSE(parse_od_ipv4("192 168 1").has_value());
  EXPECT_FALSE(parse_od_ipv4("192 168 1 256").has_value());
  EXPECT_FALSE(parse_od_ipv4("").has_value());
}

TEST(DnsProbeTest, PortOfBindAddress) {
  EXPECT_EQ(dns_port_of(":53"), "53");
  EXPECT_EQ(dns_port_of("0.0.0.0:5353"), "5353");
  EXPECT_EQ(dns_port_of("5300"), "5300");
  EXPECT_EQ(dns_port_of(""), "53");
}
