#include <gtest/gtest.h>

#include "device/live_device_info.hpp"
#include "util/string_util.hpp"
#include "util/xml_text.hpp"

using namespace speakerctrl;

TEST(StringUtilTest, UrlParts) {
  EXPECT_EQ(stringutil::url_hostname("http://192.168.1.50:8000/marge"),
            "192.168.1.50");
  EXPECT_EQ(stringutil::url_hostname("https://user@svc.lan/x"), "svc.lan");
  EXPECT_EQ(stringutil::url_hostname("http://[fe80::1]:8000"), "fe80::1");
  EXPECT_EQ(stringutil::url_hostname("not a url"), "");
  EXPECT_EQ(stringutil::url_port("http://svc:8000/x"),
            std::optional<std::string>("8000"));
  EXPECT_FALSE(stringutil::url_port("http://svc/x").has_value());
}

TEST(StringUtilTest, IpLiteral) {
  EXPECT_TRUE(stringutil::is_ip_literal("10.0.0.1"));
  EXPECT_TRUE(stringutil::is_ip_literal("::1"));
  EXPECT_FALSE(stringutil::is_ip_literal("svc.lan"));
  EXPECT_FALSE(stringutil::is_ip_literal(""));
}

TEST(StringUtilTest, LinesAndFields) {
  auto lines = stringutil::split_lines("a\r\nb\n\nc");
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[2], "");
  auto fields = stringutil::split_fields("  10.0.0.1\t host  alias ");
  ASSERT_EQ(fields.size(), 3u);
  EXPECT_EQ(fields[1], "host");
  EXPECT_EQ(stringutil::between_parens("PING x (10.0.0.1): 56"),
            std::optional<std::string>("10.0.0.1"));
}

TEST(XmlTextTest, ElementsAndAttributes) {
  const std::string xml =
      R"(<info deviceID="A0F6FD123456" type="x"><name>Kitchen &amp; Bar</name>)"
      R"(<empty/></info>)";
  EXPECT_EQ(xmltext::attribute(xml, "info", "deviceID"),
            std::optional<std::string>("A0F6FD123456"));
  EXPECT_EQ(xmltext::element_text(xml, "name"),
            std::optional<std::string>("Kitchen & Bar"));
  EXPECT_EQ(xmltext::element_text(xml, "empty"), std::optional<std::string>(""));
  EXPECT_FALSE(xmltext::element_text(xml, "nam").has_value());
  EXPECT_EQ(xmltext::escape("<a & 'b'>"), "&lt;a &amp; &apos;b&apos;&gt;");
}

TEST(LiveDeviceInfoTest, ParsesInfoDocument) {
  const std::string xml = R"(<?xml version="1.0" encoding="UTF-8" ?>
<info deviceID="A0F6FD123456">
  <name>Living Room</name>
  <type>SoundTouch 10</type>
  <margeAccountUUID>3230304</margeAccountUUID>
  <components>
    <component>
      <componentCategory>SCM</componentCategory>
      <softwareVersion>27.0.6.46330.5043500</softwareVersion>
      <serialNumber>I6332527703739342000020</serialNumber>
    </component>
    <component>
      <componentCategory>PackagedProduct</componentCategory>
      <serialNumber>069231P63364828AE</serialNumber>
    </component>
  </components>
</info>)";
  auto r = parse_live_device_info(xml);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  const auto &info = r.value();
  EXPECT_EQ(info.device_id, "A0F6FD123456");
  EXPECT_EQ(info.name, "Living Room");
  EXPECT_EQ(info.type, "SoundTouch 10");
  EXPECT_EQ(info.account_id, "3230304");
  EXPECT_EQ(info.firmware_version, "27.0.6.46330.5043500");
  EXPECT_EQ(info.serial, "I6332527703739342000020");
}

TEST(LiveDeviceInfoTest, RejectsOtherDocuments) {
  EXPECT_TRUE(parse_live_device_info("<status>ok</status>").is_err());
}
