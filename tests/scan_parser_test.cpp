#include "iwscan/scan_parser.hpp"
#include "iwscan/scan_error.hpp"

#include <gtest/gtest.h>

using namespace iwscan;

namespace {

const char* kTwoNetworks = R"(wlan0     Scan completed :
          Cell 01 - Address: 00:11:22:33:44:55
                    Channel:6
                    Frequency:2.437 GHz (Channel 6)
                    Quality=70/70  Signal level=-40 dBm
                    Encryption key:on
                    ESSID:"HomeNet"
                    Bit Rates:1 Mb/s; 2 Mb/s; 5.5 Mb/s; 11 Mb/s; 6 Mb/s
                              9 Mb/s; 12 Mb/s; 18 Mb/s
                    Bit Rates:24 Mb/s; 36 Mb/s; 48 Mb/s; 54 Mb/s
                    Mode:Master
                    Extra:tsf=0000000000000000
                    Extra: Last beacon: 12ms ago
                    IE: Unknown: 0007486F6D654E6574
                    IE: IEEE 802.11i/WPA2 Version 1
                        Group Cipher : CCMP
                        Pairwise Ciphers (1) : CCMP
                        Authentication Suites (1) : PSK
          Cell 02 - Address: 66:77:88:99:AA:BB
                    Channel:11
                    Frequency:2.462 GHz (Channel 11)
                    Quality=30/70  Signal level=-80 dBm
                    ESSID:""
                    Mode:Master

)";

std::string block(const std::string& address, const std::string& body) {
    return "          Cell 01 - Address: " + address + "\n" + body;
}

class ScanParserTest : public ::testing::Test {
protected:
    ScanParser parser;
};

} // namespace

TEST_F(ScanParserTest, ParsesNamedAndHiddenNetworks) {
    ScanResult result = parser.parse(kTwoNetworks);

    ASSERT_EQ(result.size(), 2u);

    const NetworkRecord& home = result.networks[0];
    ASSERT_TRUE(home.essid.has_value());
    EXPECT_EQ(*home.essid, "HomeNet");
    EXPECT_EQ(home.encryption, Encryption::WPA2);

    const NetworkRecord& hidden = result.networks[1];
    EXPECT_FALSE(hidden.essid.has_value());
    EXPECT_EQ(hidden.encryption, Encryption::Open);
}

TEST_F(ScanParserTest, KeepsToolOrder) {
    std::string text = "wlan0     Scan completed :\n";
    text += "          Cell 01 - Address: 00:00:00:00:00:03\n"
            "                    ESSID:\"zulu\"\n";
    text += "          Cell 02 - Address: 00:00:00:00:00:01\n"
            "                    ESSID:\"alpha\"\n";
    text += "          Cell 03 - Address: 00:00:00:00:00:02\n"
            "                    ESSID:\"alpha\"\n";

    ScanResult result = parser.parse(text);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result.networks[0].bssid, "00:00:00:00:00:03");
    EXPECT_EQ(result.networks[1].bssid, "00:00:00:00:00:01");
    EXPECT_EQ(result.networks[2].bssid, "00:00:00:00:00:02");
    EXPECT_EQ(*result.networks[2].essid, "alpha");
}

TEST_F(ScanParserTest, ParsesMetadata) {
    ScanResult result = parser.parse(kTwoNetworks);
    const NetworkRecord& home = result.networks[0];

    EXPECT_EQ(home.bssid, "00:11:22:33:44:55");
    EXPECT_EQ(home.channel, 6);
    EXPECT_EQ(home.frequencyMhz, 2437u);
    EXPECT_EQ(home.signalDbm, -40);
    EXPECT_EQ(home.quality, 70);
    EXPECT_EQ(home.qualityMax, 70);
    ASSERT_TRUE(home.maxBitrateMbps.has_value());
    EXPECT_DOUBLE_EQ(*home.maxBitrateMbps, 54.0);
    EXPECT_EQ(home.mode, WirelessMode::Master);
    EXPECT_EQ(home.groupCipher, "CCMP");
    EXPECT_EQ(home.pairwiseCiphers, std::vector<std::string>{"CCMP"});
    EXPECT_EQ(home.authSuites, std::vector<std::string>{"PSK"});
}

TEST_F(ScanParserTest, EmptyInputIsMalformed) {
    EXPECT_THROW(parser.parse(""), MalformedOutput);
}

TEST_F(ScanParserTest, WhitespaceInputIsMalformed) {
    try {
        parser.parse("  \n\t\n   ");
        FAIL() << "expected MalformedOutput";
    } catch (const ScanError& e) {
        EXPECT_EQ(e.kind(), ScanErrorKind::MalformedOutput);
    }
}

TEST_F(ScanParserTest, TextWithoutBlocksIsMalformed) {
    EXPECT_THROW(parser.parse("wlan0     Scan completed :\n"), MalformedOutput);
    EXPECT_THROW(parser.parse("something else entirely\n"), MalformedOutput);
}

TEST_F(ScanParserTest, NoScanResultsIsEmptySuccess) {
    ScanResult result = parser.parse("wlan0     No scan results\n\n");
    EXPECT_TRUE(result.empty());
}

TEST_F(ScanParserTest, MissingEssidFieldIsHidden) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Channel:1\n"));

    ASSERT_EQ(result.size(), 1u);
    EXPECT_FALSE(result.networks[0].essid.has_value());
    EXPECT_EQ(result.networks[0].encryption, Encryption::Open);
}

TEST_F(ScanParserTest, HeaderOnlyBlockIsKept) {
    ScanResult result = parser.parse("Cell 01 - Address: AA:AA:AA:AA:AA:AA\n");

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.networks[0].bssid, "AA:AA:AA:AA:AA:AA");
    EXPECT_FALSE(result.networks[0].channel.has_value());
}

TEST_F(ScanParserTest, NulEssidIsHidden) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    ESSID:\"\\x00\\x00\\x00\\x00\"\n"));

    EXPECT_FALSE(result.networks[0].essid.has_value());
}

TEST_F(ScanParserTest, DecodesEscapedEssid) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    ESSID:\"Caf\\xC3\\xA9 Wifi\"\n"));

    ASSERT_TRUE(result.networks[0].essid.has_value());
    EXPECT_EQ(*result.networks[0].essid, "Caf\xC3\xA9 Wifi");
}

TEST_F(ScanParserTest, NonFiniteBitRatesAreIgnored) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Bit Rates:nan Mb/s; 11 Mb/s; inf Mb/s\n"
        "                    Frequency:nan GHz\n"));

    const NetworkRecord& net = result.networks[0];
    ASSERT_TRUE(net.maxBitrateMbps.has_value());
    EXPECT_DOUBLE_EQ(*net.maxBitrateMbps, 11.0);
    EXPECT_FALSE(net.frequencyMhz.has_value());
    EXPECT_EQ(net.toJson().find("nan"), std::string::npos);
}

TEST_F(ScanParserTest, NanOnlyBitRatesLeaveRateUnset) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Bit Rates:nan Mb/s\n"));

    EXPECT_FALSE(result.networks[0].maxBitrateMbps.has_value());
}

TEST_F(ScanParserTest, KeyWithoutElementsIsWep) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Encryption key:on\n"
        "                    ESSID:\"legacy\"\n"));

    EXPECT_EQ(result.networks[0].encryption, Encryption::WEP);
}

TEST_F(ScanParserTest, KeyOffIsOpen) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Encryption key:off\n"
        "                    ESSID:\"cafe\"\n"));

    EXPECT_EQ(result.networks[0].encryption, Encryption::Open);
}

TEST_F(ScanParserTest, WpaOnly) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Encryption key:on\n"
        "                    IE: WPA Version 1\n"
        "                        Group Cipher : TKIP\n"
        "                        Pairwise Ciphers (1) : TKIP\n"
        "                        Authentication Suites (1) : PSK\n"));

    const NetworkRecord& net = result.networks[0];
    EXPECT_EQ(net.encryption, Encryption::WPA);
    EXPECT_EQ(net.groupCipher, "TKIP");
}

TEST_F(ScanParserTest, MixedWpaAndWpa2CollapsesToWpa2) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Encryption key:on\n"
        "                    IE: WPA Version 1\n"
        "                        Group Cipher : TKIP\n"
        "                        Pairwise Ciphers (2) : CCMP TKIP\n"
        "                        Authentication Suites (1) : PSK\n"
        "                    IE: IEEE 802.11i/WPA2 Version 1\n"
        "                        Group Cipher : TKIP\n"
        "                        Pairwise Ciphers (2) : CCMP TKIP\n"
        "                        Authentication Suites (1) : PSK\n"));

    const NetworkRecord& net = result.networks[0];
    EXPECT_EQ(net.encryption, Encryption::WPA2);
    std::vector<std::string> expected{"CCMP", "TKIP"};
    EXPECT_EQ(net.pairwiseCiphers, expected);
}

TEST_F(ScanParserTest, Wpa2ListedBeforeWpaStillWins) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    IE: IEEE 802.11i/WPA2 Version 1\n"
        "                        Group Cipher : CCMP\n"
        "                    IE: WPA Version 1\n"
        "                        Group Cipher : TKIP\n"));

    EXPECT_EQ(result.networks[0].encryption, Encryption::WPA2);
    EXPECT_EQ(result.networks[0].groupCipher, "CCMP");
}

TEST_F(ScanParserTest, SaeSuiteIsWpa3) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    IE: IEEE 802.11i/WPA2 Version 1\n"
        "                        Group Cipher : CCMP\n"
        "                        Pairwise Ciphers (1) : CCMP\n"
        "                        Authentication Suites (2) : PSK SAE\n"));

    EXPECT_EQ(result.networks[0].encryption, Encryption::WPA3);
}

TEST_F(ScanParserTest, UnknownSuiteEightIsWpa3) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    IE: IEEE 802.11i/WPA2 Version 1\n"
        "                        Group Cipher : CCMP\n"
        "                        Pairwise Ciphers (1) : CCMP\n"
        "                        Authentication Suites (1) : unknown (8)\n"));

    const NetworkRecord& net = result.networks[0];
    EXPECT_EQ(net.encryption, Encryption::WPA3);
    EXPECT_EQ(net.authSuites, std::vector<std::string>{"unknown (8)"});
}

TEST_F(ScanParserTest, RelativeSignalLevelIsIgnored) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Quality:40/100  Signal level:45/100  Noise level:0/100\n"));

    const NetworkRecord& net = result.networks[0];
    EXPECT_FALSE(net.signalDbm.has_value());
    EXPECT_EQ(net.quality, 40);
    EXPECT_EQ(net.qualityMax, 100);
}

TEST_F(ScanParserTest, ChannelFromFrequencyLine) {
    ScanResult result = parser.parse(block("AA:AA:AA:AA:AA:AA",
        "                    Frequency:5.745 GHz (Channel 149)\n"));

    EXPECT_EQ(result.networks[0].channel, 149);
    EXPECT_EQ(result.networks[0].frequencyMhz, 5745u);
}

TEST(DecodeEssidTest, HandlesQuotingAndHiddenForms) {
    EXPECT_EQ(decodeEssid("\"HomeNet\""), std::optional<std::string>("HomeNet"));
    EXPECT_EQ(decodeEssid("\"with space\""), std::optional<std::string>("with space"));
    EXPECT_FALSE(decodeEssid("\"\"").has_value());
    EXPECT_FALSE(decodeEssid("off/any").has_value());
    EXPECT_FALSE(decodeEssid("").has_value());
    EXPECT_EQ(decodeEssid("\"a\\x41\""), std::optional<std::string>("aA"));
    EXPECT_EQ(decodeEssid("\"\\x-1ab\""), std::optional<std::string>("\\x-1ab"));
    EXPECT_EQ(decodeEssid("\"\\x 1z\""), std::optional<std::string>("\\x 1z"));
    EXPECT_EQ(decodeEssid("\"\\x4g\""), std::optional<std::string>("\\x4g"));
}

TEST(ParseFrequencyTest, ConvertsUnits) {
    EXPECT_EQ(parseFrequencyMhz("2.412 GHz"), std::optional<uint32_t>(2412));
    EXPECT_EQ(parseFrequencyMhz("5180 MHz"), std::optional<uint32_t>(5180));
    EXPECT_EQ(parseFrequencyMhz("2.437"), std::optional<uint32_t>(2437));
    EXPECT_FALSE(parseFrequencyMhz("unknown").has_value());
}
