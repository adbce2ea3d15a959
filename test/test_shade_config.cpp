#include <gtest/gtest.h>

#include <fake_publisher.h>
#include <shade_config.h>

#include <limits>

using namespace SHADY;

namespace {
    RawShadeMap twoShades() {
        return {
            {"kitchen", {{"open", "relay_1"}, {"close", "relay_2"}}},
            {"bedroom", {{"close", "relay_4"}, {"open", "relay_3"}}},
        };
    }
}

TEST(ShadeConfig, AcceptsValidMap) {
    std::vector<ShadeEntry> entries;
    std::string error;
    ASSERT_TRUE(validateShadeMap(twoShades(), entries, error)) << error;
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("kitchen", entries[0].name);
    EXPECT_EQ("relay_1", entries[0].openRelay);
    EXPECT_EQ("relay_2", entries[0].closeRelay);
    EXPECT_EQ("bedroom", entries[1].name);
    EXPECT_EQ("relay_3", entries[1].openRelay);
    EXPECT_EQ("relay_4", entries[1].closeRelay);
}

TEST(ShadeConfig, RejectsEmptyMap) {
    std::vector<ShadeEntry> entries;
    std::string error;
    EXPECT_FALSE(validateShadeMap({}, entries, error));
    EXPECT_FALSE(error.empty());
}

TEST(ShadeConfig, RejectsUnknownOp) {
    RawShadeMap raw = {{"kitchen", {{"open", "relay_1"}, {"up", "relay_2"}}}};
    std::vector<ShadeEntry> entries;
    std::string error;
    EXPECT_FALSE(validateShadeMap(raw, entries, error));
    EXPECT_EQ("op up is not one of open, close", error);
}

TEST(ShadeConfig, RejectsMissingRelay) {
    RawShadeMap raw = {{"kitchen", {{"open", "relay_1"}}}};
    std::vector<ShadeEntry> entries;
    std::string error;
    EXPECT_FALSE(validateShadeMap(raw, entries, error));
}

TEST(ShadeConfig, RejectsSameRelayForBothOps) {
    RawShadeMap raw = {{"kitchen", {{"open", "relay_1"}, {"close", "relay_1"}}}};
    std::vector<ShadeEntry> entries;
    std::string error;
    EXPECT_FALSE(validateShadeMap(raw, entries, error));
    EXPECT_EQ("found duplicate relay for cover kitchen", error);
}

TEST(ShadeConfig, RejectsRelaySharedAcrossShades) {
    RawShadeMap raw = twoShades();
    raw[1].second[1].second = "relay_2";
    std::vector<ShadeEntry> entries;
    std::string error;
    EXPECT_FALSE(validateShadeMap(raw, entries, error));
    EXPECT_EQ("Non-unique relay name relay_2", error);
    EXPECT_TRUE(entries.empty());
}

TEST(ShadeConfig, RejectsBadNames) {
    std::vector<ShadeEntry> entries;
    std::string error;
    EXPECT_FALSE(validateShadeMap({{"living room", {{"open", "r1"}, {"close", "r2"}}}}, entries, error));
    EXPECT_FALSE(validateShadeMap({{"kitchen", {{"open", "r/1"}, {"close", "r2"}}}}, entries, error));
    EXPECT_FALSE(validateShadeMap({{"kitchen", {{"open", "r1"}, {"close", "r2"}}},
                                   {"kitchen", {{"open", "r3"}, {"close", "r4"}}}}, entries, error));
}

TEST(ShadeConfig, AcceptsDefaultSettings) {
    std::string error;
    EXPECT_TRUE(validateSettings(testSettings(), error)) << error;
}

TEST(ShadeConfig, RejectsBadSettings) {
    std::string error;
    ControllerSettings settings = testSettings();
    settings.tickMs = 0;
    EXPECT_FALSE(validateSettings(settings, error));

    settings = testSettings();
    settings.maxPosition = 0;
    EXPECT_FALSE(validateSettings(settings, error));

    settings = testSettings();
    settings.relayBase = "shady/relays";
    EXPECT_FALSE(validateSettings(settings, error));

    // increment rounds to 0
    settings = testSettings();
    settings.tickMs = 100;
    settings.travelTimeMs = 60000;
    EXPECT_FALSE(validateSettings(settings, error));
}

TEST(ShadeConfig, RejectsScaleThatWouldOverflow) {
    std::string error;
    ControllerSettings settings = testSettings();
    settings.tickMs = 1000;
    settings.travelTimeMs = 1000;
    settings.maxPosition = std::numeric_limits<int>::max();
    EXPECT_FALSE(validateSettings(settings, error));
    EXPECT_EQ("max position too large", error);

    settings.travelTimeMs = 10000;
    settings.maxPosition = 1000000000;
    EXPECT_TRUE(validateSettings(settings, error)) << error;
}

TEST(ShadeConfig, SettingNumbersAreUnsignedDecimal) {
    uint32_t value = 7;
    EXPECT_TRUE(parseSettingNumber("500", 0xFFFFFFFFu, value));
    EXPECT_EQ(500u, value);
    EXPECT_TRUE(parseSettingNumber("4294967295", 0xFFFFFFFFu, value));
    EXPECT_EQ(4294967295u, value);

    value = 7;
    EXPECT_FALSE(parseSettingNumber("-1", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber("+1", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber(" 1", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber("", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber("12ms", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber("4294967296", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber("99999999999999999999999", 0xFFFFFFFFu, value));
    EXPECT_FALSE(parseSettingNumber("65536", 0xFFFF, value));
    EXPECT_EQ(7u, value);
}
