#include <gtest/gtest.h>

#include "Config.hpp"
#include "Errors.hpp"
#include "Logging.hpp"

namespace chartwheel::test {

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto c = loadConfigFromString("");
    EXPECT_EQ(c.timezone, "America/New_York");
    EXPECT_TRUE(c.useFixedOffset);
    EXPECT_DOUBLE_EQ(c.fixedUtcOffset, -5.0);
    EXPECT_EQ(c.center, Center::Geocentric);
    EXPECT_EQ(c.houseSystem, HouseSystem::EqualAscCusp);
    EXPECT_EQ(c.zodiac, ZodiacMode::Tropical);
    EXPECT_EQ(c.frame, SiderealFrame::FaganBradley);
    EXPECT_DOUBLE_EQ(c.ayanamsaOffset, 0.0);
    EXPECT_TRUE(c.includeNodes);
    EXPECT_EQ(c.nodeType, NodeType::True);
    EXPECT_DOUBLE_EQ(c.orb, 6.0);

    auto tz = c.timezoneSpec();
    EXPECT_TRUE(tz.fixed);
    EXPECT_DOUBLE_EQ(tz.offsetHours, -5.0);
}

TEST(ConfigTest, ReadsEveryKey) {
    auto c = loadConfigFromString(R"(
timezone: Europe/London
use_fixed_offset: false
fixed_utc_offset: 1.0
center: helio
house_system: PLACIDUS
zodiac: sidereal
sidereal_frame: lahiri
ayanamsa_offset: 0.2103
include_nodes: false
node_type: mean
orb: 4.5
orbs: "8,5"
ephemeris_path: /usr/share/ephe
log_level: debug
)");
    EXPECT_EQ(c.timezone, "Europe/London");
    EXPECT_FALSE(c.useFixedOffset);
    EXPECT_EQ(c.center, Center::Heliocentric);
    EXPECT_EQ(c.houseSystem, HouseSystem::Placidus);
    EXPECT_EQ(c.zodiac, ZodiacMode::Sidereal);
    EXPECT_EQ(c.frame, SiderealFrame::Lahiri);
    EXPECT_DOUBLE_EQ(c.ayanamsaOffset, 0.2103);
    EXPECT_FALSE(c.includeNodes);
    EXPECT_EQ(c.nodeType, NodeType::Mean);
    EXPECT_EQ(c.ephemerisPath, "/usr/share/ephe");
    EXPECT_EQ(c.logLevel, "debug");

    auto tz = c.timezoneSpec();
    EXPECT_FALSE(tz.fixed);
    EXPECT_EQ(tz.tzid, "Europe/London");

    auto req = c.request();
    EXPECT_EQ(req.resolver.frame, SiderealFrame::Lahiri);
    EXPECT_DOUBLE_EQ(req.resolver.ayanamsaOffset, 0.2103);
    EXPECT_EQ(req.resolver.center, Center::Heliocentric);
    ASSERT_EQ(req.aspects.size(), 5u);
    EXPECT_DOUBLE_EQ(req.aspects[0].orb, 8.0);
    EXPECT_DOUBLE_EQ(req.aspects[1].orb, 5.0);
    EXPECT_DOUBLE_EQ(req.aspects[2].orb, 4.5);
}

TEST(ConfigTest, BadValuesAreConfigErrors) {
    EXPECT_THROW(loadConfigFromString("center: barycentric"), ConfigError);
    EXPECT_THROW(loadConfigFromString("house_system: koch"), ConfigError);
    EXPECT_THROW(loadConfigFromString("orb: wide"), ConfigError);
    EXPECT_THROW(loadConfigFromString("orbs: \"8,x\""), ConfigError);
    EXPECT_THROW(loadConfigFromString("[1, 2, 3]"), ConfigError);
    EXPECT_THROW(loadConfigFromString("timezone: [unclosed"), ConfigError);
    EXPECT_THROW(loadConfigFile("/nonexistent/chartwheel.yaml"), ConfigError);
}

TEST(LoggingTest, LevelNames) {
    EXPECT_NO_THROW(initLogging("warn"));
    EXPECT_NO_THROW(setLogLevel("off"));
    EXPECT_THROW(setLogLevel("chatty"), ConfigError);
}

}  // namespace chartwheel::test
