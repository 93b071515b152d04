#include <cstddef>
#include <string>

#include <gtest/gtest.h>

#include "CommandLine.hpp"
#include "Errors.hpp"
#include "FakeEphemeris.hpp"

namespace chartwheel::test {

namespace {

template <std::size_t N>
bpo::variables_map parse(const char* const (&argv)[N]) {
    return parseCommandLine(static_cast<int>(N), argv, commandLineOptions());
}

}  // namespace

TEST(CommandLineTest, TypedOptionsAndCommand) {
    const char* const argv[] = { "chartwheel", "chart", "--date", "1990-01-15", "--offset=-4",
                                 "--lat", "51.5", "--lon=-0.12", "--houses", "P", "--nodes", "none",
                                 "--orb", "4", "--grid" };
    auto vm = parse(argv);
    EXPECT_EQ(vm["command"].as<std::string>(), "chart");
    EXPECT_EQ(vm.count("grid"), 1u);
    EXPECT_EQ(vm.count("wheel"), 0u);

    auto cfg = applyOptions(ChartConfig{}, vm);
    EXPECT_TRUE(cfg.useFixedOffset);
    EXPECT_DOUBLE_EQ(cfg.fixedUtcOffset, -4.0);
    EXPECT_EQ(cfg.houseSystem, HouseSystem::Placidus);
    EXPECT_FALSE(cfg.includeNodes);
    EXPECT_DOUBLE_EQ(cfg.orb, 4.0);

    auto req = chartRequest(cfg, vm);
    EXPECT_EQ(req.date, "1990-01-15");
    EXPECT_EQ(req.time, "23:33");
    ASSERT_TRUE(req.location.has_value());
    EXPECT_DOUBLE_EQ(req.location->latitude, 51.5);
    EXPECT_DOUBLE_EQ(req.location->longitude, -0.12);
    EXPECT_DOUBLE_EQ(req.aspects[0].orb, 4.0);
}

TEST(CommandLineTest, TzOverridesFixedOffsetFromConfig) {
    const char* const argv[] = { "chartwheel", "chart", "--tz", "Europe/Paris", "--zodiac", "sidereal",
                                 "--frame", "lahiri", "--ayanamsa-offset", "0.25" };
    auto cfg = applyOptions(ChartConfig{}, parse(argv));
    EXPECT_FALSE(cfg.useFixedOffset);
    EXPECT_EQ(cfg.timezone, "Europe/Paris");
    EXPECT_EQ(cfg.zodiac, ZodiacMode::Sidereal);
    EXPECT_EQ(cfg.frame, SiderealFrame::Lahiri);
    EXPECT_DOUBLE_EQ(cfg.ayanamsaOffset, 0.25);
}

TEST(CommandLineTest, BadArgumentsAreMalformedInput) {
    const char* const notNumber[] = { "chartwheel", "chart", "--lat", "north" };
    EXPECT_THROW(parse(notNumber), MalformedInputError);

    const char* const unknown[] = { "chartwheel", "chart", "--colour", "red" };
    EXPECT_THROW(parse(unknown), MalformedInputError);

    const char* const latOnly[] = { "chartwheel", "chart", "--lat", "40" };
    auto vm = parse(latOnly);
    EXPECT_THROW(chartRequest(ChartConfig{}, vm), MalformedInputError);

    const char* const badCenter[] = { "chartwheel", "chart", "--center", "barycentric" };
    EXPECT_THROW(applyOptions(ChartConfig{}, parse(badCenter)), MalformedInputError);
}

TEST(CommandLineTest, ExportNeedsBothEnds) {
    const char* const argv[] = { "chartwheel", "export", "--start", "2000-01-01 00:00", "--step", "6h" };
    EXPECT_THROW(exportRequest(ChartConfig{}, parse(argv)), MalformedInputError);

    const char* const full[] = { "chartwheel", "export", "--start", "2000-01-01 00:00",
                                 "--end", "2000-01-02 00:00", "--step", "6h", "--center", "helio" };
    auto vm = parse(full);
    auto opt = exportRequest(applyOptions(ChartConfig{}, vm), vm);
    EXPECT_EQ(opt.step, ExportStep::SixHours);
    EXPECT_EQ(opt.end.day, 2);
    EXPECT_EQ(opt.resolver.center, Center::Heliocentric);
}

class ChartDisplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        req.includeNodes = true;
        req.houseSystem = HouseSystem::Placidus;
        req.location = GeoLocation{ 70.0, 20.0 };
    }

    FakeEphemeris fake;
    ChartRequest req;
};

TEST_F(ChartDisplayTest, DegenerateHousesStillGivePositionsAndAspects) {
    ChartSnapshot S;
    ASSERT_NO_THROW(S = computeChartForDisplay(fake, req, "America/New_York"));
    EXPECT_FALSE(S.houses.has_value());
    EXPECT_EQ(S.bodies.size(), 12u);
    EXPECT_FALSE(S.aspects.empty());
    EXPECT_EQ(fake.houseCalls, 0);

    // computeChart itself keeps reporting the failure
    EXPECT_THROW(computeChart(fake, req), HouseSystemDegenerateError);
}

TEST_F(ChartDisplayTest, EqualHousesWorkAtTheSameLatitude) {
    req.houseSystem = HouseSystem::EqualAscCusp;
    fake.houseAnswer.ascendant = 123.0;
    auto S = computeChartForDisplay(fake, req, "America/New_York");
    ASSERT_TRUE(S.houses.has_value());
    EXPECT_DOUBLE_EQ(S.houses->cusps[0], 123.0);
}

TEST_F(ChartDisplayTest, InvalidCoordinatesStillFail) {
    req.location = GeoLocation{ 95.0, 0.0 };
    EXPECT_THROW(computeChartForDisplay(fake, req, "America/New_York"), InvalidCoordinateError);
}

TEST_F(ChartDisplayTest, UnknownZoneFallsBack) {
    req.location.reset();
    req.timezone = TimezoneSpec::named("Mars/Olympus_Mons");
    auto S = computeChartForDisplay(fake, req, "America/New_York");

    auto expected = resolveLocalTime(parseCivil(req.date, req.time), TimezoneSpec::named("America/New_York"));
    EXPECT_DOUBLE_EQ(S.time.moment.julianDayUT(), expected.moment.julianDayUT());

    EXPECT_THROW(computeChartForDisplay(fake, req, ""), UnknownTimezoneError);
    EXPECT_THROW(computeChartForDisplay(fake, req, "Mars/Olympus_Mons"), UnknownTimezoneError);
}

}  // namespace chartwheel::test
