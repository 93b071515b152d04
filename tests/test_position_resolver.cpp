#include <gtest/gtest.h>

#include "FakeEphemeris.hpp"
#include "PositionResolver.hpp"
#include "SwissEphemeris.hpp"

namespace chartwheel::test {

class PositionResolverTest : public ::testing::Test {
protected:
    FakeEphemeris fake;
    Moment t{2437848.689583333};
};

TEST_F(PositionResolverTest, TropicalLongitudeIsNormalized) {
    fake.longitudes[Body::Sun] = -30.0;
    fake.longitudes[Body::Moon] = 725.0;
    PositionResolver r(fake);

    EXPECT_DOUBLE_EQ(r.tropicalLongitude(t, Body::Sun), 330.0);
    EXPECT_DOUBLE_EQ(r.tropicalLongitude(t, Body::Moon), 5.0);
}

TEST_F(PositionResolverTest, SiderealIsTropicalMinusAyanamsa) {
    fake.ayanamsaValue = 24.1;
    fake.longitudes[Body::Sun] = 10.0;
    PositionResolver r(fake);

    auto rows = r.resolve(t, chartBodies(true));
    const double ayan = r.ayanamsa(t);
    for (const auto& row : rows) {
        EXPECT_GE(row.tropical, 0.0);
        EXPECT_LT(row.tropical, 360.0);
        EXPECT_GE(row.sidereal, 0.0);
        EXPECT_LT(row.sidereal, 360.0);
        EXPECT_EQ(row.sidereal, PositionResolver::siderealLongitude(row.tropical, ayan));
    }
    EXPECT_NEAR(rows[0].sidereal, 345.9, 1e-12);
}

TEST_F(PositionResolverTest, ExtraOffsetShiftsAyanamsa) {
    ResolverOptions opts;
    opts.ayanamsaOffset = 0.2103;
    PositionResolver r(fake, opts);
    EXPECT_DOUBLE_EQ(r.ayanamsa(t), 24.0 + 0.2103);

    opts.ayanamsaOffset = -1.0;
    PositionResolver back(fake, opts);
    EXPECT_DOUBLE_EQ(back.ayanamsa(t), 23.0);
}

TEST_F(PositionResolverTest, SouthNodeIsDerivedFromNorthNode) {
    fake.trueNode = 250.0;
    PositionResolver r(fake);

    auto rows = r.resolve(t, chartBodies(true));
    ASSERT_EQ(rows.size(), 12u);
    EXPECT_EQ(rows[10].body, Body::NorthNode);
    EXPECT_EQ(rows[11].body, Body::SouthNode);
    EXPECT_DOUBLE_EQ(rows[11].tropical, 70.0);
    EXPECT_TRUE(rows[11].retrograde);
    EXPECT_EQ(fake.positionCalls[Body::NorthNode], 1);

    EXPECT_DOUBLE_EQ(r.tropicalLongitude(t, Body::SouthNode), 70.0);
}

TEST_F(PositionResolverTest, NodeTypeIsForwarded) {
    ResolverOptions opts;
    opts.nodeType = NodeType::Mean;
    PositionResolver r(fake, opts);
    EXPECT_DOUBLE_EQ(r.tropicalLongitude(t, Body::NorthNode), 101.5);
    EXPECT_DOUBLE_EQ(r.tropicalLongitude(t, Body::SouthNode), 281.5);
}

TEST_F(PositionResolverTest, HeliocentricSuppressesNodes) {
    ResolverOptions opts;
    opts.center = Center::Heliocentric;
    PositionResolver r(fake, opts);

    auto rows = r.resolve(t, chartBodies(true));
    EXPECT_EQ(rows.size(), 10u);
    EXPECT_EQ(fake.positionCalls.count(Body::NorthNode), 0u);
    EXPECT_EQ(fake.lastCenter[Body::Mars], Center::Heliocentric);
    EXPECT_THROW(r.tropicalLongitude(t, Body::NorthNode), UnsupportedFrameError);
    EXPECT_THROW(r.tropicalLongitude(t, Body::SouthNode), UnsupportedFrameError);
}

TEST_F(PositionResolverTest, OracleFailureNamesTheBody) {
    fake.failing.insert(Body::Pluto);
    PositionResolver r(fake);
    try {
        r.resolve(t, chartBodies(false));
        FAIL() << "expected EphemerisRangeError";
    }
    catch (const EphemerisRangeError& e) {
        ASSERT_TRUE(e.body.has_value());
        EXPECT_EQ(*e.body, Body::Pluto);
    }
}

TEST(SwissPositionTest, LongitudesStayInRange) {
    SwissEphemeris ephe;
    PositionResolver r(ephe);
    for (double jd : { 2415020.5, 2437848.689583333, 2451545.0, 2460000.25 }) {
        for (const auto& row : r.resolve(Moment(jd), chartBodies(true))) {
            EXPECT_GE(row.tropical, 0.0) << bodyName(row.body);
            EXPECT_LT(row.tropical, 360.0) << bodyName(row.body);
            EXPECT_GE(row.sidereal, 0.0) << bodyName(row.body);
            EXPECT_LT(row.sidereal, 360.0) << bodyName(row.body);
        }
    }
}

TEST(SwissPositionTest, FaganBradleyAyanamsaNearJ2000) {
    SwissEphemeris ephe;
    PositionResolver r(ephe);
    // Fagan/Bradley is about 24.7 degrees at J2000
    EXPECT_NEAR(r.ayanamsa(Moment(2451545.0)), 24.74, 0.05);
}

TEST(SwissPositionTest, OutOfRangeDateNamesTheBody) {
    SwissEphemeris ephe;
    try {
        ephe.position(Moment(1e8), Body::Sun, Center::Geocentric, NodeType::True);
        FAIL() << "expected EphemerisRangeError";
    }
    catch (const EphemerisRangeError& e) {
        ASSERT_TRUE(e.body.has_value());
        EXPECT_EQ(*e.body, Body::Sun);
    }
}

TEST(SwissPositionTest, HeliocentricNodeIsRejected) {
    SwissEphemeris ephe;
    EXPECT_THROW(ephe.position(Moment(2451545.0), Body::NorthNode, Center::Heliocentric, NodeType::True),
                 UnsupportedFrameError);
}

}  // namespace chartwheel::test
