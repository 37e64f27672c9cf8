#include <gtest/gtest.h>
#include "core/gps_converter.hpp"
#include "core/metadata_error.hpp"
#include "logging/logger.hpp"
#include <cmath>

class GpsConverterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
    }

    static std::vector<Rational> dms(int64_t d, int64_t m, int64_t s)
    {
        return {Rational(d, 1), Rational(m, 1), Rational(s, 1)};
    }

    static TagTable positionTags(const std::string &lat_ref, const std::string &lon_ref)
    {
        TagTable tags;
        tags["GPSLatitudeRef"] = lat_ref;
        tags["GPSLatitude"] = dms(40, 26, 46);
        tags["GPSLongitudeRef"] = lon_ref;
        tags["GPSLongitude"] = dms(79, 56, 55);
        return tags;
    }
};

TEST_F(GpsConverterTest, ConvertsDegreesMinutesSeconds)
{
    EXPECT_NEAR(GpsConverter::toDecimalDegrees(dms(40, 26, 46), "N"), 40.446111, 1e-6);
    EXPECT_NEAR(GpsConverter::toDecimalDegrees(dms(79, 56, 55), "W"), -79.948611, 1e-6);
}

TEST_F(GpsConverterTest, FractionalSeconds)
{
    std::vector<Rational> value = {Rational(51, 1), Rational(30, 1), Rational(2615, 100)};
    EXPECT_NEAR(GpsConverter::toDecimalDegrees(value, "N"), 51.507264, 1e-6);
}

TEST_F(GpsConverterTest, HemisphereReferenceOnlyFlipsSign)
{
    const std::vector<Rational> values[] = {dms(0, 0, 0), dms(12, 34, 56), dms(89, 59, 59), dms(45, 0, 30)};
    for (const auto &value : values)
    {
        double north = GpsConverter::toDecimalDegrees(value, "N");
        EXPECT_GE(north, 0.0);
        EXPECT_DOUBLE_EQ(GpsConverter::toDecimalDegrees(value, "S"), -north);
        EXPECT_DOUBLE_EQ(GpsConverter::toDecimalDegrees(value, "E"), north);
        EXPECT_DOUBLE_EQ(GpsConverter::toDecimalDegrees(value, "W"), -north);
    }
}

TEST_F(GpsConverterTest, ZeroDenominatorIsMalformed)
{
    std::vector<Rational> value = {Rational(40, 0), Rational(26, 1), Rational(46, 1)};
    try
    {
        GpsConverter::toDecimalDegrees(value, "N");
        FAIL() << "Expected MetadataError";
    }
    catch (const MetadataError &e)
    {
        EXPECT_EQ(e.kind(), MetadataErrorKind::MALFORMED_METADATA);
    }
}

TEST_F(GpsConverterTest, WrongArityIsMalformed)
{
    std::vector<Rational> value = {Rational(40, 1), Rational(26, 1)};
    EXPECT_THROW(GpsConverter::toDecimalDegrees(value, "N"), MetadataError);
}

TEST_F(GpsConverterTest, FromTagsBuildsCoordinateAndMapsUrl)
{
    auto coordinate = GpsConverter::fromTags(positionTags("N", "W"));

    ASSERT_TRUE(coordinate.has_value());
    EXPECT_NEAR(coordinate->latitude, 40.4461, 1e-4);
    EXPECT_NEAR(coordinate->longitude, -79.9486, 1e-4);

    const std::string url = coordinate->googleMapsUrl();
    EXPECT_EQ(url.rfind("https://www.google.com/maps/search/?api=1&query=40.446", 0), 0u);
    EXPECT_NE(url.find(",-79.948"), std::string::npos);

    nlohmann::json j = coordinate->toJson();
    EXPECT_TRUE(j["altitude"].is_null());
    EXPECT_EQ(j["google_maps"], url);
}

TEST_F(GpsConverterTest, SouthernAndEasternHemispheres)
{
    auto coordinate = GpsConverter::fromTags(positionTags("S", "E"));
    ASSERT_TRUE(coordinate.has_value());
    EXPECT_LT(coordinate->latitude, 0.0);
    EXPECT_GT(coordinate->longitude, 0.0);
}

TEST_F(GpsConverterTest, AltitudeBelowSeaLevel)
{
    TagTable tags = positionTags("N", "W");
    tags["GPSAltitude"] = std::vector<Rational>{Rational(1250, 10)};
    tags["GPSAltitudeRef"] = std::vector<int64_t>{1};

    auto coordinate = GpsConverter::fromTags(tags);
    ASSERT_TRUE(coordinate.has_value());
    ASSERT_TRUE(coordinate->altitude.has_value());
    EXPECT_DOUBLE_EQ(*coordinate->altitude, -125.0);
}

TEST_F(GpsConverterTest, NoPositionTagsMeansAbsent)
{
    TagTable tags;
    tags["GPSVersionID"] = std::vector<uint8_t>{2, 3, 0, 0};
    EXPECT_FALSE(GpsConverter::fromTags(tags).has_value());
}

TEST_F(GpsConverterTest, HalfPresentPositionIsMalformed)
{
    TagTable tags = positionTags("N", "W");
    tags.erase("GPSLongitude");
    EXPECT_THROW(GpsConverter::fromTags(tags), MetadataError);
}

TEST_F(GpsConverterTest, OutOfRangeLatitudeIsRejected)
{
    TagTable tags = positionTags("N", "W");
    tags["GPSLatitude"] = dms(95, 0, 0);
    EXPECT_THROW(GpsConverter::fromTags(tags), MetadataError);
}
