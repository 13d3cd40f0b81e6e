#include "tracker_session/location_source.hpp"
#include <gtest/gtest.h>

using namespace tracker_session;

TEST(LocationSourceTest, EmptySourceHasNoPosition) {
    StaticLocationSource source;
    EXPECT_FALSE(source.currentPosition().has_value());
}

TEST(LocationSourceTest, CoordinatesAreAValidFix) {
    StaticLocationSource source(-23.5505, -46.6333);

    auto position = source.currentPosition();
    ASSERT_TRUE(position.has_value());
    EXPECT_TRUE(position->isValid);
    EXPECT_TRUE(position->isFix());
    EXPECT_DOUBLE_EQ(position->latitude, -23.5505);
    EXPECT_DOUBLE_EQ(position->longitude, -46.6333);
}

TEST(LocationSourceTest, NullIslandIsNotAFix) {
    Position position;
    position.isValid = true;
    EXPECT_FALSE(position.isFix());

    position.latitude = 0.0001;
    EXPECT_TRUE(position.isFix());

    position.isValid = false;
    EXPECT_FALSE(position.isFix());
}

TEST(LocationSourceTest, ClearDropsPosition) {
    StaticLocationSource source(10.0, 20.0);
    source.clear();
    EXPECT_FALSE(source.currentPosition().has_value());
}

TEST(LocationSourceTest, ReadsAreRestamped) {
    Position stale;
    stale.latitude = 1.0;
    stale.longitude = 2.0;
    stale.isValid = true;
    stale.timestamp = std::chrono::system_clock::now() - std::chrono::hours(1);

    StaticLocationSource source;
    source.setPosition(stale);

    auto position = source.currentPosition();
    ASSERT_TRUE(position.has_value());
    EXPECT_GT(position->timestamp, stale.timestamp + std::chrono::minutes(59));
}
