#include <gtest/gtest.h>

#include "proctor/vision/TemporalSmoother.h"

using namespace proctor::vision;

namespace {

GazeZone zoneOf(GazeZoneKind kind, float gx = 0.f, float gy = 0.f) {
    GazeZone z;
    z.zone = kind;
    z.gaze = GazeVector{gx, gy};
    return z;
}

HeadPose poseOf(float pitch, float yaw) {
    HeadPose p;
    p.pitch = pitch;
    p.yaw = yaw;
    return p;
}

} // namespace

TEST(TemporalSmootherTest, EvictsOldestBeyondCapacity) {
    TemporalSmoother s(TemporalSmoother::Options{3, 3000});
    for (int i = 0; i < 5; ++i) s.push(zoneOf(GazeZoneKind::SCREEN, static_cast<float>(i)));
    EXPECT_EQ(s.size(), 3u);

    // samples 2, 3, 4 remain
    auto mean = s.smoothedGaze(3);
    ASSERT_TRUE(mean.has_value());
    EXPECT_FLOAT_EQ(mean->x, 3.f);
}

TEST(TemporalSmootherTest, InsufficientHistoryGivesNothing) {
    TemporalSmoother s(TemporalSmoother::Options{});
    s.push(zoneOf(GazeZoneKind::SCREEN));
    s.push(zoneOf(GazeZoneKind::SCREEN));
    EXPECT_FALSE(s.smoothedGaze(3).has_value());
    EXPECT_FALSE(s.smoothedZone(3).has_value());
    EXPECT_FALSE(s.smoothedGaze(0).has_value());
    EXPECT_TRUE(s.smoothedGaze(2).has_value());
}

TEST(TemporalSmootherTest, SmoothedGazeUsesLastKSamples) {
    TemporalSmoother s(TemporalSmoother::Options{});
    s.push(zoneOf(GazeZoneKind::SCREEN, 10.f, 10.f));
    s.push(zoneOf(GazeZoneKind::SCREEN, 0.1f, 0.2f));
    s.push(zoneOf(GazeZoneKind::SCREEN, 0.3f, 0.4f));
    auto mean = s.smoothedGaze(2);
    ASSERT_TRUE(mean.has_value());
    EXPECT_NEAR(mean->x, 0.2f, 1e-6);
    EXPECT_NEAR(mean->y, 0.3f, 1e-6);
}

TEST(TemporalSmootherTest, MajorityZoneTieGoesToFirstSeen) {
    TemporalSmoother s(TemporalSmoother::Options{});
    s.push(zoneOf(GazeZoneKind::AWAY_HORIZONTAL));
    s.push(zoneOf(GazeZoneKind::SCREEN));
    s.push(zoneOf(GazeZoneKind::SCREEN));
    s.push(zoneOf(GazeZoneKind::AWAY_HORIZONTAL));
    auto z = s.smoothedZone(4);
    ASSERT_TRUE(z.has_value());
    EXPECT_EQ(z->zone, GazeZoneKind::AWAY_HORIZONTAL);
    EXPECT_FLOAT_EQ(z->confidence, 0.9f);

    s.push(zoneOf(GazeZoneKind::SCREEN));
    auto later = s.smoothedZone(4);
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(later->zone, GazeZoneKind::SCREEN);
}

TEST(TemporalSmootherTest, LookAwayRecordedAfterDuration) {
    TemporalSmoother s(TemporalSmoother::Options{30, 3000});
    const auto away = zoneOf(GazeZoneKind::AWAY_HORIZONTAL);

    EXPECT_FALSE(s.observe(away, poseOf(0, 25), 0).is_looking_away);
    ASSERT_TRUE(s.lookAwayStartMs().has_value());
    EXPECT_EQ(*s.lookAwayStartMs(), 0);

    // exactly the duration is not enough
    EXPECT_FALSE(s.observe(away, poseOf(0, 25), 3000).is_looking_away);
    EXPECT_FALSE(s.lastLookAwayMs().has_value());

    EXPECT_TRUE(s.observe(away, poseOf(0, 25), 3001).is_looking_away);
    ASSERT_TRUE(s.lastLookAwayMs().has_value());
    EXPECT_EQ(*s.lastLookAwayMs(), 3001);
}

TEST(TemporalSmootherTest, LookAwayHoldsBrieflyAfterReturn) {
    TemporalSmoother s(TemporalSmoother::Options{30, 3000});
    const auto away = zoneOf(GazeZoneKind::AWAY_HORIZONTAL);
    const auto screen = zoneOf(GazeZoneKind::SCREEN);

    s.observe(away, poseOf(0, 25), 0);
    s.observe(away, poseOf(0, 25), 3500);

    auto back = s.observe(screen, poseOf(0, 0), 4000);
    EXPECT_TRUE(back.is_looking_away);
    EXPECT_FALSE(back.warning.has_value());
    EXPECT_FALSE(s.lookAwayStartMs().has_value());

    EXPECT_FALSE(s.observe(screen, poseOf(0, 0), 4600).is_looking_away);
}

TEST(TemporalSmootherTest, ReturningToScreenRestartsTheTimer) {
    TemporalSmoother s(TemporalSmoother::Options{30, 3000});
    const auto down = zoneOf(GazeZoneKind::KEYBOARD);

    s.observe(down, poseOf(20, 0), 0);
    s.observe(zoneOf(GazeZoneKind::SCREEN), poseOf(0, 0), 2000);
    s.observe(down, poseOf(20, 0), 2500);
    EXPECT_FALSE(s.observe(down, poseOf(20, 0), 5000).is_looking_away);
    EXPECT_EQ(*s.lookAwayStartMs(), 2500);
}

TEST(TemporalSmootherTest, WarningDescribesZoneAndElapsedTime) {
    TemporalSmoother s(TemporalSmoother::Options{30, 3000});
    const auto phone = zoneOf(GazeZoneKind::PHONE);

    s.observe(phone, poseOf(30.f, 12.f), 1000);
    auto a = s.observe(phone, poseOf(30.f, 12.f), 3500);
    ASSERT_TRUE(a.warning.has_value());
    EXPECT_EQ(*a.warning, "Possible phone usage (2s, pitch: 30.0°)");
    EXPECT_EQ(a.ts_ms, 3500);
    EXPECT_EQ(a.zone.zone, GazeZoneKind::PHONE);
}

TEST(TemporalSmootherTest, ShrinkingCapacityEvictsImmediately) {
    TemporalSmoother s(TemporalSmoother::Options{});
    for (int i = 0; i < 10; ++i) s.push(zoneOf(GazeZoneKind::SCREEN));
    s.setOptions(TemporalSmoother::Options{4, 3000});
    EXPECT_EQ(s.size(), 4u);
    EXPECT_EQ(s.capacity(), 4);
}

TEST(TemporalSmootherTest, ClearDropsHistoryAndTimers) {
    TemporalSmoother s(TemporalSmoother::Options{30, 100});
    const auto away = zoneOf(GazeZoneKind::AWAY_HORIZONTAL);
    s.observe(away, poseOf(0, 25), 0);
    s.observe(away, poseOf(0, 25), 200);
    s.clear();
    EXPECT_EQ(s.size(), 0u);
    EXPECT_FALSE(s.lookAwayStartMs().has_value());
    EXPECT_FALSE(s.lastLookAwayMs().has_value());
}
