#include <gtest/gtest.h>

#include "proctor/vision/HeadPose.h"
#include "test_helpers.hpp"

#include <cmath>

using namespace proctor::vision;
using proctor::test::frontalFace;

TEST(HeadPoseEstimatorTest, FrontalFaceIsLevel) {
    HeadPoseEstimator est;
    auto pose = est.estimatePose(frontalFace());
    ASSERT_TRUE(pose.has_value());
    EXPECT_NEAR(pose->pitch, 0.f, 1e-4);
    EXPECT_NEAR(pose->yaw, 0.f, 1e-4);
    EXPECT_NEAR(pose->roll, 0.f, 1e-4);
    EXPECT_EQ(pose->source, PoseSource::LANDMARKS);
}

TEST(HeadPoseEstimatorTest, NoseOffsetGivesSignedYaw) {
    HeadPoseEstimator est;
    auto lm = frontalFace();
    lm.points[FaceMeshIndex::NOSE_TIP].x = 0.56f;     // 0.06 of a 0.24 wide face
    auto right = est.estimatePose(lm);
    ASSERT_TRUE(right.has_value());
    EXPECT_NEAR(right->yaw, 22.5f, 1e-3);

    lm.points[FaceMeshIndex::NOSE_TIP].x = 0.44f;
    auto left = est.estimatePose(lm);
    ASSERT_TRUE(left.has_value());
    EXPECT_NEAR(left->yaw, -22.5f, 1e-3);
}

TEST(HeadPoseEstimatorTest, PitchUsesDepthWhenPresent) {
    HeadPoseEstimator est;
    auto lm = frontalFace();
    lm.points[FaceMeshIndex::NOSE_TIP].y = 0.5f;      // 0.1 below the forehead
    auto flat = est.estimatePose(lm);
    ASSERT_TRUE(flat.has_value());
    EXPECT_NEAR(flat->pitch, std::atan2(0.1f, 1.f) * 180.f / 3.14159265f, 1e-3);

    lm.points[FaceMeshIndex::NOSE_TIP].z = 0.1f;
    auto deep = est.estimatePose(lm);
    ASSERT_TRUE(deep.has_value());
    EXPECT_NEAR(deep->pitch, 45.f, 1e-3);
}

TEST(HeadPoseEstimatorTest, EarLineGivesRoll) {
    HeadPoseEstimator est;
    auto lm = frontalFace();
    lm.points[FaceMeshIndex::RIGHT_EAR].y = 0.5f;
    auto pose = est.estimatePose(lm);
    ASSERT_TRUE(pose.has_value());
    EXPECT_NEAR(pose->roll, std::atan2(0.1f, 0.4f) * 180.f / 3.14159265f, 1e-3);
}

TEST(HeadPoseEstimatorTest, DegenerateFaceWidthGivesNoPose) {
    HeadPoseEstimator est;
    auto lm = frontalFace();
    lm.points[FaceMeshIndex::RIGHT_EYE_OUTER].x = lm.points[FaceMeshIndex::LEFT_EYE_OUTER].x;
    EXPECT_FALSE(est.estimatePose(lm).has_value());

    HeadPoseEstimator strict(0.5f);
    EXPECT_FALSE(strict.estimatePose(frontalFace()).has_value());
}

TEST(HeadPoseEstimatorTest, MissingLandmarksGiveNoPose) {
    HeadPoseEstimator est;
    FaceLandmarks few;
    few.points.assign(100, cv::Point3f(0.5f, 0.5f, 0.f));
    EXPECT_FALSE(est.estimatePose(few).has_value());
    EXPECT_FALSE(est.estimateGaze(few).has_value());
}

TEST(HeadPoseEstimatorTest, IrisOffsetAveragedOverBothEyes) {
    HeadPoseEstimator est;
    auto lm = frontalFace();
    auto centred = est.estimateGaze(lm);
    ASSERT_TRUE(centred.has_value());
    EXPECT_NEAR(centred->x, 0.f, 1e-5);
    EXPECT_NEAR(centred->y, 0.f, 1e-5);

    lm.points[FaceMeshIndex::LEFT_IRIS].x  += 0.02f;
    lm.points[FaceMeshIndex::RIGHT_IRIS].x += 0.02f;
    lm.points[FaceMeshIndex::LEFT_IRIS].y  += 0.03f;
    lm.points[FaceMeshIndex::RIGHT_IRIS].y += 0.03f;
    auto shifted = est.estimateGaze(lm);
    ASSERT_TRUE(shifted.has_value());
    EXPECT_NEAR(shifted->x, 0.02f, 1e-5);
    EXPECT_NEAR(shifted->y, 0.03f, 1e-5);
}

TEST(HeadPoseEstimatorTest, MeshWithoutIrisStillGivesPose) {
    HeadPoseEstimator est;
    auto lm = frontalFace();
    lm.points.resize(468);
    EXPECT_TRUE(est.estimatePose(lm).has_value());
    EXPECT_FALSE(est.estimateGaze(lm).has_value());
}
