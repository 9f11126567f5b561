#include "proctor/vision/HeadPose.h"
#include <cmath>
#include <iostream>

namespace proctor::vision {

namespace {

constexpr float RAD2DEG = 180.0f / 3.14159265358979323846f;

bool allFinite(float a, float b, float c) {
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(c);
}

} // namespace

HeadPoseEstimator::HeadPoseEstimator(float min_face_width)
    : min_face_width_(min_face_width) {}

std::optional<HeadPose> HeadPoseEstimator::estimatePose(const FaceLandmarks& lm) const {
    // ear landmarks carry the highest index needed for pose
    if (lm.points.size() <= static_cast<size_t>(FaceMeshIndex::RIGHT_EAR)) {
        std::cerr << "[HeadPoseEstimator] Only " << lm.points.size()
                  << " landmarks, pose needs " << FaceMeshIndex::RIGHT_EAR + 1 << "\n";
        return std::nullopt;
    }
    const auto& nose      = lm.points[FaceMeshIndex::NOSE_TIP];
    const auto& forehead  = lm.points[FaceMeshIndex::FOREHEAD];
    const auto& left_out  = lm.points[FaceMeshIndex::LEFT_EYE_OUTER];
    const auto& right_out = lm.points[FaceMeshIndex::RIGHT_EYE_OUTER];
    const auto& left_ear  = lm.points[FaceMeshIndex::LEFT_EAR];
    const auto& right_ear = lm.points[FaceMeshIndex::RIGHT_EAR];

    float face_width = std::fabs(left_out.x - right_out.x);
    if (!std::isfinite(face_width) || face_width < min_face_width_) {
        std::cerr << "[HeadPoseEstimator] Degenerate face width " << face_width << ", pose skipped\n";
        return std::nullopt;
    }

    // vertical angle: nose below forehead, depth defaults to 1 for 2D landmarks
    float depth = nose.z != 0.f ? nose.z : 1.f;
    float pitch = std::atan2(nose.y - forehead.y, depth) * RAD2DEG;

    // horizontal angle: nose offset from eye midline, as a fraction of face width
    float nose_to_center_x = nose.x - (left_out.x + right_out.x) / 2.f;
    float yaw = (nose_to_center_x / face_width) * 90.f;

    // tilt: ear-to-ear line
    float roll = std::atan2(right_ear.y - left_ear.y, right_ear.x - left_ear.x) * RAD2DEG;

    if (!allFinite(pitch, yaw, roll)) {
        std::cerr << "[HeadPoseEstimator] Non-finite pose from landmarks, pose skipped\n";
        return std::nullopt;
    }
    HeadPose pose;
    pose.pitch  = pitch;
    pose.yaw    = yaw;
    pose.roll   = roll;
    pose.source = PoseSource::LANDMARKS;
    return pose;
}

std::optional<GazeVector> HeadPoseEstimator::estimateGaze(const FaceLandmarks& lm) const {
    if (lm.points.size() <= static_cast<size_t>(FaceMeshIndex::RIGHT_IRIS)) {
        return std::nullopt;    // iris refinement off
    }
    const auto& left_iris  = lm.points[FaceMeshIndex::LEFT_IRIS];
    const auto& right_iris = lm.points[FaceMeshIndex::RIGHT_IRIS];
    const auto& left_in    = lm.points[FaceMeshIndex::LEFT_EYE_INNER];
    const auto& left_out   = lm.points[FaceMeshIndex::LEFT_EYE_OUTER];
    const auto& right_in   = lm.points[FaceMeshIndex::RIGHT_EYE_INNER];
    const auto& right_out  = lm.points[FaceMeshIndex::RIGHT_EYE_OUTER];

    float left_cx  = (left_in.x + left_out.x) / 2.f;
    float left_cy  = (left_in.y + left_out.y) / 2.f;
    float right_cx = (right_in.x + right_out.x) / 2.f;
    float right_cy = (right_in.y + right_out.y) / 2.f;

    GazeVector g;
    g.x = ((left_iris.x - left_cx) + (right_iris.x - right_cx)) / 2.f;
    g.y = ((left_iris.y - left_cy) + (right_iris.y - right_cy)) / 2.f;
    if (!std::isfinite(g.x) || !std::isfinite(g.y)) return std::nullopt;
    return g;
}

} // namespace proctor::vision
