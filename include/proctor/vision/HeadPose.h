#pragma once
#include <optional>
#include "Types.h"

namespace proctor::vision {

// MediaPipe face mesh indices (478-point topology, iris refined)
struct FaceMeshIndex {
    static constexpr int NOSE_TIP        = 1;
    static constexpr int FOREHEAD        = 10;
    static constexpr int LEFT_EYE_INNER  = 33;
    static constexpr int LEFT_EYE_OUTER  = 133;
    static constexpr int RIGHT_EYE_INNER = 362;
    static constexpr int RIGHT_EYE_OUTER = 263;
    static constexpr int LEFT_EAR        = 234;
    static constexpr int RIGHT_EAR       = 454;
    static constexpr int LEFT_IRIS       = 468;
    static constexpr int RIGHT_IRIS      = 473;
};

// Geometric head pose and gaze from face landmarks, no model involved.
// Fallback path for frames where the gaze model gave nothing; output has the
// same HeadPose shape as GazeDecoder::decode().
class HeadPoseEstimator {
public:
    explicit HeadPoseEstimator(float min_face_width = 1e-4f);

    // pitch / yaw / roll in degrees.
    // std::nullopt when landmarks are missing or the face width is below
    // min_face_width (degenerate geometry; logged, never NaN/Inf).
    std::optional<HeadPose> estimatePose(const FaceLandmarks& lm) const;

    // Mean iris offset from the eye-corner midpoint over both eyes.
    // std::nullopt when iris landmarks are missing.
    std::optional<GazeVector> estimateGaze(const FaceLandmarks& lm) const;

private:
    float min_face_width_;
};

} // namespace proctor::vision
