#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Enums.h"

namespace proctor::vision {

// 解码后的检测框 (source-frame coordinates)
struct DetectedObject {
    ObjectLabel label  = ObjectLabel::OTHER;
    float       conf   = 0.f;     // arg-max class score (0~1)
    cv::Rect2f  box;              // x, y = (x1, y1); x + width, y + height = (x2, y2)
    int         cls_id = -1;      // raw model class index

    float x1() const { return box.x; }
    float y1() const { return box.y; }
    float x2() const { return box.x + box.width; }
    float y2() const { return box.y + box.height; }
};

// Raw detector output: attribute-major [(4 + C) x A] buffer plus the ratios that map
// model-space coordinates back onto the source frame.
struct DetectionTensor {
    std::vector<float> data;
    int   num_anchors = 0;
    float x_ratio = 1.f;
    float y_ratio = 1.f;
};

// Normalized iris offset relative to the eye center, roughly [-1, 1].
struct GazeVector {
    float x = 0.f;
    float y = 0.f;
};

// degrees
struct HeadPose {
    float pitch = 0.f;
    float yaw   = 0.f;
    float roll  = 0.f;
    PoseSource source = PoseSource::MODEL;
};

// Categorical pitch/yaw logits from the gaze model.
struct GazeLogits {
    std::vector<float> pitch;
    std::vector<float> yaw;
};

// Indexed face-mesh landmarks (normalized image coordinates, z optional = 0).
struct FaceLandmarks {
    std::vector<cv::Point3f> points;
};

struct GazeZone {
    GazeZoneKind zone       = GazeZoneKind::SCREEN;
    float        confidence = 1.f;
    GazeVector   gaze;
};

// Per-frame result of the temporal smoother.
struct GazeAnalysis {
    GazeZone   zone;
    HeadPose   pose;
    bool       is_looking_away = false;
    std::optional<std::string> warning;
    int64_t    ts_ms = 0;
};

// Count of boxes carrying the given label.
int countLabel(const std::vector<DetectedObject>& objects, ObjectLabel label);

// Single-frame detection summary, used for logs and the replay tool.
std::string detectionsToJson(const std::vector<DetectedObject>& objects);

} // namespace proctor::vision
