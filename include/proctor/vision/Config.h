#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace proctor::vision {

// Proctoring engine config (load from proctor.yml / proctor.json).
// Shared read-only between sessions; a changed copy is swapped in through
// SessionRegistry::updateConfig().
struct ProctorConfig {
    // ===================== 字段fields ===================== //

    // detector class table, index = model class id
    std::vector<std::string> class_names = {"person", "phone", "book", "paper"};

    /* 阈值
    * conf: arg-max class score must exceed this for an anchor to survive
    * IoU:  greedy NMS suppresses a box whose overlap with a kept one exceeds this
    */
    float conf_threshold = 0.4f;
    float iou_threshold  = 0.45f;
    bool  nms_classwise  = false;   // true: only suppress boxes of the same class

    // gaze model bin layout, fixed at training time: angle = E[idx] * width - offset
    int   gaze_bins             = 90;
    float gaze_bin_width_deg    = 2.0f;
    float gaze_angle_offset_deg = 90.0f;

    // landmark pose fallback: narrower faces are treated as degenerate
    float min_face_width = 1e-4f;

    // zone classification
    float zone_gaze_x      = 0.15f;
    float zone_gaze_y      = 0.10f;
    float zone_yaw         = 20.f;   // degrees
    float zone_pitch       = 15.f;
    float zone_phone_pitch = 25.f;
    float zone_phone_yaw   = 10.f;
    int   look_away_duration_ms = 3000;

    // rule engine (stricter than the zone thresholds)
    float violation_yaw   = 30.f;
    float violation_pitch = 25.f;
    int   absence_streak_threshold = 3;
    float absence_decay            = 0.5f;  // subtracted per clean frame
    int   gaze_streak_threshold    = 5;

    // escalation / throttle
    int64_t throttle_window_ms = 5000;
    int     violation_ceiling  = 3;

    // smoothing
    int history_capacity = 30;
    int smoothing_window = 10;

    // session driver
    int  tick_interval_ms = 1000;
    bool log_verbose      = false;

    // ===================== 方法methods ===================== //

    // 配置加载函数: missing keys keep their defaults, unreadable files keep all defaults
    static ProctorConfig fromYaml(const std::string& yaml_path);
    static ProctorConfig fromJson(const std::string& json_path);

    // throws ConfigError naming the first offending option
    void validate() const;
};

} // namespace proctor::vision
