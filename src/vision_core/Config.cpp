#include "proctor/vision/Config.h"
#include "proctor/vision/Errors.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace proctor::vision {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, int64_t& v)     { if (n[key]) v = n[key].as<int64_t>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

ProctorConfig ProctorConfig::fromYaml(const std::string& yaml_path) {
    ProctorConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        if (r["class_names"]) {
            c.class_names.clear();
            for (const auto& it : r["class_names"]) c.class_names.push_back(it.as<std::string>());
        }

        try_get(r, "conf_threshold", c.conf_threshold);
        try_get(r, "iou_threshold",  c.iou_threshold);
        try_get(r, "nms_classwise",  c.nms_classwise);

        try_get(r, "gaze_bins",             c.gaze_bins);
        try_get(r, "gaze_bin_width_deg",    c.gaze_bin_width_deg);
        try_get(r, "gaze_angle_offset_deg", c.gaze_angle_offset_deg);
        try_get(r, "min_face_width",        c.min_face_width);

        try_get(r, "zone_gaze_x",      c.zone_gaze_x);
        try_get(r, "zone_gaze_y",      c.zone_gaze_y);
        try_get(r, "zone_yaw",         c.zone_yaw);
        try_get(r, "zone_pitch",       c.zone_pitch);
        try_get(r, "zone_phone_pitch", c.zone_phone_pitch);
        try_get(r, "zone_phone_yaw",   c.zone_phone_yaw);
        try_get(r, "look_away_duration_ms", c.look_away_duration_ms);

        try_get(r, "violation_yaw",            c.violation_yaw);
        try_get(r, "violation_pitch",          c.violation_pitch);
        try_get(r, "absence_streak_threshold", c.absence_streak_threshold);
        try_get(r, "absence_decay",            c.absence_decay);
        try_get(r, "gaze_streak_threshold",    c.gaze_streak_threshold);

        try_get(r, "throttle_window_ms", c.throttle_window_ms);
        try_get(r, "violation_ceiling",  c.violation_ceiling);

        try_get(r, "history_capacity", c.history_capacity);
        try_get(r, "smoothing_window", c.smoothing_window);

        try_get(r, "tick_interval_ms", c.tick_interval_ms);
        try_get(r, "log_verbose",      c.log_verbose);
    } catch (const YAML::Exception& ex) {
        std::cerr << "[ProctorConfig] Failed to load " << yaml_path << ": " << ex.what()
                  << " (keeping defaults)\n";
        return ProctorConfig{};
    }
    return c;
}

ProctorConfig ProctorConfig::fromJson(const std::string& json_path) {
    ProctorConfig c;
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        std::cerr << "[ProctorConfig] Cannot open " << json_path << " (keeping defaults)\n";
        return c;
    }
    try {
        json r; ifs >> r;
        auto get_i   = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_i64 = [&](const char* k, int64_t& v){ if(r.contains(k)) v = r[k].get<int64_t>(); };
        auto get_f   = [&](const char* k, float& v){ if(r.contains(k)) v = r[k].get<float>(); };
        auto get_b   = [&](const char* k, bool& v){ if(r.contains(k)) v = r[k].get<bool>(); };

        if (r.contains("class_names")) {
            c.class_names.clear();
            for (auto& it : r["class_names"]) c.class_names.push_back(it.get<std::string>());
        }

        get_f("conf_threshold", c.conf_threshold);
        get_f("iou_threshold", c.iou_threshold);
        get_b("nms_classwise", c.nms_classwise);

        get_i("gaze_bins", c.gaze_bins);
        get_f("gaze_bin_width_deg", c.gaze_bin_width_deg);
        get_f("gaze_angle_offset_deg", c.gaze_angle_offset_deg);
        get_f("min_face_width", c.min_face_width);

        get_f("zone_gaze_x", c.zone_gaze_x);
        get_f("zone_gaze_y", c.zone_gaze_y);
        get_f("zone_yaw", c.zone_yaw);
        get_f("zone_pitch", c.zone_pitch);
        get_f("zone_phone_pitch", c.zone_phone_pitch);
        get_f("zone_phone_yaw", c.zone_phone_yaw);
        get_i("look_away_duration_ms", c.look_away_duration_ms);

        get_f("violation_yaw", c.violation_yaw);
        get_f("violation_pitch", c.violation_pitch);
        get_i("absence_streak_threshold", c.absence_streak_threshold);
        get_f("absence_decay", c.absence_decay);
        get_i("gaze_streak_threshold", c.gaze_streak_threshold);

        get_i64("throttle_window_ms", c.throttle_window_ms);
        get_i("violation_ceiling", c.violation_ceiling);

        get_i("history_capacity", c.history_capacity);
        get_i("smoothing_window", c.smoothing_window);

        get_i("tick_interval_ms", c.tick_interval_ms);
        get_b("log_verbose", c.log_verbose);
    } catch (const json::exception& ex) {
        std::cerr << "[ProctorConfig] Failed to parse " << json_path << ": " << ex.what()
                  << " (keeping defaults)\n";
        return ProctorConfig{};
    }
    return c;
}

namespace {

void require(bool ok, const std::string& msg) {
    if (!ok) throw ConfigError("invalid config: " + msg);
}

bool positive(float v) { return std::isfinite(v) && v > 0.f; }

} // namespace

void ProctorConfig::validate() const {
    require(!class_names.empty(), "class_names must not be empty");
    require(std::isfinite(conf_threshold) && conf_threshold > 0.f && conf_threshold < 1.f,
            "conf_threshold must be in (0, 1)");
    require(std::isfinite(iou_threshold) && iou_threshold > 0.f && iou_threshold <= 1.f,
            "iou_threshold must be in (0, 1]");

    require(gaze_bins >= 2, "gaze_bins must be >= 2");
    require(positive(gaze_bin_width_deg), "gaze_bin_width_deg must be > 0");
    require(std::isfinite(gaze_angle_offset_deg), "gaze_angle_offset_deg must be finite");
    require(positive(min_face_width), "min_face_width must be > 0");

    require(positive(zone_gaze_x) && positive(zone_gaze_y), "zone gaze offsets must be > 0");
    require(positive(zone_yaw) && positive(zone_pitch), "zone angles must be > 0");
    require(positive(zone_phone_pitch) && positive(zone_phone_yaw), "zone phone angles must be > 0");
    require(look_away_duration_ms >= 0, "look_away_duration_ms must be >= 0");

    require(positive(violation_yaw) && positive(violation_pitch), "violation angles must be > 0");
    require(absence_streak_threshold >= 1, "absence_streak_threshold must be >= 1");
    require(positive(absence_decay), "absence_decay must be > 0");
    require(gaze_streak_threshold >= 1, "gaze_streak_threshold must be >= 1");

    require(throttle_window_ms >= 0, "throttle_window_ms must be >= 0");
    require(violation_ceiling >= 1, "violation_ceiling must be >= 1");

    require(history_capacity >= 1, "history_capacity must be >= 1");
    require(smoothing_window >= 1 && smoothing_window <= history_capacity,
            "smoothing_window must be in [1, history_capacity]");
    require(tick_interval_ms >= 1, "tick_interval_ms must be >= 1");
}

} // namespace proctor::vision
