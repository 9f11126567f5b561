#include "proctor/vision/TemporalSmoother.h"
#include <cstdio>
#include <vector>

namespace proctor::vision {

TemporalSmoother::TemporalSmoother(const Options& opt)
    : opt_(opt) {}

void TemporalSmoother::trim() {
    const size_t cap = opt_.capacity > 0 ? static_cast<size_t>(opt_.capacity) : 0;
    while (history_.size() > cap) history_.pop_front();
}

void TemporalSmoother::push(const GazeZone& zone) {
    history_.push_back(zone);
    trim();
}

GazeAnalysis TemporalSmoother::observe(const GazeZone& zone, const HeadPose& pose, int64_t now_ms) {
    push(zone);

    const bool off_screen = zone.zone != GazeZoneKind::SCREEN;
    if (off_screen) {
        if (!look_away_start_ms_) look_away_start_ms_ = now_ms;
        if (now_ms - *look_away_start_ms_ > opt_.look_away_duration_ms) {
            last_look_away_ms_ = now_ms;
        }
    } else {
        look_away_start_ms_.reset();
    }

    GazeAnalysis out;
    out.zone    = zone;
    out.pose    = pose;
    out.ts_ms   = now_ms;
    out.warning = makeWarning(zone, pose, now_ms);
    out.is_looking_away = last_look_away_ms_.has_value() &&
                          (now_ms - *last_look_away_ms_) < LOOK_AWAY_HOLD_MS;
    return out;
}

std::optional<std::string> TemporalSmoother::makeWarning(const GazeZone& zone,
                                                         const HeadPose& pose,
                                                         int64_t now_ms) const {
    if (zone.zone == GazeZoneKind::SCREEN) return std::nullopt;

    const int64_t elapsed = look_away_start_ms_ ? now_ms - *look_away_start_ms_ : 0;
    const long long secs = static_cast<long long>(elapsed / 1000);

    char buf[96];
    switch (zone.zone) {
        case GazeZoneKind::PHONE:
            std::snprintf(buf, sizeof(buf), "Possible phone usage (%llds, pitch: %.1f°)", secs, pose.pitch);
            break;
        case GazeZoneKind::KEYBOARD:
            std::snprintf(buf, sizeof(buf), "Looking down (%llds, pitch: %.1f°)", secs, pose.pitch);
            break;
        case GazeZoneKind::AWAY_HORIZONTAL:
            std::snprintf(buf, sizeof(buf), "Looking away (%llds, yaw: %.1f°)", secs, pose.yaw);
            break;
        case GazeZoneKind::CEILING:
            std::snprintf(buf, sizeof(buf), "Looking up (%llds)", secs);
            break;
        default:
            return std::nullopt;
    }
    return std::string(buf);
}

std::optional<GazeVector> TemporalSmoother::smoothedGaze(int k) const {
    if (k <= 0 || history_.size() < static_cast<size_t>(k)) return std::nullopt;

    float sx = 0.f, sy = 0.f;
    for (auto it = history_.end() - k; it != history_.end(); ++it) {
        sx += it->gaze.x;
        sy += it->gaze.y;
    }
    return GazeVector{sx / static_cast<float>(k), sy / static_cast<float>(k)};
}

std::optional<GazeZone> TemporalSmoother::smoothedZone(int k) const {
    auto mean = smoothedGaze(k);
    if (!mean) return std::nullopt;

    // first-seen order kept so that ties resolve deterministically
    std::vector<std::pair<GazeZoneKind, int>> counts;
    for (auto it = history_.end() - k; it != history_.end(); ++it) {
        bool found = false;
        for (auto& c : counts) {
            if (c.first == it->zone) { ++c.second; found = true; break; }
        }
        if (!found) counts.emplace_back(it->zone, 1);
    }
    auto best = counts.front();
    for (const auto& c : counts) {
        if (c.second > best.second) best = c;
    }

    GazeZone out;
    out.zone       = best.first;
    out.confidence = 0.9f;
    out.gaze       = *mean;
    return out;
}

void TemporalSmoother::setOptions(const Options& opt) {
    opt_ = opt;
    trim();
}

void TemporalSmoother::clear() {
    history_.clear();
    look_away_start_ms_.reset();
    last_look_away_ms_.reset();
}

} // namespace proctor::vision
