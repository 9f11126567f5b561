#include "proctor/vision/ZoneClassifier.h"
#include <cmath>

namespace proctor::vision {

GazeZone classifyGazeZone(float gaze_x, float gaze_y, float pitch, float yaw,
                          const ZoneThresholds& t) {
    GazeZone out;
    out.gaze = GazeVector{gaze_x, gaze_y};

    if (pitch > t.phone_pitch && std::fabs(yaw) > t.phone_yaw) {
        out.zone = GazeZoneKind::PHONE;
        out.confidence = ZoneConfidence::PHONE;
    } else if (std::fabs(gaze_x) > t.gaze_x || std::fabs(yaw) > t.yaw) {
        out.zone = GazeZoneKind::AWAY_HORIZONTAL;
        out.confidence = ZoneConfidence::AWAY_HORIZONTAL;
    } else if (gaze_y > t.gaze_y || pitch > t.pitch) {
        out.zone = GazeZoneKind::KEYBOARD;
        out.confidence = ZoneConfidence::KEYBOARD;
    } else if (gaze_y < -t.gaze_y || pitch < -t.pitch) {
        out.zone = GazeZoneKind::CEILING;
        out.confidence = ZoneConfidence::CEILING;
    } else {
        out.zone = GazeZoneKind::SCREEN;
        out.confidence = ZoneConfidence::SCREEN;
    }
    return out;
}

} // namespace proctor::vision
