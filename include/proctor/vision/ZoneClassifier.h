#pragma once
#include "Types.h"

namespace proctor::vision {

struct ZoneThresholds {
    float gaze_x      = 0.15f;   // |gaze.x| above -> away
    float gaze_y      = 0.10f;   // gaze.y above -> keyboard, below -gaze_y -> ceiling
    float yaw         = 20.f;    // degrees
    float pitch       = 15.f;
    float phone_pitch = 25.f;    // steep downward head pitch
    float phone_yaw   = 10.f;    // combined with a lateral turn
};

// Confidence attached to each zone, decreasing down the priority list.
struct ZoneConfidence {
    static constexpr float PHONE           = 0.9f;
    static constexpr float AWAY_HORIZONTAL = 0.85f;
    static constexpr float KEYBOARD        = 0.8f;
    static constexpr float CEILING         = 0.8f;
    static constexpr float SCREEN          = 1.0f;
};

// Pure classification, first match wins:
// phone > away-horizontal > keyboard > ceiling > screen
GazeZone classifyGazeZone(float gaze_x, float gaze_y, float pitch, float yaw,
                          const ZoneThresholds& t);

} // namespace proctor::vision
