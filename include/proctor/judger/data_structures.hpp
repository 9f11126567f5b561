#ifndef PROCTOR_DATA_STRUCTURES_HPP
#define PROCTOR_DATA_STRUCTURES_HPP
#include "proctor/vision/Types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proctor::judger {

using vision::DetectedObject;
using vision::DiscreteEventKind;
using vision::HeadPose;
using vision::Severity;
using vision::ViolationKind;

// decoded per-frame inputs to the rule engine
struct FrameObservation {
    int64_t ts_ms = 0;
    std::vector<DetectedObject> objects;
    std::optional<HeadPose> pose;          // model or landmark pose, absent if neither decoded
};

// rule engine -> throttle -> transport
struct ViolationSignal {
    std::string   id;                      // session_id_ts_seq
    std::string   session_id;
    ViolationKind kind = ViolationKind::ABSENCE;
    Severity      severity = Severity::LOW;
    std::string   message;
    int64_t       ts_ms = 0;
    bool          bypass_throttle = false; // discrete browser events

    // {id, sessionId, kind, severity, message, timestamp(ISO-8601 UTC)}
    nlohmann::json toJson() const;
};

// per-session mutable state, owned by that session's judger/throttle pair
struct SessionCounters {
    float   absence_streak = 0.f;
    int     gaze_violation_streak = 0;
    std::optional<int64_t> last_report_ms;
    int     total_violations = 0;
};

// throttle outcome for one signal
struct ThrottleDecision {
    bool report   = false;   // forward to transport
    bool lockdown = false;   // ceiling reached with this report
};

// ms since epoch -> "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string msToISO8601(int64_t ts_ms);

} // namespace proctor::judger

#endif
