#ifndef PROCTOR_VIOLATION_JUDGER_HPP
#define PROCTOR_VIOLATION_JUDGER_HPP

#include "data_structures.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace proctor::judger {

// Per-session rule engine. Fuses person count, forbidden objects and head pose into
// at most one violation per frame (first matching rule wins):
//   multiple persons > absence > phone > book/paper > gaze deviation
// Absence and gaze deviation are debounced by streak counters. The smoother's look-away
// warning is informational and never becomes a violation here.
class ViolationJudger {
public:
    struct Rules {
        int   absence_streak_threshold = 3;
        float absence_decay            = 0.5f;
        float violation_yaw            = 30.f;
        float violation_pitch          = 25.f;
        int   gaze_streak_threshold    = 5;
    };

    ViolationJudger(std::string session_id, const Rules& rules);
    ~ViolationJudger() = default;

    std::optional<ViolationSignal> evaluateFrame(const FrameObservation& obs);

    // tab/fullscreen/lockdown events, outside the frame cadence; never touches streaks
    ViolationSignal onDiscreteEvent(DiscreteEventKind kind, int64_t ts_ms);

    void setRules(const Rules& rules) { rules_ = rules; }
    const Rules& rules() const { return rules_; }

    float absenceStreak() const { return counters_.absence_streak; }
    int gazeViolationStreak() const { return counters_.gaze_violation_streak; }
    const std::string& sessionId() const { return session_id_; }

    void reset();

private:
    std::string session_id_;
    Rules rules_;
    SessionCounters counters_;
    uint64_t seq_ = 0;

    ViolationSignal makeSignal(ViolationKind kind, Severity severity,
                               const std::string& message, int64_t ts_ms);
    void decayAbsence();
};

} // namespace proctor::judger

#endif
