#include "proctor/judger/violation_judger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>

using namespace std;

namespace proctor::judger {

using vision::ObjectLabel;
using vision::countLabel;

ViolationJudger::ViolationJudger(string session_id, const Rules& rules)
    : session_id_(std::move(session_id)), rules_(rules)
{
}

ViolationSignal ViolationJudger::makeSignal(ViolationKind kind, Severity severity,
                                            const string& message, int64_t ts_ms) {
    ViolationSignal s;
    s.id = session_id_ + "_" + to_string(ts_ms) + "_" + to_string(++seq_);
    s.session_id = session_id_;
    s.kind = kind;
    s.severity = severity;
    s.message = message;
    s.ts_ms = ts_ms;
    s.bypass_throttle = false;

    cout << "[Judger] " << session_id_ << " " << vision::toString(kind)
         << " (" << vision::toString(severity) << "): " << message << endl;
    return s;
}

void ViolationJudger::decayAbsence() {
    counters_.absence_streak = max(0.f, counters_.absence_streak - rules_.absence_decay);
}

optional<ViolationSignal> ViolationJudger::evaluateFrame(const FrameObservation& obs) {
    const int person_count = countLabel(obs.objects, ObjectLabel::PERSON);
    const int phone_count  = countLabel(obs.objects, ObjectLabel::PHONE);
    const int book_count   = countLabel(obs.objects, ObjectLabel::BOOK);
    const int paper_count  = countLabel(obs.objects, ObjectLabel::PAPER);

    // case1: more than one person, no debounce
    if (person_count > 1) {
        return makeSignal(ViolationKind::MULTIPLE_PERSONS, Severity::HIGH,
                          "Detected " + to_string(person_count) + " people", obs.ts_ms);
    }

    // case2: nobody in frame; only fires once the streak reaches the threshold
    if (person_count == 0) {
        counters_.absence_streak += 1.f;
        if (counters_.absence_streak >= static_cast<float>(rules_.absence_streak_threshold)) {
            counters_.absence_streak = 0.f;
            return makeSignal(ViolationKind::ABSENCE, Severity::HIGH, "No person detected", obs.ts_ms);
        }
        return nullopt;
    }

    // case3/4: forbidden objects
    if (phone_count > 0) {
        return makeSignal(ViolationKind::FORBIDDEN_OBJECT, Severity::HIGH, "Phone detected", obs.ts_ms);
    }
    if (book_count > 0 || paper_count > 0) {
        return makeSignal(ViolationKind::FORBIDDEN_OBJECT, Severity::MEDIUM, "Book/Paper detected", obs.ts_ms);
    }

    // case5: head turned beyond the violation bounds for several consecutive frames
    if (obs.pose) {
        const auto& p = *obs.pose;
        if (fabs(p.yaw) > rules_.violation_yaw || fabs(p.pitch) > rules_.violation_pitch) {
            counters_.gaze_violation_streak++;
            if (counters_.gaze_violation_streak >= rules_.gaze_streak_threshold) {
                counters_.gaze_violation_streak = 0;
                char msg[64];
                snprintf(msg, sizeof(msg), "Looking away (Y:%.0f, P:%.0f)", p.yaw, p.pitch);
                return makeSignal(ViolationKind::GAZE_DEVIATION, Severity::MEDIUM, msg, obs.ts_ms);
            }
        } else {
            counters_.gaze_violation_streak = max(0, counters_.gaze_violation_streak - 1);
        }
    }

    // clean frame: soften suspicion instead of clearing it
    decayAbsence();
    return nullopt;
}

ViolationSignal ViolationJudger::onDiscreteEvent(DiscreteEventKind kind, int64_t ts_ms) {
    ViolationSignal s;
    switch (kind) {
        case DiscreteEventKind::TAB_HIDDEN:
            s = makeSignal(ViolationKind::TAB_SWITCH, Severity::HIGH, "Tab switch detected", ts_ms);
            break;
        case DiscreteEventKind::FULLSCREEN_EXITED:
            s = makeSignal(ViolationKind::FULLSCREEN_EXIT, Severity::HIGH, "Exited fullscreen mode", ts_ms);
            break;
        default:
            s = makeSignal(ViolationKind::LOCKDOWN_BREACH, Severity::MEDIUM,
                           "Security violation: " + vision::toString(kind), ts_ms);
            break;
    }
    // browser events are never dropped by the window, each one counts toward the ceiling
    s.bypass_throttle = true;
    return s;
}

void ViolationJudger::reset() {
    counters_.absence_streak = 0.f;
    counters_.gaze_violation_streak = 0;
}

} // namespace proctor::judger
