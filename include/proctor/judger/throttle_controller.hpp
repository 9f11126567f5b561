#ifndef PROCTOR_THROTTLE_CONTROLLER_HPP
#define PROCTOR_THROTTLE_CONTROLLER_HPP

#include "data_structures.hpp"
#include <cstdint>

namespace proctor::judger {

struct ThrottlePolicy {
    int64_t window_ms = 5000;     // min gap between two throttled reports
    int     violation_ceiling = 3; // reported violations before lockdown
    bool    log_verbose = false;   // log every suppressed signal
};

// Rate-limits one session's outgoing reports and counts them toward lockdown.
//
// Signals flagged bypass_throttle (browser events) are always reported and do not
// restart the window. A clock that moved backwards since the last report counts as due. Once the running total reaches the ceiling the decision
// carries lockdown=true and the total starts again from 0.
class ThrottleController {
public:
    explicit ThrottleController(const ThrottlePolicy& policy);

    ThrottleDecision admit(const ViolationSignal& signal, int64_t now_ms);

    void setPolicy(const ThrottlePolicy& policy) { policy_ = policy; }
    const SessionCounters& counters() const { return counters_; }

    void reset();

private:
    ThrottlePolicy policy_;
    SessionCounters counters_;   // uses last_report_ms / total_violations
};

} // namespace proctor::judger

#endif
