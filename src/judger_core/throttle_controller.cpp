#include "proctor/judger/throttle_controller.hpp"
#include <iostream>

namespace proctor::judger {

ThrottleController::ThrottleController(const ThrottlePolicy& policy)
    : policy_(policy) {}

ThrottleDecision ThrottleController::admit(const ViolationSignal& signal, int64_t now_ms) {
    ThrottleDecision d;

    if (signal.bypass_throttle) {
        d.report = true;
    } else {
        // 间隔不足则丢弃; 时钟回退视为到期
        bool due = !counters_.last_report_ms.has_value() ||
                   now_ms < *counters_.last_report_ms ||
                   (now_ms - *counters_.last_report_ms) > policy_.window_ms;
        if (!due) {
            if (policy_.log_verbose)
                std::cout << "[Throttle] " << signal.session_id << " suppressed "
                      << vision::toString(signal.kind) << " ("
                      << (now_ms - *counters_.last_report_ms) << " ms since last report)\n";
            return d;
        }
        d.report = true;
        counters_.last_report_ms = now_ms;
    }

    counters_.total_violations++;
    if (counters_.total_violations >= policy_.violation_ceiling) {
        std::cout << "[Throttle] " << signal.session_id << " reached "
                  << counters_.total_violations << " violations, lockdown\n";
        d.lockdown = true;
        counters_.total_violations = 0;
    }
    return d;
}

void ThrottleController::reset() {
    counters_ = SessionCounters{};
}

} // namespace proctor::judger
