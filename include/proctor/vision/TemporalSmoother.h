#pragma once
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include "Types.h"

namespace proctor::vision {

// Rolling gaze history for one session plus the continuous "looking away" timer.
//
// History is a bounded FIFO (oldest evicted first). Smoothed queries look at the
// last k samples and return std::nullopt while fewer than k are buffered.
class TemporalSmoother {
public:
    struct Options {
        int capacity              = 30;     // history size
        int look_away_duration_ms = 3000;   // off-screen time before a look-away is recorded
    };

    // is_looking_away stays true for this long after the last recorded look-away
    static constexpr int64_t LOOK_AWAY_HOLD_MS = 1000;

    explicit TemporalSmoother(const Options& opt);

    // Record one classified frame and update the look-away timer.
    GazeAnalysis observe(const GazeZone& zone, const HeadPose& pose, int64_t now_ms);

    // Append to history only (no timer update).
    void push(const GazeZone& zone);

    // mean gaze vector over the last k samples
    std::optional<GazeVector> smoothedGaze(int k) const;

    // Majority zone over the last k samples. Ties go to the zone seen first when
    // walking the window oldest -> newest.
    std::optional<GazeZone> smoothedZone(int k) const;

    size_t size() const { return history_.size(); }
    int capacity() const { return opt_.capacity; }

    std::optional<int64_t> lookAwayStartMs() const { return look_away_start_ms_; }
    std::optional<int64_t> lastLookAwayMs() const { return last_look_away_ms_; }

    // Runtime override; a smaller capacity evicts the oldest samples at once.
    void setOptions(const Options& opt);

    // drop history and timers (session teardown)
    void clear();

private:
    Options opt_;
    std::deque<GazeZone> history_;
    std::optional<int64_t> look_away_start_ms_;
    std::optional<int64_t> last_look_away_ms_;

    void trim();
    std::optional<std::string> makeWarning(const GazeZone& zone, const HeadPose& pose, int64_t now_ms) const;
};

} // namespace proctor::vision
