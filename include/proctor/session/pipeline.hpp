#ifndef PROCTOR_PIPELINE_HPP
#define PROCTOR_PIPELINE_HPP

#include "proctor/judger/data_structures.hpp"
#include "proctor/session/frame_record.hpp"
#include "proctor/vision/Config.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proctor::session {

// What one frame or event produced.
struct PipelineResult {
    std::optional<judger::ViolationSignal> signal;   // rule engine output (before throttling)
    judger::ThrottleDecision decision;               // report / lockdown
    std::vector<vision::DetectedObject> objects;
    std::optional<vision::GazeAnalysis> gaze;
    bool skipped = false;                            // frame rejected (bad shape / no detections)
};

// Single-session decode -> classify -> fuse -> throttle chain. Not thread-safe; one
// instance per monitored session, driven from a single thread.
class ProctorPipeline {
public:
    // @throws vision::ConfigError if cfg does not validate
    ProctorPipeline(std::string session_id, std::shared_ptr<const vision::ProctorConfig> cfg);
    ~ProctorPipeline();

    ProctorPipeline(const ProctorPipeline&) = delete;
    ProctorPipeline& operator=(const ProctorPipeline&) = delete;

    // Per-frame failures are logged and reported as skipped; never thrown.
    PipelineResult processFrame(const FrameInference& frame);

    // Browser event, handled immediately.
    PipelineResult processDiscreteEvent(vision::DiscreteEventKind kind, int64_t ts_ms);

    // Swap thresholds in between frames; history and counters are kept.
    // @throws vision::ConfigError, leaving the previous config active
    void updateConfig(std::shared_ptr<const vision::ProctorConfig> cfg);

    // smoother queries with the configured window K
    std::optional<vision::GazeVector> smoothedGaze() const;
    std::optional<vision::GazeZone>   smoothedZone() const;

    const std::string& sessionId() const;
    const vision::ProctorConfig& config() const;
    float absenceStreak() const;
    int gazeViolationStreak() const;
    const judger::SessionCounters& throttleCounters() const;
    size_t historySize() const;

    // clear history, timers and counters (session teardown)
    void clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace proctor::session

#endif
