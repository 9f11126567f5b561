#ifndef PROCTOR_REPLAY_HPP
#define PROCTOR_REPLAY_HPP

#include "proctor/session/frame_record.hpp"
#include "proctor/session/pipeline.hpp"
#include "proctor/vision/Config.h"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace proctor::session {

struct ReplaySummary {
    size_t records   = 0;
    int    reported  = 0;
    int    lockdowns = 0;
    int    skipped   = 0;   // frames rejected by the pipeline
};

// {"kind":"lockdown","sessionId":...,"timestamp":ISO-8601}
void writeLockdown(std::ostream& out, const std::string& session_id, int64_t ts_ms);

// Writes one JSON line per reported signal, followed by a lockdown line when the
// ceiling is reached with it. Returns whether anything was written.
bool writeResult(std::ostream& out, const std::string& session_id, const PipelineResult& res);

// Runs recorded lines through a fresh pipeline on their own timestamps.
// An event and a frame on one line are processed event first.
// @throws vision::ConfigError on an invalid config
ReplaySummary replayRecords(const std::vector<FrameRecord>& records,
                            const vision::ProctorConfig& cfg,
                            std::ostream& out,
                            const std::string& session_id = "replay");

} // namespace proctor::session

#endif
