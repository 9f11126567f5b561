#include "proctor/session/replay.hpp"
#include "proctor/judger/data_structures.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace proctor::session {

void writeLockdown(std::ostream& out, const std::string& session_id, int64_t ts_ms) {
    nlohmann::json j;
    j["kind"] = "lockdown";
    j["sessionId"] = session_id;
    j["timestamp"] = judger::msToISO8601(ts_ms);
    out << j.dump() << "\n";
}

bool writeResult(std::ostream& out, const std::string& session_id, const PipelineResult& res) {
    if (!res.signal || !res.decision.report) return false;
    out << res.signal->toJson().dump() << "\n";
    if (res.decision.lockdown) writeLockdown(out, session_id, res.signal->ts_ms);
    return true;
}

ReplaySummary replayRecords(const std::vector<FrameRecord>& records,
                            const vision::ProctorConfig& cfg,
                            std::ostream& out,
                            const std::string& session_id) {
    ProctorPipeline pipeline(session_id, std::make_shared<const vision::ProctorConfig>(cfg));

    ReplaySummary sum;
    sum.records = records.size();
    auto tally = [&](const PipelineResult& res) {
        if (!writeResult(out, session_id, res)) return;
        ++sum.reported;
        if (res.decision.lockdown) ++sum.lockdowns;
    };

    for (const auto& rec : records) {
        if (rec.event) tally(pipeline.processDiscreteEvent(*rec.event, rec.ts_ms));
        if (rec.frame) {
            auto res = pipeline.processFrame(*rec.frame);
            if (res.skipped) ++sum.skipped;
            tally(res);
        }
    }

    // stderr: out may be stdout carrying the JSONL stream
    std::cerr << "[Replay] " << session_id << " records=" << sum.records
              << " reported=" << sum.reported
              << " lockdowns=" << sum.lockdowns
              << " skipped_frames=" << sum.skipped << "\n";
    return sum;
}

} // namespace proctor::session
