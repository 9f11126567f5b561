#include "proctor/session/frame_record.hpp"
#include "proctor/vision/Errors.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace std;

namespace proctor::session {

ReplayInferenceProvider::ReplayInferenceProvider(vector<FrameInference> frames)
    : frames_(frames.begin(), frames.end()) {}

optional<FrameInference> ReplayInferenceProvider::poll() {
    if (frames_.empty()) return nullopt;
    FrameInference f = std::move(frames_.front());
    frames_.pop_front();
    return f;
}

FrameRecord parseFrameRecord(const json& j) {
    FrameRecord rec;
    rec.ts_ms = j.value("ts_ms", int64_t{0});

    FrameInference fi;
    fi.ts_ms = rec.ts_ms;
    bool has_frame = false;

    if (j.contains("detections")) {
        const auto& d = j.at("detections");
        vision::DetectionTensor t;
        t.num_anchors = d.value("anchors", 0);
        t.x_ratio = d.value("x_ratio", 1.0f);
        t.y_ratio = d.value("y_ratio", 1.0f);
        t.data = d.at("data").get<vector<float>>();
        fi.detections = std::move(t);
        has_frame = true;
    }

    if (j.contains("gaze")) {
        const auto& g = j.at("gaze");
        vision::GazeLogits logits;
        logits.pitch = g.at("pitch").get<vector<float>>();
        logits.yaw   = g.at("yaw").get<vector<float>>();
        fi.gaze_logits = std::move(logits);
        has_frame = true;
    }

    if (j.contains("landmarks") && j["landmarks"].is_array()) {
        vision::FaceLandmarks lm;
        lm.points.reserve(j["landmarks"].size());
        for (const auto& p : j["landmarks"]) {
            if (!p.is_array() || p.size() < 2) continue;
            float z = p.size() > 2 ? p[2].get<float>() : 0.f;
            lm.points.emplace_back(p[0].get<float>(), p[1].get<float>(), z);
        }
        fi.landmarks = std::move(lm);
        has_frame = true;
    }

    if (has_frame) rec.frame = std::move(fi);

    if (j.contains("event")) {
        const string name = j.at("event").get<string>();
        auto kind = vision::discreteEventFromString(name);
        if (!kind) throw vision::ProctorError("unknown discrete event '" + name + "'");
        rec.event = *kind;
    }
    return rec;
}

vector<FrameRecord> readFrameRecords(const string& jsonl_path) {
    vector<FrameRecord> out;

    if (!fs::exists(jsonl_path) || !fs::is_regular_file(jsonl_path)) {
        cerr << "[Replay] Error: JSONL file not found: " << jsonl_path << endl;
        return out;
    }
    ifstream file(jsonl_path);
    if (!file.is_open()) {
        cerr << "[Replay] Error: Failed to open JSONL file: " << jsonl_path << endl;
        return out;
    }

    string line;
    size_t line_no = 0;
    while (getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            out.push_back(parseFrameRecord(json::parse(line)));
        } catch (const json::exception& e) {
            cerr << "[Replay] Line " << line_no << ": failed to parse: " << e.what() << endl;
        } catch (const vision::ProctorError& e) {
            cerr << "[Replay] Line " << line_no << ": " << e.what() << endl;
        }
    }

    cout << "[Replay] Read " << out.size() << " records from " << jsonl_path << endl;
    return out;
}

} // namespace proctor::session
