#include <gtest/gtest.h>

#include "proctor/session/frame_record.hpp"
#include "proctor/vision/Errors.h"

#include <filesystem>
#include <fstream>

using namespace proctor::session;
using nlohmann::json;
namespace fs = std::filesystem;

TEST(FrameRecordTest, ParsesDetectionsGazeAndLandmarks) {
    auto j = json::parse(R"({
        "ts_ms": 1700000000123,
        "detections": {"anchors": 1, "x_ratio": 2.0, "y_ratio": 1.5,
                       "data": [10, 20, 30, 40, 0.9, 0, 0, 0]},
        "gaze": {"pitch": [0, 1, 2], "yaw": [2, 1, 0]},
        "landmarks": [[0.1, 0.2, 0.3], [0.4, 0.5]]
    })");
    auto rec = parseFrameRecord(j);

    EXPECT_EQ(rec.ts_ms, 1700000000123LL);
    EXPECT_FALSE(rec.event.has_value());
    ASSERT_TRUE(rec.frame.has_value());
    EXPECT_EQ(rec.frame->ts_ms, rec.ts_ms);

    ASSERT_TRUE(rec.frame->detections.has_value());
    EXPECT_EQ(rec.frame->detections->num_anchors, 1);
    EXPECT_FLOAT_EQ(rec.frame->detections->x_ratio, 2.f);
    EXPECT_EQ(rec.frame->detections->data.size(), 8u);

    ASSERT_TRUE(rec.frame->gaze_logits.has_value());
    EXPECT_EQ(rec.frame->gaze_logits->pitch.size(), 3u);

    ASSERT_TRUE(rec.frame->landmarks.has_value());
    ASSERT_EQ(rec.frame->landmarks->points.size(), 2u);
    EXPECT_FLOAT_EQ(rec.frame->landmarks->points[0].z, 0.3f);
    EXPECT_FLOAT_EQ(rec.frame->landmarks->points[1].z, 0.f);
}

TEST(FrameRecordTest, EventOnlyLineHasNoFrame) {
    auto rec = parseFrameRecord(json::parse(R"({"ts_ms": 5, "event": "tab-hidden"})"));
    EXPECT_FALSE(rec.frame.has_value());
    ASSERT_TRUE(rec.event.has_value());
    EXPECT_EQ(*rec.event, proctor::vision::DiscreteEventKind::TAB_HIDDEN);
}

TEST(FrameRecordTest, UnknownEventThrows) {
    EXPECT_THROW(parseFrameRecord(json::parse(R"({"ts_ms": 5, "event": "teleport"})")),
                 proctor::vision::ProctorError);
}

TEST(FrameRecordTest, ReaderSkipsBadLines) {
    fs::path p = fs::temp_directory_path() / "proctor_replay_test.jsonl";
    {
        std::ofstream ofs(p);
        ofs << R"({"ts_ms": 1, "event": "window-blur"})" << "\n";
        ofs << "not json at all\n";
        ofs << "\n";
        ofs << R"({"ts_ms": 2, "event": "no-such-event"})" << "\n";
        ofs << R"({"ts_ms": 3, "detections": {"anchors": 1, "data": [0,0,0,0,0,0,0,0]}})" << "\n";
    }
    auto records = readFrameRecords(p.string());
    fs::remove(p);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].ts_ms, 1);
    EXPECT_EQ(records[1].ts_ms, 3);
}

TEST(FrameRecordTest, MissingFileGivesNoRecords) {
    EXPECT_TRUE(readFrameRecords("/nonexistent/replay.jsonl").empty());
}

TEST(ReplayInferenceProviderTest, HandsOutFramesInOrderThenNothing) {
    FrameInference a; a.ts_ms = 1;
    FrameInference b; b.ts_ms = 2;
    ReplayInferenceProvider provider({a, b});
    EXPECT_EQ(provider.remaining(), 2u);
    EXPECT_EQ(provider.poll()->ts_ms, 1);
    EXPECT_EQ(provider.poll()->ts_ms, 2);
    EXPECT_FALSE(provider.poll().has_value());
}
