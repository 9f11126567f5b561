// ProctorPipeline: one session's decode -> classify -> fuse -> throttle chain
#include "proctor/session/pipeline.hpp"
#include "proctor/judger/throttle_controller.hpp"
#include "proctor/judger/violation_judger.hpp"
#include "proctor/vision/DetectionDecoder.h"
#include "proctor/vision/Errors.h"
#include "proctor/vision/GazeDecoder.h"
#include "proctor/vision/HeadPose.h"
#include "proctor/vision/TemporalSmoother.h"
#include "proctor/vision/ZoneClassifier.h"

#include <iostream>

namespace proctor::session {

using vision::ProctorConfig;

namespace {

vision::DetectionDecoder::Options decoderOptions(const ProctorConfig& c) {
    vision::DetectionDecoder::Options o;
    o.class_names    = c.class_names;
    o.conf_threshold = c.conf_threshold;
    o.iou_threshold  = c.iou_threshold;
    o.nms_classwise  = c.nms_classwise;
    return o;
}

vision::GazeDecoder::BinSpec binSpec(const ProctorConfig& c) {
    return vision::GazeDecoder::BinSpec{c.gaze_bins, c.gaze_bin_width_deg, c.gaze_angle_offset_deg};
}

vision::ZoneThresholds zoneThresholds(const ProctorConfig& c) {
    vision::ZoneThresholds t;
    t.gaze_x      = c.zone_gaze_x;
    t.gaze_y      = c.zone_gaze_y;
    t.yaw         = c.zone_yaw;
    t.pitch       = c.zone_pitch;
    t.phone_pitch = c.zone_phone_pitch;
    t.phone_yaw   = c.zone_phone_yaw;
    return t;
}

vision::TemporalSmoother::Options smootherOptions(const ProctorConfig& c) {
    return vision::TemporalSmoother::Options{c.history_capacity, c.look_away_duration_ms};
}

judger::ViolationJudger::Rules judgerRules(const ProctorConfig& c) {
    judger::ViolationJudger::Rules r;
    r.absence_streak_threshold = c.absence_streak_threshold;
    r.absence_decay            = c.absence_decay;
    r.violation_yaw            = c.violation_yaw;
    r.violation_pitch          = c.violation_pitch;
    r.gaze_streak_threshold    = c.gaze_streak_threshold;
    return r;
}

judger::ThrottlePolicy throttlePolicy(const ProctorConfig& c) {
    return judger::ThrottlePolicy{c.throttle_window_ms, c.violation_ceiling, c.log_verbose};
}

std::shared_ptr<const ProctorConfig> validated(std::shared_ptr<const ProctorConfig> cfg) {
    if (!cfg) throw vision::ConfigError("invalid config: null");
    cfg->validate();
    return cfg;
}

} // namespace

struct ProctorPipeline::Impl {
    std::string session_id;
    std::shared_ptr<const ProctorConfig> cfg;

    vision::DetectionDecoder  decoder;
    vision::GazeDecoder       gaze_decoder;
    vision::HeadPoseEstimator pose_estimator;
    vision::ZoneThresholds    zones;
    vision::TemporalSmoother  smoother;
    judger::ViolationJudger   judger;
    judger::ThrottleController throttle;

    Impl(std::string id, std::shared_ptr<const ProctorConfig> c)
        : session_id(std::move(id)),
          cfg(std::move(c)),
          decoder(decoderOptions(*cfg)),
          gaze_decoder(binSpec(*cfg)),
          pose_estimator(cfg->min_face_width),
          zones(zoneThresholds(*cfg)),
          smoother(smootherOptions(*cfg)),
          judger(session_id, judgerRules(*cfg)),
          throttle(throttlePolicy(*cfg))
    {}

    // model pose first, landmark geometry as fallback
    std::optional<vision::HeadPose> resolvePose(const FrameInference& frame) const {
        if (frame.gaze_logits) {
            return gaze_decoder.decode(*frame.gaze_logits);
        }
        if (frame.landmarks) {
            return pose_estimator.estimatePose(*frame.landmarks);
        }
        return std::nullopt;
    }

    PipelineResult finish(PipelineResult res, int64_t ts_ms) {
        if (res.signal) {
            res.decision = throttle.admit(*res.signal, ts_ms);
        }
        return res;
    }
};

ProctorPipeline::ProctorPipeline(std::string session_id, std::shared_ptr<const ProctorConfig> cfg)
    : impl_(new Impl(std::move(session_id), validated(std::move(cfg))))
{
    std::cout << "[Pipeline] Session " << impl_->session_id << " ready, classes="
              << impl_->decoder.numClasses() << "\n";
}

ProctorPipeline::~ProctorPipeline() = default;

PipelineResult ProctorPipeline::processFrame(const FrameInference& frame) {
    PipelineResult res;
    const bool verbose = impl_->cfg->log_verbose;

    if (verbose) {
        std::cout << "[Pipeline] " << impl_->session_id << " frame at " << frame.ts_ms << " ms\n";
    }

    // person count is meaningless without the detector, so the frame is dropped
    if (!frame.detections) {
        if (verbose) std::cout << "[Pipeline] " << impl_->session_id << " no detection tensor, frame skipped\n";
        res.skipped = true;
        return res;
    }

    // 1. decode detections and pose; malformed input rejects the whole frame
    std::optional<vision::HeadPose> pose;
    try {
        res.objects = impl_->decoder.decode(*frame.detections);
        pose = impl_->resolvePose(frame);
    } catch (const vision::ShapeMismatch& ex) {
        std::cerr << "[Pipeline] " << impl_->session_id << " frame at " << frame.ts_ms
                  << " rejected: " << ex.what() << "\n";
        res.objects.clear();
        res.skipped = true;
        return res;
    }

    if (verbose) {
        std::cout << "[Pipeline] " << impl_->session_id << " decoded " << res.objects.size() << " objects\n";
    }

    // 2. zone + temporal smoothing
    if (pose) {
        vision::GazeVector g;
        if (frame.landmarks) {
            if (auto est = impl_->pose_estimator.estimateGaze(*frame.landmarks)) g = *est;
        }
        vision::GazeZone zone = vision::classifyGazeZone(g.x, g.y, pose->pitch, pose->yaw, impl_->zones);
        res.gaze = impl_->smoother.observe(zone, *pose, frame.ts_ms);
    }

    // 3. rule fusion
    judger::FrameObservation obs;
    obs.ts_ms   = frame.ts_ms;
    obs.objects = res.objects;
    obs.pose    = pose;
    res.signal  = impl_->judger.evaluateFrame(obs);

    // 4. throttle
    return impl_->finish(std::move(res), frame.ts_ms);
}

PipelineResult ProctorPipeline::processDiscreteEvent(vision::DiscreteEventKind kind, int64_t ts_ms) {
    PipelineResult res;
    res.signal = impl_->judger.onDiscreteEvent(kind, ts_ms);
    return impl_->finish(std::move(res), ts_ms);
}

void ProctorPipeline::updateConfig(std::shared_ptr<const ProctorConfig> cfg) {
    cfg = validated(std::move(cfg));
    impl_->decoder      = vision::DetectionDecoder(decoderOptions(*cfg));
    impl_->gaze_decoder = vision::GazeDecoder(binSpec(*cfg));
    impl_->pose_estimator = vision::HeadPoseEstimator(cfg->min_face_width);
    impl_->zones = zoneThresholds(*cfg);
    impl_->smoother.setOptions(smootherOptions(*cfg));
    impl_->judger.setRules(judgerRules(*cfg));
    impl_->throttle.setPolicy(throttlePolicy(*cfg));
    impl_->cfg = std::move(cfg);
    std::cout << "[Pipeline] Session " << impl_->session_id << " config updated\n";
}

std::optional<vision::GazeVector> ProctorPipeline::smoothedGaze() const {
    return impl_->smoother.smoothedGaze(impl_->cfg->smoothing_window);
}

std::optional<vision::GazeZone> ProctorPipeline::smoothedZone() const {
    return impl_->smoother.smoothedZone(impl_->cfg->smoothing_window);
}

const std::string& ProctorPipeline::sessionId() const { return impl_->session_id; }
const ProctorConfig& ProctorPipeline::config() const { return *impl_->cfg; }
float ProctorPipeline::absenceStreak() const { return impl_->judger.absenceStreak(); }
int ProctorPipeline::gazeViolationStreak() const { return impl_->judger.gazeViolationStreak(); }
const judger::SessionCounters& ProctorPipeline::throttleCounters() const { return impl_->throttle.counters(); }
size_t ProctorPipeline::historySize() const { return impl_->smoother.size(); }

void ProctorPipeline::clear() {
    impl_->smoother.clear();
    impl_->judger.reset();
    impl_->throttle.reset();
}

} // namespace proctor::session
