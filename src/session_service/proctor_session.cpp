#include "proctor/session/proctor_session.hpp"
#include "proctor/vision/Errors.h"

#include <QtCore/QDateTime>
#include <QtCore/QDebug>

namespace proctor::session {

ProctorSession::ProctorSession(const QString& session_id,
                               std::shared_ptr<const vision::ProctorConfig> cfg,
                               std::unique_ptr<InferenceProvider> provider,
                               QObject* parent)
    : QObject(parent),
      session_id_(session_id),
      clock_([] { return static_cast<int64_t>(QDateTime::currentMSecsSinceEpoch()); }),
      pipeline_(session_id.toStdString(), cfg),
      provider_(std::move(provider))
{
    qRegisterMetaType<proctor::judger::ViolationSignal>();
    qRegisterMetaType<proctor::vision::DiscreteEventKind>();

    tick_.setInterval(pipeline_.config().tick_interval_ms);
    connect(&tick_, &QTimer::timeout, this, &ProctorSession::onTick);
}

ProctorSession::~ProctorSession() {
    stop();
}

void ProctorSession::start() {
    if (!provider_) {
        qWarning() << "[Session]" << session_id_ << "cannot start without an inference provider";
        return;
    }
    tick_.start();
    qInfo() << "[Session]" << session_id_ << "monitoring started, tick" << tick_.interval() << "ms";
}

void ProctorSession::stop() {
    const bool was_running = tick_.isActive();
    tick_.stop();
    provider_.reset();      // release model handles
    pipeline_.clear();
    if (was_running) qInfo() << "[Session]" << session_id_ << "monitoring stopped";
}

void ProctorSession::updateConfig(std::shared_ptr<const vision::ProctorConfig> cfg) {
    pipeline_.updateConfig(std::move(cfg));
    tick_.setInterval(pipeline_.config().tick_interval_ms);
}

void ProctorSession::setClock(Clock clock) {
    if (clock) clock_ = std::move(clock);
}

void ProctorSession::onTick() {
    if (!provider_) return;

    // inference not finished: skip this tick, nothing is queued
    std::optional<FrameInference> frame = provider_->poll();
    if (!frame) return;

    // provider timestamps may run on another time base than browser events
    frame->ts_ms = clock_();
    dispatch(pipeline_.processFrame(*frame));
}

void ProctorSession::onDiscreteEvent(proctor::vision::DiscreteEventKind kind) {
    dispatch(pipeline_.processDiscreteEvent(kind, clock_()));
}

void ProctorSession::dispatch(const PipelineResult& res) {
    if (!res.signal || !res.decision.report) return;
    emit violationReported(*res.signal);
    if (res.decision.lockdown) {
        qWarning() << "[Session]" << session_id_ << "violation ceiling reached, lockdown";
        emit lockdownTriggered(session_id_);
    }
}

} // namespace proctor::session
