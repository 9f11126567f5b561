#pragma once
// 单个考试会话的监考驱动: 定时 tick 拉取推理结果 + 即时处理浏览器事件

#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>

#include <cstdint>
#include <functional>
#include <memory>

#include "proctor/session/frame_record.hpp"
#include "proctor/session/pipeline.hpp"

namespace proctor::session {

// Frames and browser events are stamped from one session clock, so the throttle
// window never compares timestamps from two different time bases.
class ProctorSession : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<int64_t()>;

    // @throws vision::ConfigError (from the pipeline) on an invalid config
    ProctorSession(const QString& session_id,
                   std::shared_ptr<const vision::ProctorConfig> cfg,
                   std::unique_ptr<InferenceProvider> provider,
                   QObject* parent = nullptr);
    ~ProctorSession() override;

    // start / stop the tick timer; stop() also releases the provider and clears state
    void start();
    void stop();
    bool isRunning() const { return tick_.isActive(); }

    // @throws vision::ConfigError, previous config stays active
    void updateConfig(std::shared_ptr<const vision::ProctorConfig> cfg);

    // defaults to QDateTime::currentMSecsSinceEpoch
    void setClock(Clock clock);

    QString sessionId() const { return session_id_; }
    const ProctorPipeline& pipeline() const { return pipeline_; }

public slots:
    // browser visibility / fullscreen / lockdown listener entry point
    void onDiscreteEvent(proctor::vision::DiscreteEventKind kind);

    // one pipeline step; driven by the timer
    void onTick();

signals:
    void violationReported(const proctor::judger::ViolationSignal& signal);
    void lockdownTriggered(const QString& session_id);

private:
    void dispatch(const PipelineResult& res);

    QString session_id_;
    Clock clock_;
    ProctorPipeline pipeline_;
    std::unique_ptr<InferenceProvider> provider_;
    QTimer tick_;
};

} // namespace proctor::session

Q_DECLARE_METATYPE(proctor::judger::ViolationSignal)
Q_DECLARE_METATYPE(proctor::vision::DiscreteEventKind)
