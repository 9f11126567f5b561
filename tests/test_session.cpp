#include <gtest/gtest.h>

#include "proctor/session/proctor_session.hpp"
#include "proctor/session/session_registry.hpp"
#include "proctor/vision/Errors.h"
#include "test_helpers.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QTimer>

#include <vector>

using namespace proctor;
using proctor::test::Anchor;
using proctor::test::frameWith;
using session::FrameInference;
using session::ProctorSession;
using session::ReplayInferenceProvider;
using session::SessionRegistry;
using vision::ProctorConfig;

namespace {

const Anchor kNothing{100, 100, 50, 50, {0.f, 0.f, 0.f, 0.f}};

std::unique_ptr<ReplayInferenceProvider> emptyFrames(int n) {
    std::vector<FrameInference> frames;
    for (int i = 1; i <= n; ++i) frames.push_back(frameWith(i * 1000, {kNothing}));
    return std::make_unique<ReplayInferenceProvider>(std::move(frames));
}

// Records everything a session emits.
struct SignalSink {
    std::vector<judger::ViolationSignal> reported;
    std::vector<QString> lockdowns;

    void attach(ProctorSession* s) {
        QObject::connect(s, &ProctorSession::violationReported,
                         [this](const judger::ViolationSignal& v) { reported.push_back(v); });
        QObject::connect(s, &ProctorSession::lockdownTriggered,
                         [this](const QString& id) { lockdowns.push_back(id); });
    }
};

} // namespace

TEST(ProctorSessionTest, DiscreteEventEmitsImmediately) {
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(), emptyFrames(0));
    SignalSink sink;
    sink.attach(&s);

    s.onDiscreteEvent(vision::DiscreteEventKind::TAB_HIDDEN);
    ASSERT_EQ(sink.reported.size(), 1u);
    EXPECT_EQ(sink.reported[0].kind, vision::ViolationKind::TAB_SWITCH);
    EXPECT_EQ(sink.reported[0].session_id, "exam-1");
}

TEST(ProctorSessionTest, TicksFeedThePipeline) {
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(), emptyFrames(3));
    SignalSink sink;
    sink.attach(&s);

    s.onTick();
    s.onTick();
    EXPECT_TRUE(sink.reported.empty());
    s.onTick();
    ASSERT_EQ(sink.reported.size(), 1u);
    EXPECT_EQ(sink.reported[0].kind, vision::ViolationKind::ABSENCE);

    // provider drained: tick is a no-op
    s.onTick();
    EXPECT_EQ(sink.reported.size(), 1u);
}

TEST(ProctorSessionTest, LockdownSignalAtCeiling) {
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(), emptyFrames(0));
    SignalSink sink;
    sink.attach(&s);

    s.onDiscreteEvent(vision::DiscreteEventKind::TAB_HIDDEN);
    s.onDiscreteEvent(vision::DiscreteEventKind::FULLSCREEN_EXITED);
    EXPECT_TRUE(sink.lockdowns.empty());
    s.onDiscreteEvent(vision::DiscreteEventKind::TAB_HIDDEN);
    ASSERT_EQ(sink.lockdowns.size(), 1u);
    EXPECT_EQ(sink.lockdowns[0], QString("exam-1"));
}

TEST(ProctorSessionTest, BrowserEventsInsideWindowAreAllEmitted) {
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(), emptyFrames(0));
    SignalSink sink;
    sink.attach(&s);

    s.onDiscreteEvent(vision::DiscreteEventKind::CLIPBOARD_ATTEMPT);
    s.onDiscreteEvent(vision::DiscreteEventKind::CLIPBOARD_ATTEMPT);
    EXPECT_TRUE(sink.lockdowns.empty());
    s.onDiscreteEvent(vision::DiscreteEventKind::CLIPBOARD_ATTEMPT);

    ASSERT_EQ(sink.reported.size(), 3u);
    for (const auto& v : sink.reported) EXPECT_EQ(v.kind, vision::ViolationKind::LOCKDOWN_BREACH);
    ASSERT_EQ(sink.lockdowns.size(), 1u);
}

TEST(ProctorSessionTest, EventsAndFramesShareOneClock) {
    // provider stamps frames on a clock far behind wall time
    std::vector<FrameInference> frames;
    for (int i = 0; i < 60; ++i) {
        frames.push_back(frameWith(1700000000000LL + i * 1000,
                                   {proctor::test::person(300, 300), proctor::test::phone(600, 100)}));
    }
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(),
                     std::make_unique<ReplayInferenceProvider>(std::move(frames)));
    int64_t now = 1760000000000LL;
    s.setClock([&now] { return now; });
    SignalSink sink;
    sink.attach(&s);

    s.onDiscreteEvent(vision::DiscreteEventKind::WINDOW_BLUR);
    for (int i = 0; i < 60; ++i) {
        now += 1000;
        s.onTick();
    }

    int phone_reports = 0;
    for (const auto& v : sink.reported) {
        if (v.kind == vision::ViolationKind::FORBIDDEN_OBJECT) {
            ++phone_reports;
            EXPECT_GT(v.ts_ms, 1760000000000LL);
        }
    }
    // one report per 5 s window over 60 s of phone frames
    EXPECT_GE(phone_reports, 10);
    EXPECT_FALSE(sink.lockdowns.empty());
}

TEST(ProctorSessionTest, CannotStartWithoutProvider) {
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(), nullptr);
    s.start();
    EXPECT_FALSE(s.isRunning());
}

TEST(ProctorSessionTest, StopHaltsTimerAndClearsState) {
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(), emptyFrames(5));
    s.start();
    EXPECT_TRUE(s.isRunning());
    s.onTick();
    EXPECT_FLOAT_EQ(s.pipeline().absenceStreak(), 1.f);

    s.stop();
    EXPECT_FALSE(s.isRunning());
    EXPECT_FLOAT_EQ(s.pipeline().absenceStreak(), 0.f);

    // provider released: further ticks do nothing
    s.onTick();
    EXPECT_FLOAT_EQ(s.pipeline().absenceStreak(), 0.f);
}

TEST(ProctorSessionTest, TimerDrivesTicks) {
    ProctorConfig cfg;
    cfg.tick_interval_ms = 5;
    ProctorSession s("exam-1", std::make_shared<const ProctorConfig>(cfg), emptyFrames(3));
    SignalSink sink;
    sink.attach(&s);

    s.start();
    QEventLoop loop;
    QTimer::singleShot(300, &loop, &QEventLoop::quit);
    loop.exec();
    s.stop();

    ASSERT_EQ(sink.reported.size(), 1u);
    EXPECT_EQ(sink.reported[0].kind, vision::ViolationKind::ABSENCE);
}

TEST(SessionRegistryTest, OneSessionPerId) {
    SessionRegistry registry{ProctorConfig{}};
    auto* a = registry.startSession("a", emptyFrames(1));
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->isRunning());
    EXPECT_EQ(registry.startSession("a", emptyFrames(1)), nullptr);
    EXPECT_NE(registry.startSession("b", emptyFrames(1)), nullptr);
    EXPECT_EQ(registry.activeCount(), 2u);
    EXPECT_EQ(registry.find("a"), a);
    EXPECT_EQ(registry.find("zzz"), nullptr);

    EXPECT_TRUE(registry.stopSession("a"));
    EXPECT_FALSE(registry.stopSession("a"));
    EXPECT_EQ(registry.activeCount(), 1u);
    EXPECT_EQ(registry.find("a"), nullptr);

    registry.stopAll();
    EXPECT_EQ(registry.activeCount(), 0u);
}

TEST(SessionRegistryTest, SessionsKeepIndependentCounters) {
    SessionRegistry registry{ProctorConfig{}};
    auto* a = registry.startSession("a", emptyFrames(2));
    auto* b = registry.startSession("b", emptyFrames(2));
    a->onTick();
    a->onTick();
    EXPECT_FLOAT_EQ(a->pipeline().absenceStreak(), 2.f);
    EXPECT_FLOAT_EQ(b->pipeline().absenceStreak(), 0.f);
}

TEST(SessionRegistryTest, ConfigUpdateReachesLiveSessions) {
    SessionRegistry registry{ProctorConfig{}};
    auto* a = registry.startSession("a", emptyFrames(1));

    ProctorConfig next;
    next.conf_threshold = 0.6f;
    registry.updateConfig(next);
    EXPECT_FLOAT_EQ(a->pipeline().config().conf_threshold, 0.6f);
    EXPECT_FLOAT_EQ(registry.config()->conf_threshold, 0.6f);

    ProctorConfig bad;
    bad.violation_ceiling = 0;
    EXPECT_THROW(registry.updateConfig(bad), vision::ConfigError);
    EXPECT_FLOAT_EQ(a->pipeline().config().conf_threshold, 0.6f);
    EXPECT_EQ(registry.config()->violation_ceiling, 3);
}

TEST(SessionRegistryTest, InvalidInitialConfigThrows) {
    ProctorConfig bad;
    bad.history_capacity = 0;
    EXPECT_THROW(SessionRegistry{bad}, vision::ConfigError);
}
