#include "proctor/session/frame_record.hpp"
#include "proctor/session/replay.hpp"
#include "proctor/session/session_registry.hpp"
#include "proctor/vision/Config.h"
#include "proctor/vision/Errors.h"

#include <QtCore/QCoreApplication>
#include <QtCore/QDateTime>
#include <QtCore/QTimer>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using proctor::session::FrameInference;
using proctor::session::FrameRecord;
using proctor::vision::ProctorConfig;

// 用法:
//   proctor_cli <frames.jsonl> [config.yml|config.json] [out.jsonl] [--realtime]
// 默认: 逐行回放, 按记录时间戳驱动 pipeline, 每条上报的违规输出一行 JSON
// --realtime: 起 Qt 事件循环, 由 session 定时器按 tick_interval_ms 拉取帧, 帧与事件统一用 session 时钟打点

namespace {

void printUsage(const char* prog) {
    std::cerr << "usage: " << prog << " <frames.jsonl> [config.yml|config.json] [out.jsonl] [--realtime]\n";
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ProctorConfig loadConfig(const std::string& path) {
    if (path.empty()) return ProctorConfig{};
    if (endsWith(path, ".json")) return ProctorConfig::fromJson(path);
    return ProctorConfig::fromYaml(path);
}

int runRealtime(int argc, char* argv[], const std::vector<FrameRecord>& records,
                const ProctorConfig& cfg, std::ostream& out) {
    QCoreApplication app(argc, argv);

    std::vector<FrameInference> frames;
    for (const auto& rec : records) {
        if (rec.frame) frames.push_back(*rec.frame);
    }
    const size_t frame_count = frames.size();

    proctor::session::SessionRegistry registry(cfg);
    const QString id = QStringLiteral("realtime");
    auto* session = registry.startSession(
        id, std::make_unique<proctor::session::ReplayInferenceProvider>(std::move(frames)));
    if (!session) return 1;

    int reported = 0;
    QObject::connect(session, &proctor::session::ProctorSession::violationReported,
                     [&out, &reported](const proctor::judger::ViolationSignal& s) {
                         out << s.toJson().dump() << "\n";
                         ++reported;
                     });
    QObject::connect(session, &proctor::session::ProctorSession::lockdownTriggered,
                     [&out](const QString& sid) {
                         proctor::session::writeLockdown(out, sid.toStdString(),
                                                         QDateTime::currentMSecsSinceEpoch());
                     });

    // events are replayed at their offset from the first record
    const int64_t t0 = records.empty() ? 0 : records.front().ts_ms;
    for (const auto& rec : records) {
        if (!rec.event) continue;
        const auto kind = *rec.event;
        const int delay = static_cast<int>(std::max<int64_t>(0, rec.ts_ms - t0));
        QTimer::singleShot(delay, session, [session, kind]() { session->onDiscreteEvent(kind); });
    }

    // one tick per frame plus a spare
    const int run_ms = static_cast<int>((frame_count + 1) * static_cast<size_t>(cfg.tick_interval_ms));
    QTimer::singleShot(run_ms, &app, [&registry, &app]() {
        registry.stopAll();
        app.quit();
    });

    const int rc = app.exec();
    std::cerr << "[proctor_cli] frames=" << frame_count << " reported=" << reported << "\n";
    return rc;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    bool realtime = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--realtime") realtime = true;
        else if (a == "-h" || a == "--help") { printUsage(argv[0]); return 0; }
        else positional.push_back(a);
    }
    if (positional.empty() || positional.size() > 3) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        ProctorConfig cfg = loadConfig(positional.size() > 1 ? positional[1] : std::string());
        cfg.validate();

        auto records = proctor::session::readFrameRecords(positional[0]);
        if (records.empty()) {
            std::cerr << "[proctor_cli] no usable records in " << positional[0] << "\n";
            return 1;
        }

        std::ofstream file;
        if (positional.size() > 2) {
            file.open(positional[2]);
            if (!file.is_open()) {
                std::cerr << "[proctor_cli] cannot open output " << positional[2] << "\n";
                return 1;
            }
        }
        std::ostream& out = file.is_open() ? static_cast<std::ostream&>(file) : std::cout;

        if (realtime) return runRealtime(argc, argv, records, cfg, out);
        proctor::session::replayRecords(records, cfg, out);
        return 0;
    } catch (const proctor::vision::ConfigError& e) {
        std::cerr << "[proctor_cli] " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[proctor_cli] fatal: " << e.what() << "\n";
        return 1;
    }
}
