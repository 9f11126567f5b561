#include "proctor/session/session_registry.hpp"
#include "proctor/vision/Errors.h"

#include <QtCore/QDebug>

namespace proctor::session {

SessionRegistry::SessionRegistry(const vision::ProctorConfig& cfg)
{
    cfg.validate();
    cfg_ = std::make_shared<const vision::ProctorConfig>(cfg);
}

SessionRegistry::~SessionRegistry() {
    stopAll();
}

ProctorSession* SessionRegistry::startSession(const QString& session_id,
                                              std::unique_ptr<InferenceProvider> provider) {
    if (sessions_.count(session_id)) {
        qWarning() << "[Registry] session" << session_id << "already active";
        return nullptr;
    }
    auto session = std::make_unique<ProctorSession>(session_id, cfg_, std::move(provider));
    ProctorSession* raw = session.get();
    sessions_.emplace(session_id, std::move(session));
    raw->start();
    qInfo() << "[Registry] active sessions:" << sessions_.size();
    return raw;
}

bool SessionRegistry::stopSession(const QString& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    it->second->stop();
    sessions_.erase(it);
    qInfo() << "[Registry] session" << session_id << "removed, active:" << sessions_.size();
    return true;
}

ProctorSession* SessionRegistry::find(const QString& session_id) const {
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

void SessionRegistry::updateConfig(const vision::ProctorConfig& cfg) {
    cfg.validate();
    auto next = std::make_shared<const vision::ProctorConfig>(cfg);
    for (auto& entry : sessions_) {
        entry.second->updateConfig(next);
    }
    cfg_ = std::move(next);
}

void SessionRegistry::stopAll() {
    for (auto& entry : sessions_) {
        entry.second->stop();
    }
    sessions_.clear();
}

} // namespace proctor::session
