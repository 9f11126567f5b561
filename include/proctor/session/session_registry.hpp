#pragma once
// 会话注册表: 每个考生一个独立 ProctorSession, 仅共享只读配置

#include <QtCore/QString>

#include <map>
#include <memory>

#include "proctor/session/proctor_session.hpp"
#include "proctor/vision/Config.h"

namespace proctor::session {

class SessionRegistry {
public:
    // @throws vision::ConfigError
    explicit SessionRegistry(const vision::ProctorConfig& cfg);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Creates and starts a session. Returns nullptr if the id is already active.
    ProctorSession* startSession(const QString& session_id, std::unique_ptr<InferenceProvider> provider);

    // Stops and destroys the session; false if unknown.
    bool stopSession(const QString& session_id);

    ProctorSession* find(const QString& session_id) const;
    size_t activeCount() const { return sessions_.size(); }

    // Validates, then pushes the new thresholds to every live session.
    // @throws vision::ConfigError, nothing is changed in that case
    void updateConfig(const vision::ProctorConfig& cfg);

    std::shared_ptr<const vision::ProctorConfig> config() const { return cfg_; }

    void stopAll();

private:
    std::shared_ptr<const vision::ProctorConfig> cfg_;
    std::map<QString, std::unique_ptr<ProctorSession>> sessions_;
};

} // namespace proctor::session
