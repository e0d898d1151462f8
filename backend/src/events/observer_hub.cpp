/**
 * ObserverHub — event fan-out from the engine to the UI layer.
 */

#include "events/observer_hub.h"

#include <algorithm>
#include <spdlog/spdlog.h>

const char* to_string(GamePhase phase) {
    switch (phase) {
        case GamePhase::Idle:   return "idle";
        case GamePhase::Active: return "active";
        case GamePhase::Over:   return "over";
    }
    return "unknown";
}

void ObserverHub::subscribe(NodeObserver* observer) {
    if (observer == nullptr) return;
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void ObserverHub::unsubscribe(NodeObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void ObserverHub::registry_changed(const std::vector<DiscoveredPeer>& peers) {
    publish([&](NodeObserver& o) { o.on_registry_changed(peers); });
}

void ObserverHub::connections_changed(const std::vector<SessionInfo>& sessions) {
    publish([&](NodeObserver& o) { o.on_connections_changed(sessions); });
}

void ObserverHub::active_target_changed(const ActiveTarget& target) {
    publish([&](NodeObserver& o) { o.on_active_target_changed(target); });
}

void ObserverHub::chat_received(const ChatMessage& message) {
    publish([&](NodeObserver& o) { o.on_chat_received(message); });
}

void ObserverHub::nudge_received(const std::string& from_name) {
    publish([&](NodeObserver& o) { o.on_nudge_received(from_name); });
}

void ObserverHub::game_updated(const GameSnapshot& game) {
    publish([&](NodeObserver& o) { o.on_game_updated(game); });
}

void ObserverHub::exec_request(const PendingCommandRequest& request) {
    publish([&](NodeObserver& o) { o.on_exec_request(request); });
}

void ObserverHub::exec_result(const ExecResult& result) {
    publish([&](NodeObserver& o) { o.on_exec_result(result); });
}

void ObserverHub::file_received(const ReceivedFile& file) {
    publish([&](NodeObserver& o) { o.on_file_received(file); });
}

void ObserverHub::notice(NoticeLevel level, const std::string& text) {
    switch (level) {
        case NoticeLevel::Info:    spdlog::info("{}", text); break;
        case NoticeLevel::Warning: spdlog::warn("{}", text); break;
        case NoticeLevel::Error:   spdlog::error("{}", text); break;
    }
    const Notice notice{level, text};
    publish([&](NodeObserver& o) { o.on_notice(notice); });
}
