#pragma once

#include <string>
#include <vector>

#include "events/node_observer.h"

/**
 * Fans engine events out to every subscribed NodeObserver.
 *
 * Observers are not owned. Subscribing or unsubscribing from inside a
 * callback is allowed; the change takes effect with the next event.
 */
class ObserverHub {
public:
    void subscribe(NodeObserver* observer);
    void unsubscribe(NodeObserver* observer);

    void registry_changed(const std::vector<DiscoveredPeer>& peers);
    void connections_changed(const std::vector<SessionInfo>& sessions);
    void active_target_changed(const ActiveTarget& target);
    void chat_received(const ChatMessage& message);
    void nudge_received(const std::string& from_name);
    void game_updated(const GameSnapshot& game);
    void exec_request(const PendingCommandRequest& request);
    void exec_result(const ExecResult& result);
    void file_received(const ReceivedFile& file);

    /// Log through spdlog and forward to observers.
    void notice(NoticeLevel level, const std::string& text);

private:
    template <typename Fn>
    void publish(Fn&& fn) {
        const auto observers = observers_;
        for (NodeObserver* observer : observers) fn(*observer);
    }

    std::vector<NodeObserver*> observers_;
};
