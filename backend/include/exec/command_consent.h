#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "events/observer_hub.h"
#include "exec/command_runner.h"
#include "node/command_result.h"
#include "node/connection_manager.h"
#include "node/identity.h"

/**
 * Remote command execution gated on a local human's approval.
 *
 * A peer's exec-request is parked as the one pending request; a newer
 * request replaces it. Nothing runs until approve() is called locally.
 * There is no expiry and no deny message: ignoring a request is enough.
 */
class CommandConsent {
public:
    CommandConsent(const Identity& identity,
                   ConnectionManager& connections,
                   CommandRunner& runner,
                   ObserverHub& hub);

    /// Ask the current direct target to run @p command. Nothing is recorded here.
    CommandResult request(const std::string& command);

    /// Run the pending request once and send its output back.
    CommandResult approve();

    /// Forget the pending request without telling anyone.
    CommandResult deny();

    void on_request(const SessionInfo& from, const nlohmann::json& payload);
    void on_result(const SessionInfo& from, const nlohmann::json& payload);

    [[nodiscard]] const std::optional<PendingCommandRequest>& pending() const { return pending_; }

private:
    const Identity& identity_;
    ConnectionManager& connections_;
    CommandRunner& runner_;
    ObserverHub& hub_;

    std::optional<PendingCommandRequest> pending_;
};
