#pragma once

/**
 * Outcome of a local command (connect, send_chat, move, ...).
 *
 * Everything except Ok and Redirected is an application error: it is
 * reported to the caller and produces no network traffic.
 */
enum class CommandResult {
    Ok,
    Redirected,        // direct target vanished, switched back to broadcast
    UnknownPeer,
    AlreadyConnected,
    PeerNotConnected,
    NoDirectTarget,    // feature needs a direct target, current one is broadcast
    FileNotFound,
    InvalidMove,
    NothingPending,
    EmptyMessage,
};

const char* to_string(CommandResult result);
