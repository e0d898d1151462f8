#include "node/command_result.h"

const char* to_string(CommandResult result) {
    switch (result) {
        case CommandResult::Ok:               return "ok";
        case CommandResult::Redirected:       return "peer not connected, switched to broadcast";
        case CommandResult::UnknownPeer:      return "unknown peer";
        case CommandResult::AlreadyConnected: return "already connected";
        case CommandResult::PeerNotConnected: return "peer not connected";
        case CommandResult::NoDirectTarget:   return "select a direct chat first";
        case CommandResult::FileNotFound:     return "file not found";
        case CommandResult::InvalidMove:      return "invalid move";
        case CommandResult::NothingPending:   return "nothing pending";
        case CommandResult::EmptyMessage:     return "empty message";
    }
    return "unknown";
}
