#include "session_state.h"

namespace p2plink {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Init: return "Init";
        case SessionState::InterfacesUp: return "InterfacesUp";
        case SessionState::AgentsStarted: return "AgentsStarted";
        case SessionState::Discovering: return "Discovering";
        case SessionState::PeersFound: return "PeersFound";
        case SessionState::NoPeersFound: return "NoPeersFound";
        case SessionState::Negotiating: return "Negotiating";
        case SessionState::AwaitingConnection: return "AwaitingConnection";
        case SessionState::FallbackAdHoc: return "FallbackAdHoc";
        case SessionState::Verified: return "Verified";
        case SessionState::Failed: return "Failed";
        default: return "Unknown";
    }
}

const char* to_string(SessionPath path) {
    switch (path) {
        case SessionPath::None: return "none";
        case SessionPath::Discovery: return "discovery";
        case SessionPath::Blind: return "blind";
        case SessionPath::AdHoc: return "adhoc";
        default: return "none";
    }
}

} // namespace p2plink
