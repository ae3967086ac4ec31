#ifndef P2PLINK_SESSION_STATE_H
#define P2PLINK_SESSION_STATE_H

namespace p2plink {

// =======================================================
// Pairing phases (happy path is monotonic forward; the
// only alternate edge is Negotiating/AwaitingConnection
// -> FallbackAdHoc)
// =======================================================
enum class SessionState {
    Init,
    InterfacesUp,
    AgentsStarted,
    Discovering,
    PeersFound,
    NoPeersFound,
    Negotiating,
    AwaitingConnection,
    FallbackAdHoc,
    Verified,
    Failed
};

// Which route produced the link (reported to callers)
enum class SessionPath {
    None,
    Discovery,
    Blind,
    AdHoc
};

const char* to_string(SessionState state);
const char* to_string(SessionPath path);

inline bool is_terminal(SessionState state) {
    return state == SessionState::Verified || state == SessionState::Failed;
}

} // namespace p2plink

#endif // P2PLINK_SESSION_STATE_H
