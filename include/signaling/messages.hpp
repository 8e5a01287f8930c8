#ifndef _SIGNALING_MESSAGES_H_
#define _SIGNALING_MESSAGES_H_

#include "base/defines.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace meshrtc {
namespace signaling {

struct MESHRTC_EXPORT ParticipantInfo {
    std::string id;
    std::optional<std::string> name;
};

// client -> server
struct MESHRTC_EXPORT JoinRoom {
    std::string room_id;
    std::string participant_id;
    std::optional<std::string> name;
};

// server -> client
struct MESHRTC_EXPORT JoinedRoom {
    std::string room_id;
    std::string participant_id;
    size_t participant_count = 0;
};

// server -> client, sent right after `JoinedRoom`.
struct MESHRTC_EXPORT ExistingParticipants {
    std::vector<ParticipantInfo> participants;
};

// server -> all others
struct MESHRTC_EXPORT ParticipantJoined {
    std::string participant_id;
    std::optional<std::string> name;
    size_t participant_count = 0;
};

// server -> all others
struct MESHRTC_EXPORT ParticipantLeft {
    std::string participant_id;
    size_t participant_count = 0;
};

// Relayed verbatim by the server. A client addresses the message with 
// `target_participant_id`, the server swaps it for `from_participant_id`
// before forwarding. The payload is never inspected by the server.
struct MESHRTC_EXPORT RelayedMessage {
    std::optional<std::string> target_participant_id;
    std::optional<std::string> from_participant_id;
    nlohmann::json payload;
};

// Payload: {type, sdp}
struct MESHRTC_EXPORT Offer : public RelayedMessage {};
// Payload: {type, sdp}
struct MESHRTC_EXPORT Answer : public RelayedMessage {};
// Payload: {candidate, sdpMid, sdpMLineIndex}
struct MESHRTC_EXPORT IceCandidate : public RelayedMessage {};

// client -> server
struct MESHRTC_EXPORT LeaveRoom {};

// server -> client
struct MESHRTC_EXPORT Error {
    std::string error;
};

using Message = std::variant<JoinRoom, 
                             JoinedRoom, 
                             ExistingParticipants, 
                             ParticipantJoined, 
                             ParticipantLeft, 
                             Offer, 
                             Answer, 
                             IceCandidate, 
                             LeaveRoom, 
                             Error>;

class MESHRTC_EXPORT ParseError : public std::invalid_argument {
public:
    enum class Kind {
        INVALID_JSON,
        UNKNOWN_TYPE,
        MALFORMED
    };
public:
    ParseError(Kind kind, std::string type, const std::string& what);

    Kind kind() const { return kind_; }
    // The `type` field of the message, empty if it's missing.
    const std::string& type() const { return type_; }

private:
    Kind kind_;
    std::string type_;
};

// Returns the wire name of the message kind, e.g. "join-room".
MESHRTC_EXPORT std::string_view TypeName(const Message& message);

// Parses a text frame, throws ParseError on failure.
MESHRTC_EXPORT Message Parse(std::string_view text);

MESHRTC_EXPORT std::string Serialize(const Message& message);

} // namespace signaling
} // namespace meshrtc

#endif
