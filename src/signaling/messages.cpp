#include "signaling/messages.hpp"

namespace meshrtc {
namespace signaling {
namespace {

using json = nlohmann::json;

constexpr std::string_view kJoinRoom = "join-room";
constexpr std::string_view kJoinedRoom = "joined-room";
constexpr std::string_view kExistingParticipants = "existing-participants";
constexpr std::string_view kParticipantJoined = "participant-joined";
constexpr std::string_view kParticipantLeft = "participant-left";
constexpr std::string_view kOffer = "offer";
constexpr std::string_view kAnswer = "answer";
constexpr std::string_view kIceCandidate = "ice-candidate";
constexpr std::string_view kLeaveRoom = "leave-room";
constexpr std::string_view kError = "error";

ParseError Malformed(const std::string& type) {
    return ParseError(ParseError::Kind::MALFORMED, type, "Malformed " + type + " message");
}

std::string RequireString(const json& object, const char* key, const std::string& type) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        throw Malformed(type);
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        throw Malformed(type);
    }
    return value;
}

std::optional<std::string> OptionalString(const json& object, const char* key, const std::string& type) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw Malformed(type);
    }
    return it->get<std::string>();
}

size_t RequireCount(const json& object, const char* key, const std::string& type) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_unsigned()) {
        throw Malformed(type);
    }
    return it->get<size_t>();
}

template <typename T>
T ParseRelayed(const json& object, const char* payload_key, const std::string& type) {
    T message;
    message.target_participant_id = OptionalString(object, "targetParticipantId", type);
    message.from_participant_id = OptionalString(object, "fromParticipantId", type);
    auto it = object.find(payload_key);
    if (it == object.end() || it->is_null()) {
        throw Malformed(type);
    }
    message.payload = *it;
    return message;
}

void SerializeRelayed(const RelayedMessage& message, const char* payload_key, json& object) {
    if (message.target_participant_id) {
        object["targetParticipantId"] = *message.target_participant_id;
    }
    if (message.from_participant_id) {
        object["fromParticipantId"] = *message.from_participant_id;
    }
    object[payload_key] = message.payload;
}

} // namespace

ParseError::ParseError(Kind kind, std::string type, const std::string& what) 
    : std::invalid_argument(what),
      kind_(kind),
      type_(std::move(type)) {}

std::string_view TypeName(const Message& message) {
    return std::visit(overloaded {
        [](const JoinRoom&) { return kJoinRoom; },
        [](const JoinedRoom&) { return kJoinedRoom; },
        [](const ExistingParticipants&) { return kExistingParticipants; },
        [](const ParticipantJoined&) { return kParticipantJoined; },
        [](const ParticipantLeft&) { return kParticipantLeft; },
        [](const Offer&) { return kOffer; },
        [](const Answer&) { return kAnswer; },
        [](const IceCandidate&) { return kIceCandidate; },
        [](const LeaveRoom&) { return kLeaveRoom; },
        [](const Error&) { return kError; }
    }, message);
}

Message Parse(std::string_view text) {
    json object;
    try {
        object = json::parse(text.begin(), text.end());
    } catch (const json::parse_error&) {
        throw ParseError(ParseError::Kind::INVALID_JSON, "", "Invalid JSON message");
    }
    if (!object.is_object()) {
        throw ParseError(ParseError::Kind::INVALID_JSON, "", "Invalid JSON message");
    }

    auto type_it = object.find("type");
    if (type_it == object.end() || !type_it->is_string()) {
        throw ParseError(ParseError::Kind::MALFORMED, "", "Message type is missing");
    }
    const std::string type = type_it->get<std::string>();

    if (type == kJoinRoom) {
        JoinRoom message;
        message.room_id = RequireString(object, "roomId", type);
        message.participant_id = RequireString(object, "participantId", type);
        message.name = OptionalString(object, "name", type);
        return message;
    } else if (type == kJoinedRoom) {
        JoinedRoom message;
        message.room_id = RequireString(object, "roomId", type);
        message.participant_id = RequireString(object, "participantId", type);
        message.participant_count = RequireCount(object, "participantCount", type);
        return message;
    } else if (type == kExistingParticipants) {
        auto it = object.find("participants");
        if (it == object.end() || !it->is_array()) {
            throw Malformed(type);
        }
        ExistingParticipants message;
        for (const auto& entry : *it) {
            if (!entry.is_object()) {
                throw Malformed(type);
            }
            message.participants.push_back({RequireString(entry, "id", type), OptionalString(entry, "name", type)});
        }
        return message;
    } else if (type == kParticipantJoined) {
        ParticipantJoined message;
        message.participant_id = RequireString(object, "participantId", type);
        message.name = OptionalString(object, "name", type);
        message.participant_count = RequireCount(object, "participantCount", type);
        return message;
    } else if (type == kParticipantLeft) {
        ParticipantLeft message;
        message.participant_id = RequireString(object, "participantId", type);
        message.participant_count = RequireCount(object, "participantCount", type);
        return message;
    } else if (type == kOffer) {
        return ParseRelayed<Offer>(object, "offer", type);
    } else if (type == kAnswer) {
        return ParseRelayed<Answer>(object, "answer", type);
    } else if (type == kIceCandidate) {
        return ParseRelayed<IceCandidate>(object, "candidate", type);
    } else if (type == kLeaveRoom) {
        return LeaveRoom{};
    } else if (type == kError) {
        auto it = object.find("error");
        if (it == object.end() || !it->is_string()) {
            throw Malformed(type);
        }
        return Error{it->get<std::string>()};
    } else {
        throw ParseError(ParseError::Kind::UNKNOWN_TYPE, type, "Unknown message type: " + type);
    }
}

std::string Serialize(const Message& message) {
    json object = {{"type", std::string(TypeName(message))}};
    std::visit(overloaded {
        [&](const JoinRoom& m) {
            object["roomId"] = m.room_id;
            object["participantId"] = m.participant_id;
            if (m.name) {
                object["name"] = *m.name;
            }
        },
        [&](const JoinedRoom& m) {
            object["roomId"] = m.room_id;
            object["participantId"] = m.participant_id;
            object["participantCount"] = m.participant_count;
        },
        [&](const ExistingParticipants& m) {
            json participants = json::array();
            for (const auto& participant : m.participants) {
                json entry = {{"id", participant.id}};
                if (participant.name) {
                    entry["name"] = *participant.name;
                }
                participants.push_back(std::move(entry));
            }
            object["participants"] = std::move(participants);
        },
        [&](const ParticipantJoined& m) {
            object["participantId"] = m.participant_id;
            if (m.name) {
                object["name"] = *m.name;
            }
            object["participantCount"] = m.participant_count;
        },
        [&](const ParticipantLeft& m) {
            object["participantId"] = m.participant_id;
            object["participantCount"] = m.participant_count;
        },
        [&](const Offer& m) { SerializeRelayed(m, "offer", object); },
        [&](const Answer& m) { SerializeRelayed(m, "answer", object); },
        [&](const IceCandidate& m) { SerializeRelayed(m, "candidate", object); },
        [](const LeaveRoom&) {},
        [&](const Error& m) { object["error"] = m.error; }
    }, message);
    return object.dump();
}

} // namespace signaling
} // namespace meshrtc
