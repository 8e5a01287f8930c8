#include "server/room_registry.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {

RoomRegistry::RoomRegistry(Configuration config, Clock* clock) 
    : config_(std::move(config)),
      clock_(clock) {
    if (!clock_) {
        throw std::invalid_argument("RoomRegistry requires a clock.");
    }
}

RoomRegistry::~RoomRegistry() = default;

RoomRegistry::JoinResult RoomRegistry::Join(const std::string& room_id, 
                                            const std::string& participant_id, 
                                            std::optional<std::string> name, 
                                            std::shared_ptr<SignalingTransport> transport) {
    if (room_id.empty() || participant_id.empty() || !transport) {
        throw std::invalid_argument("Join requires a room id, a participant id and a transport.");
    }
    std::lock_guard lock(mutex_);
    const int64_t now_ms = clock_->CurrentTimeMs();
    SignalingTransport* const key = transport.get();

    if (participants_.find(key) != participants_.end()) {
        PLOG_DEBUG << "Connection " << key->remote_address() << " rejoins, leave its previous room first.";
        LeaveLocked(key, now_ms);
    }

    auto& room = rooms_[room_id];
    if (!room) {
        room = std::make_unique<Room>(room_id, now_ms);
        PLOG_INFO << "Created room: " << room_id;
    }

    auto replaced = room->AddParticipant(std::make_unique<Participant>(participant_id, room_id, name, std::move(transport)), now_ms);
    if (replaced) {
        PLOG_WARNING << "Participant id " << participant_id << " already exists in room " << room_id 
                     << ", replaced the prior connection.";
        participants_.erase(replaced->transport());
    }
    participants_[key] = room->FindParticipant(participant_id);

    JoinResult result;
    result.others = room->Members(participant_id);
    result.participant_count = room->participant_count();

    room->Broadcast(signaling::ParticipantJoined{participant_id, std::move(name), result.participant_count}, participant_id);

    PLOG_INFO << "Participant " << participant_id << " joined room " << room_id 
              << ", participant count: " << result.participant_count;
    return result;
}

void RoomRegistry::Leave(SignalingTransport* transport) {
    std::lock_guard lock(mutex_);
    LeaveLocked(transport, clock_->CurrentTimeMs());
}

std::optional<RoomRegistry::RelayError> RoomRegistry::Relay(SignalingTransport* from, signaling::Offer offer) {
    std::lock_guard lock(mutex_);
    return RelayLocked(from, std::move(offer));
}

std::optional<RoomRegistry::RelayError> RoomRegistry::Relay(SignalingTransport* from, signaling::Answer answer) {
    std::lock_guard lock(mutex_);
    return RelayLocked(from, std::move(answer));
}

std::optional<RoomRegistry::RelayError> RoomRegistry::Relay(SignalingTransport* from, signaling::IceCandidate candidate) {
    std::lock_guard lock(mutex_);
    return RelayLocked(from, std::move(candidate));
}

size_t RoomRegistry::Sweep() {
    std::lock_guard lock(mutex_);
    const int64_t now_ms = clock_->CurrentTimeMs();
    size_t removed = 0;
    for (auto it = rooms_.begin(); it != rooms_.end();) {
        if (it->second->IsExpired(now_ms, config_.idle_threshold_ms)) {
            PLOG_INFO << "Removed idle room: " << it->first;
            it = rooms_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    PLOG_DEBUG << "Swept " << removed << " room(s), " << rooms_.size() << " remained.";
    return removed;
}

size_t RoomRegistry::room_count() const {
    std::lock_guard lock(mutex_);
    return rooms_.size();
}

bool RoomRegistry::HasRoom(const std::string& room_id) const {
    std::lock_guard lock(mutex_);
    return rooms_.find(room_id) != rooms_.end();
}

size_t RoomRegistry::participant_count(const std::string& room_id) const {
    std::lock_guard lock(mutex_);
    auto it = rooms_.find(room_id);
    return it != rooms_.end() ? it->second->participant_count() : 0;
}

std::optional<std::string> RoomRegistry::participant_id(SignalingTransport* transport) const {
    std::lock_guard lock(mutex_);
    auto it = participants_.find(transport);
    if (it == participants_.end()) {
        return std::nullopt;
    }
    return it->second->id();
}

// Private methods
void RoomRegistry::LeaveLocked(SignalingTransport* transport, int64_t now_ms) {
    auto it = participants_.find(transport);
    if (it == participants_.end()) {
        return;
    }
    const std::string participant_id = it->second->id();
    const std::string room_id = it->second->room_id();
    participants_.erase(it);

    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        PLOG_WARNING << "Room " << room_id << " of participant " << participant_id << " not found.";
        return;
    }
    auto& room = room_it->second;
    // Keep the participant alive until the broadcast is done.
    auto removed = room->RemoveParticipant(participant_id, now_ms);
    room->Broadcast(signaling::ParticipantLeft{participant_id, room->participant_count()}, participant_id);

    PLOG_INFO << "Participant " << participant_id << " left room " << room_id 
              << ", participant count: " << room->participant_count();
}

template <typename T>
std::optional<RoomRegistry::RelayError> RoomRegistry::RelayLocked(SignalingTransport* from, T message) {
    auto it = participants_.find(from);
    if (it == participants_.end()) {
        return RelayError::PARTICIPANT_NOT_FOUND;
    }
    const Participant* sender = it->second;
    auto room_it = rooms_.find(sender->room_id());
    if (room_it == rooms_.end()) {
        return RelayError::ROOM_NOT_FOUND;
    }
    if (!message.target_participant_id || message.target_participant_id->empty()) {
        return RelayError::MISSING_TARGET;
    }
    const Participant* target = room_it->second->FindParticipant(*message.target_participant_id);
    if (!target) {
        return RelayError::TARGET_NOT_FOUND;
    }
    PLOG_VERBOSE << "Relay " << signaling::TypeName(message) << " from " << sender->id() << " to " << target->id();
    message.target_participant_id.reset();
    message.from_participant_id = sender->id();
    target->Send(message);
    return std::nullopt;
}

std::string_view ToString(RoomRegistry::RelayError error) {
    switch (error) {
    case RoomRegistry::RelayError::PARTICIPANT_NOT_FOUND:
        return "Participant not found";
    case RoomRegistry::RelayError::ROOM_NOT_FOUND:
        return "Room not found";
    case RoomRegistry::RelayError::TARGET_NOT_FOUND:
        return "Target participant not found";
    case RoomRegistry::RelayError::MISSING_TARGET:
        return "Missing target participant";
    }
    return "Unknown relay error";
}

} // namespace meshrtc
