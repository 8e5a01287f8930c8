#include "server/room.hpp"

namespace meshrtc {

Room::Room(std::string id, int64_t created_at_ms) 
    : id_(std::move(id)),
      created_at_ms_(created_at_ms),
      last_activity_ms_(created_at_ms) {}

Room::~Room() = default;

std::unique_ptr<Participant> Room::AddParticipant(std::unique_ptr<Participant> participant, int64_t now_ms) {
    last_activity_ms_ = now_ms;
    auto& slot = participants_[participant->id()];
    std::unique_ptr<Participant> replaced = std::move(slot);
    slot = std::move(participant);
    return replaced;
}

std::unique_ptr<Participant> Room::RemoveParticipant(const std::string& participant_id, int64_t now_ms) {
    auto it = participants_.find(participant_id);
    if (it == participants_.end()) {
        return nullptr;
    }
    last_activity_ms_ = now_ms;
    std::unique_ptr<Participant> removed = std::move(it->second);
    participants_.erase(it);
    return removed;
}

Participant* Room::FindParticipant(const std::string& participant_id) const {
    auto it = participants_.find(participant_id);
    return it != participants_.end() ? it->second.get() : nullptr;
}

std::vector<signaling::ParticipantInfo> Room::Members(const std::string& except_id) const {
    std::vector<signaling::ParticipantInfo> members;
    members.reserve(participants_.size());
    for (const auto& [id, participant] : participants_) {
        if (id != except_id) {
            members.push_back(participant->info());
        }
    }
    return members;
}

void Room::Broadcast(const signaling::Message& message, const std::string& except_id) const {
    const std::string text = signaling::Serialize(message);
    for (const auto& [id, participant] : participants_) {
        if (id != except_id) {
            participant->transport()->Send(text);
        }
    }
}

bool Room::IsExpired(int64_t now_ms, TimeInterval idle_threshold_ms) const {
    return participants_.empty() && now_ms - last_activity_ms_ > idle_threshold_ms;
}

} // namespace meshrtc
