#ifndef _SERVER_ROOM_H_
#define _SERVER_ROOM_H_

#include "base/defines.hpp"
#include "server/participant.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace meshrtc {

// Room is not thread-safe, the owner serializes access.
class MESHRTC_EXPORT Room {
public:
    Room(std::string id, int64_t created_at_ms);
    ~Room();

    const std::string& id() const { return id_; }
    int64_t created_at_ms() const { return created_at_ms_; }
    // The last time the membership changed.
    int64_t last_activity_ms() const { return last_activity_ms_; }
    size_t participant_count() const { return participants_.size(); }
    bool empty() const { return participants_.empty(); }

    // Inserts `participant`, returns the participant it replaced if the id was already taken.
    std::unique_ptr<Participant> AddParticipant(std::unique_ptr<Participant> participant, int64_t now_ms);
    std::unique_ptr<Participant> RemoveParticipant(const std::string& participant_id, int64_t now_ms);
    Participant* FindParticipant(const std::string& participant_id) const;

    // Returns every member except `except_id`, ordered by id.
    std::vector<signaling::ParticipantInfo> Members(const std::string& except_id) const;

    // Sends `message` to every member except `except_id`.
    void Broadcast(const signaling::Message& message, const std::string& except_id) const;

    // Returns true if the room is empty and its membership has not changed 
    // for longer than `idle_threshold_ms`.
    bool IsExpired(int64_t now_ms, TimeInterval idle_threshold_ms) const;

private:
    const std::string id_;
    const int64_t created_at_ms_;
    int64_t last_activity_ms_;
    std::map<std::string, std::unique_ptr<Participant>> participants_;

    DISALLOW_COPY_AND_ASSIGN(Room);
};

} // namespace meshrtc

#endif
