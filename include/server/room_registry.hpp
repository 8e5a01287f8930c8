#ifndef _SERVER_ROOM_REGISTRY_H_
#define _SERVER_ROOM_REGISTRY_H_

#include "base/defines.hpp"
#include "common/clock.hpp"
#include "server/room.hpp"
#include "server/signaling_transport.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meshrtc {

// The in-memory registry of rooms and participants, safe to call from any thread.
class MESHRTC_EXPORT RoomRegistry {
public:
    struct Configuration {
        // An empty room is removed once its membership stays unchanged this long.
        TimeInterval idle_threshold_ms = 30 * 60 * 1000;
        // How often the server runs Sweep().
        TimeInterval sweep_interval_ms = 5 * 60 * 1000;
    };

    struct JoinResult {
        // The other members at the instant of joining.
        std::vector<signaling::ParticipantInfo> others;
        // Including the joiner.
        size_t participant_count = 0;
    };

    enum class RelayError {
        PARTICIPANT_NOT_FOUND,
        ROOM_NOT_FOUND,
        TARGET_NOT_FOUND,
        MISSING_TARGET
    };
public:
    RoomRegistry(Configuration config, Clock* clock);
    ~RoomRegistry();

    const Configuration& config() const { return config_; }

    // Creates the room if absent, inserts the participant and broadcasts
    // `participant-joined` to every other member. An identical participant id
    // replaces the prior entry and unbinds its connection. A transport already 
    // bound to a participant leaves its old room first.
    JoinResult Join(const std::string& room_id, 
                    const std::string& participant_id, 
                    std::optional<std::string> name, 
                    std::shared_ptr<SignalingTransport> transport);

    // Removes the participant bound to `transport` and broadcasts `participant-left`
    // to the remaining members. No-op if the transport is unbound.
    void Leave(SignalingTransport* transport);

    // Forwards the message to its target in the sender's room, with
    // `targetParticipantId` replaced by `fromParticipantId`.
    std::optional<RelayError> Relay(SignalingTransport* from, signaling::Offer offer);
    std::optional<RelayError> Relay(SignalingTransport* from, signaling::Answer answer);
    std::optional<RelayError> Relay(SignalingTransport* from, signaling::IceCandidate candidate);

    // Removes the empty rooms idle past the threshold, returns the number removed.
    size_t Sweep();

    size_t room_count() const;
    bool HasRoom(const std::string& room_id) const;
    // Returns 0 if the room doesn't exist.
    size_t participant_count(const std::string& room_id) const;
    // Returns the id of the participant bound to `transport`.
    std::optional<std::string> participant_id(SignalingTransport* transport) const;

private:
    void LeaveLocked(SignalingTransport* transport, int64_t now_ms);
    template <typename T>
    std::optional<RelayError> RelayLocked(SignalingTransport* from, T message);

private:
    const Configuration config_;
    Clock* const clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Room>> rooms_;
    // Connection -> participant, the participant is owned by its room.
    std::unordered_map<SignalingTransport*, Participant*> participants_;

    DISALLOW_COPY_AND_ASSIGN(RoomRegistry);
};

MESHRTC_EXPORT std::string_view ToString(RoomRegistry::RelayError error);

} // namespace meshrtc

#endif
