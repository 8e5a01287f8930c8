#ifndef _SERVER_PARTICIPANT_H_
#define _SERVER_PARTICIPANT_H_

#include "base/defines.hpp"
#include "server/signaling_transport.hpp"
#include "signaling/messages.hpp"

#include <memory>
#include <optional>
#include <string>

namespace meshrtc {

// The record binding one connection to a room and an identity.
class MESHRTC_EXPORT Participant {
public:
    Participant(std::string id, 
                std::string room_id, 
                std::optional<std::string> name, 
                std::shared_ptr<SignalingTransport> transport);
    ~Participant();

    const std::string& id() const { return id_; }
    const std::string& room_id() const { return room_id_; }
    const std::optional<std::string>& name() const { return name_; }
    SignalingTransport* transport() const { return transport_.get(); }

    signaling::ParticipantInfo info() const;

    void Send(const signaling::Message& message) const;

private:
    const std::string id_;
    const std::string room_id_;
    const std::optional<std::string> name_;
    const std::shared_ptr<SignalingTransport> transport_;

    DISALLOW_COPY_AND_ASSIGN(Participant);
};

} // namespace meshrtc

#endif
