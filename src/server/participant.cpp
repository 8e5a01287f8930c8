#include "server/participant.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {

Participant::Participant(std::string id, 
                         std::string room_id, 
                         std::optional<std::string> name, 
                         std::shared_ptr<SignalingTransport> transport) 
    : id_(std::move(id)),
      room_id_(std::move(room_id)),
      name_(std::move(name)),
      transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Participant requires a transport.");
    }
}

Participant::~Participant() = default;

signaling::ParticipantInfo Participant::info() const {
    return {id_, name_};
}

void Participant::Send(const signaling::Message& message) const {
    PLOG_VERBOSE << "Send " << signaling::TypeName(message) << " to participant: " << id_;
    transport_->Send(signaling::Serialize(message));
}

} // namespace meshrtc
