#include "server/signaling_router.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {

SignalingRouter::SignalingRouter(RoomRegistry* registry) 
    : registry_(registry) {
    if (!registry_) {
        throw std::invalid_argument("SignalingRouter requires a registry.");
    }
}

SignalingRouter::~SignalingRouter() = default;

void SignalingRouter::OnTransportMessage(const std::shared_ptr<SignalingTransport>& transport, std::string_view text) {
    signaling::Message message;
    try {
        message = signaling::Parse(text);
    } catch (const signaling::ParseError& e) {
        PLOG_WARNING << "Failed to parse message from " << transport->remote_address() << ": " << e.what();
        SendError(transport.get(), e.what());
        return;
    }

    std::visit(overloaded {
        [&](signaling::JoinRoom& join) {
            auto result = registry_->Join(join.room_id, join.participant_id, std::move(join.name), transport);
            const std::string reply_joined = signaling::Serialize(signaling::JoinedRoom{join.room_id, join.participant_id, result.participant_count});
            const std::string reply_existing = signaling::Serialize(signaling::ExistingParticipants{std::move(result.others)});
            transport->Send(reply_joined);
            transport->Send(reply_existing);
        },
        [&](signaling::Offer& offer) {
            if (auto error = registry_->Relay(transport.get(), std::move(offer))) {
                SendError(transport.get(), std::string(ToString(*error)));
            }
        },
        [&](signaling::Answer& answer) {
            if (auto error = registry_->Relay(transport.get(), std::move(answer))) {
                SendError(transport.get(), std::string(ToString(*error)));
            }
        },
        [&](signaling::IceCandidate& candidate) {
            if (auto error = registry_->Relay(transport.get(), std::move(candidate))) {
                SendError(transport.get(), std::string(ToString(*error)));
            }
        },
        [&](signaling::LeaveRoom&) {
            registry_->Leave(transport.get());
        },
        [&](signaling::JoinedRoom&) { SendError(transport.get(), "Unexpected message type: joined-room"); },
        [&](signaling::ExistingParticipants&) { SendError(transport.get(), "Unexpected message type: existing-participants"); },
        [&](signaling::ParticipantJoined&) { SendError(transport.get(), "Unexpected message type: participant-joined"); },
        [&](signaling::ParticipantLeft&) { SendError(transport.get(), "Unexpected message type: participant-left"); },
        [&](signaling::Error&) { SendError(transport.get(), "Unexpected message type: error"); }
    }, message);
}

void SignalingRouter::OnTransportClosed(SignalingTransport* transport) {
    PLOG_DEBUG << "Connection closed: " << transport->remote_address();
    registry_->Leave(transport);
}

// Private methods
void SignalingRouter::SendError(SignalingTransport* transport, std::string error) const {
    PLOG_DEBUG << "Reply error to " << transport->remote_address() << ": " << error;
    transport->Send(signaling::Serialize(signaling::Error{std::move(error)}));
}

} // namespace meshrtc
