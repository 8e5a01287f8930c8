#include "client/mesh_session.hpp"
#include "common/utils_random.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace meshrtc {
namespace {

constexpr int kParticipantIdLength = 8;
constexpr int kRoomIdLength = 6;

} // namespace

MeshSession::MeshSession(Configuration config,
                         CaptureDevice* capture_device,
                         PeerTransportFactory* transport_factory,
                         std::shared_ptr<SignalingChannel> channel,
                         TaskQueue* task_queue,
                         Observer* observer) 
    : config_(std::move(config)),
      capture_device_(capture_device),
      transport_factory_(transport_factory),
      channel_(std::move(channel)),
      task_queue_(task_queue),
      observer_(observer),
      participant_id_(utils::random::random_string(kParticipantIdLength, utils::random::kLowerAlphanumeric)) {
    if (!capture_device_ || !transport_factory_ || !channel_ || !task_queue_) {
        throw std::invalid_argument("MeshSession requires a capture device, a transport factory, a channel and a task queue");
    }
    channel_->RegisterObserver(this);
    PLOG_INFO << "Created session for participant " << participant_id_;
}

MeshSession::~MeshSession() {
    // No more channel events after this.
    channel_->DeregisterObserver(this);
    task_queue_->Invoke<void>([this](){
        observer_ = nullptr;
        LeaveInternal();
        // Drops the channel events still queued.
        task_safety_.flag()->SetNotAlive();
    });
}

bool MeshSession::Join(std::string room_id, std::optional<std::string> display_name) {
    return task_queue_->Invoke<bool>([&](){
        return JoinInternal(std::move(room_id), std::move(display_name));
    });
}

void MeshSession::Leave() {
    task_queue_->Invoke<void>([this](){
        LeaveInternal();
    });
}

std::string MeshSession::GenerateRoomId() {
    return utils::random::random_string(kRoomIdLength, utils::random::kUpperAlphanumeric);
}

std::string MeshSession::NormalizeRoomId(std::string_view room_id) {
    auto is_space = [](unsigned char c){ return std::isspace(c); };
    auto begin = std::find_if_not(room_id.begin(), room_id.end(), is_space);
    auto end = std::find_if_not(room_id.rbegin(), room_id.rend(), is_space).base();
    std::string normalized;
    if (begin < end) {
        normalized.assign(begin, end);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c){
        return static_cast<char>(std::toupper(c));
    });
    return normalized;
}

std::string MeshSession::ToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MEDIA_ACQUISITION:
        return "media-acquisition";
    case ErrorKind::TRANSPORT_CREATION:
        return "transport-creation";
    case ErrorKind::NEGOTIATION:
        return "negotiation";
    case ErrorKind::SIGNALING:
        return "signaling";
    case ErrorKind::SERVER:
        return "server";
    default:
        RTC_NOTREACHED();
        return "unknown";
    }
}

// Private methods
bool MeshSession::JoinInternal(std::string room_id, std::optional<std::string> display_name) {
    RTC_RUN_ON(task_queue_);
    auto normalized_room_id = NormalizeRoomId(room_id);
    if (normalized_room_id.empty()) {
        NotifyError(ErrorKind::SIGNALING, "Room id is empty");
        return false;
    }

    LeaveInternal();

    std::vector<std::shared_ptr<MediaTrack>> local_tracks;
    try {
        local_tracks = capture_device_->Open();
    } catch (const std::exception& e) {
        NotifyError(ErrorKind::MEDIA_ACQUISITION, std::string("Failed to access camera and microphone: ") + e.what());
        return false;
    }

    local_tracks_ = std::move(local_tracks);
    room_id_ = std::move(normalized_room_id);
    if (display_name && !display_name->empty()) {
        display_name_ = *display_name;
    } else {
        display_name_ = "User " + participant_id_.substr(0, 4);
    }
    peers_ = std::make_unique<PeerSetManager>(participant_id_, 
                                              local_tracks_, 
                                              transport_factory_, 
                                              config_.transport, 
                                              config_.negotiation, 
                                              task_queue_, 
                                              this);
    state_ = State::CONNECTING;
    ++connection_id_;
    PLOG_INFO << "Joining room " << room_id_ << " as " << display_name_;
    channel_->Connect(config_.signaling_url);
    return true;
}

void MeshSession::LeaveInternal() {
    RTC_RUN_ON(task_queue_);
    if (state_ == State::IDLE) {
        return;
    }
    if (state_ == State::JOINING || state_ == State::JOINED) {
        SendMessage(signaling::LeaveRoom());
    }
    Teardown();
    channel_->Close();
    ++connection_id_;
    PLOG_INFO << "Left room " << room_id_;
    room_id_.clear();
}

void MeshSession::Teardown() {
    if (peers_) {
        peers_->CloseAll();
        peers_.reset();
    }
    for (const auto& track : local_tracks_) {
        track->Stop();
    }
    local_tracks_.clear();
    state_ = State::IDLE;
}

void MeshSession::SendMessage(const signaling::Message& message) {
    channel_->Send(signaling::Serialize(message));
}

void MeshSession::NotifyError(ErrorKind kind, const std::string& message) {
    PLOG_WARNING << "Session error (" << ToString(kind) << "): " << message;
    PostToObserver([kind, message](Observer* observer){
        observer->OnError(kind, message);
    });
}

void MeshSession::PostToObserver(std::function<void(Observer*)> notification) {
    // Runs as a task of its own, the observer may call Join() or Leave().
    task_queue_->Post(ToSafeTask(task_safety_.flag(), [this, notification=std::move(notification)](){
        if (observer_) {
            notification(observer_);
        }
    }));
}

// Channel events
void MeshSession::OnConnected() {
    task_queue_->Post(ToSafeTask(task_safety_.flag(), [this, connection_id=connection_id_.load()](){
        HandleConnected(connection_id);
    }));
}

void MeshSession::OnClosed(const std::string reason) {
    task_queue_->Post(ToSafeTask(task_safety_.flag(), [this, connection_id=connection_id_.load(), reason](){
        HandleChannelClosed(connection_id, reason);
    }));
}

bool MeshSession::OnRead(const std::string msg) {
    task_queue_->Post(ToSafeTask(task_safety_.flag(), [this, connection_id=connection_id_.load(), msg](){
        HandleMessage(connection_id, msg);
    }));
    return true;
}

void MeshSession::HandleConnected(uint64_t connection_id) {
    RTC_RUN_ON(task_queue_);
    if (connection_id != connection_id_ || state_ != State::CONNECTING) {
        return;
    }
    signaling::JoinRoom message;
    message.room_id = room_id_;
    message.participant_id = participant_id_;
    message.name = display_name_;
    SendMessage(message);
    state_ = State::JOINING;
}

void MeshSession::HandleChannelClosed(uint64_t connection_id, const std::string& reason) {
    RTC_RUN_ON(task_queue_);
    if (connection_id != connection_id_ || state_ == State::IDLE) {
        return;
    }
    Teardown();
    ++connection_id_;
    room_id_.clear();
    NotifyError(ErrorKind::SIGNALING, "Signaling connection closed: " + reason);
}

void MeshSession::HandleMessage(uint64_t connection_id, const std::string& text) {
    RTC_RUN_ON(task_queue_);
    if (connection_id != connection_id_ || !peers_) {
        return;
    }
    signaling::Message message;
    try {
        message = signaling::Parse(text);
    } catch (const signaling::ParseError& e) {
        PLOG_WARNING << "Discard invalid message from server: " << e.what();
        return;
    }
    std::visit(overloaded {
        [this](const signaling::JoinedRoom& m) {
            state_ = State::JOINED;
            PLOG_INFO << "Joined room " << m.room_id << " with " << m.participant_count << " participants.";
            PostToObserver([room_id=m.room_id, count=m.participant_count](Observer* observer){
                observer->OnJoined(room_id, count);
            });
        },
        [this](const signaling::ExistingParticipants& m) {
            peers_->OnExistingParticipants(m);
        },
        [this](const signaling::ParticipantJoined& m) {
            peers_->OnParticipantJoined(m);
            PostToObserver([participant_id=m.participant_id, name=m.name](Observer* observer){
                observer->OnParticipantJoined(participant_id, name);
            });
        },
        [this](const signaling::ParticipantLeft& m) {
            peers_->OnParticipantLeft(m);
            PostToObserver([participant_id=m.participant_id](Observer* observer){
                observer->OnParticipantLeft(participant_id);
            });
        },
        [this](const signaling::Offer& m) {
            peers_->OnOffer(m);
        },
        [this](const signaling::Answer& m) {
            peers_->OnAnswer(m);
        },
        [this](const signaling::IceCandidate& m) {
            peers_->OnIceCandidate(m);
        },
        [this](const signaling::Error& m) {
            NotifyError(ErrorKind::SERVER, m.error);
        },
        [](const signaling::JoinRoom&) {
            PLOG_WARNING << "Unexpected join-room from server.";
        },
        [](const signaling::LeaveRoom&) {
            PLOG_WARNING << "Unexpected leave-room from server.";
        }
    }, message);
}

// PeerSetManager events
void MeshSession::OnOutgoingMessage(signaling::Message message) {
    if (state_ == State::IDLE) {
        return;
    }
    SendMessage(message);
}

void MeshSession::OnRemoteStreamsChanged(std::vector<RemoteStreamTable::Entry> entries) {
    PostToObserver([entries=std::move(entries)](Observer* observer){
        observer->OnRemoteStreamsChanged(entries);
    });
}

void MeshSession::OnPeerStateChanged(const std::string& peer_id, NegotiationController::State state) {
    PostToObserver([peer_id, state](Observer* observer){
        observer->OnPeerStateChanged(peer_id, state);
    });
}

void MeshSession::OnPeerFailed(const std::string& peer_id, 
                               NegotiationController::FailureKind kind, 
                               const std::string& reason) {
    const auto error_kind = kind == NegotiationController::FailureKind::TRANSPORT_CREATION 
                          ? ErrorKind::TRANSPORT_CREATION 
                          : ErrorKind::NEGOTIATION;
    NotifyError(error_kind, "Connection to " + peer_id + " failed: " + reason);
}

} // namespace meshrtc
