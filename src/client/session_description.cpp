#include "client/session_description.hpp"

#include <stdexcept>

namespace meshrtc {

using json = nlohmann::json;

// SessionDescription
SessionDescription SessionDescription::FromJson(const json& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("Session description is not an object");
    }
    auto type_it = value.find("type");
    auto sdp_it = value.find("sdp");
    if (type_it == value.end() || !type_it->is_string() ||
        sdp_it == value.end() || !sdp_it->is_string()) {
        throw std::invalid_argument("Session description requires type and sdp");
    }
    const auto type = type_it->get<std::string>();
    if (type == "offer") {
        return SessionDescription(Type::OFFER, sdp_it->get<std::string>());
    } else if (type == "answer") {
        return SessionDescription(Type::ANSWER, sdp_it->get<std::string>());
    } else {
        throw std::invalid_argument("Unsupported session description type: " + type);
    }
}

SessionDescription::SessionDescription(Type type, std::string sdp) 
    : type_(type), 
      sdp_(std::move(sdp)) {}

json SessionDescription::ToJson() const {
    return {{"type", ToString(type_)}, {"sdp", sdp_}};
}

bool SessionDescription::operator==(const SessionDescription& other) const {
    return type_ == other.type_ && sdp_ == other.sdp_;
}

std::string SessionDescription::ToString(Type type) {
    switch (type) {
    case Type::OFFER:
        return "offer";
    case Type::ANSWER:
        return "answer";
    default:
        RTC_NOTREACHED();
        return "unknown";
    }
}

// Candidate
Candidate Candidate::FromJson(const json& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("Candidate is not an object");
    }
    auto candidate_it = value.find("candidate");
    if (candidate_it == value.end() || !candidate_it->is_string()) {
        throw std::invalid_argument("Candidate requires a candidate string");
    }
    std::optional<std::string> sdp_mid;
    if (auto it = value.find("sdpMid"); it != value.end() && it->is_string()) {
        sdp_mid = it->get<std::string>();
    }
    std::optional<int> sdp_mline_index;
    if (auto it = value.find("sdpMLineIndex"); it != value.end() && it->is_number_integer()) {
        sdp_mline_index = it->get<int>();
    }
    return Candidate(candidate_it->get<std::string>(), std::move(sdp_mid), sdp_mline_index);
}

Candidate::Candidate(std::string candidate, 
                     std::optional<std::string> sdp_mid,
                     std::optional<int> sdp_mline_index) 
    : candidate_(std::move(candidate)),
      sdp_mid_(std::move(sdp_mid)),
      sdp_mline_index_(sdp_mline_index) {}

json Candidate::ToJson() const {
    // Browsers send null for the unknown fields.
    json value = {{"candidate", candidate_}, {"sdpMid", nullptr}, {"sdpMLineIndex", nullptr}};
    if (sdp_mid_) {
        value["sdpMid"] = *sdp_mid_;
    }
    if (sdp_mline_index_) {
        value["sdpMLineIndex"] = *sdp_mline_index_;
    }
    return value;
}

bool Candidate::operator==(const Candidate& other) const {
    return candidate_ == other.candidate_ &&
           sdp_mid_ == other.sdp_mid_ &&
           sdp_mline_index_ == other.sdp_mline_index_;
}

} // namespace meshrtc
