#ifndef _CLIENT_SESSION_DESCRIPTION_H_
#define _CLIENT_SESSION_DESCRIPTION_H_

#include "base/defines.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace meshrtc {

// SessionDescription
// The SDP text is opaque here, only the peer transport interprets it.
class MESHRTC_EXPORT SessionDescription {
public:
    enum class Type {
        OFFER,
        ANSWER
    };
public:
    // Throws std::invalid_argument if `value` is not {type, sdp}.
    static SessionDescription FromJson(const nlohmann::json& value);
public:
    SessionDescription(Type type, std::string sdp);

    Type type() const { return type_; }
    const std::string& sdp() const { return sdp_; }

    nlohmann::json ToJson() const;

    bool operator==(const SessionDescription& other) const;

    static std::string ToString(Type type);

private:
    Type type_;
    std::string sdp_;
};

// Candidate
class MESHRTC_EXPORT Candidate {
public:
    // Throws std::invalid_argument if `value` has no `candidate` string.
    static Candidate FromJson(const nlohmann::json& value);
public:
    Candidate(std::string candidate, 
              std::optional<std::string> sdp_mid = std::nullopt,
              std::optional<int> sdp_mline_index = std::nullopt);

    const std::string& candidate() const { return candidate_; }
    const std::optional<std::string>& sdp_mid() const { return sdp_mid_; }
    std::optional<int> sdp_mline_index() const { return sdp_mline_index_; }

    nlohmann::json ToJson() const;

    bool operator==(const Candidate& other) const;

private:
    std::string candidate_;
    std::optional<std::string> sdp_mid_;
    std::optional<int> sdp_mline_index_;
};

} // namespace meshrtc

#endif
