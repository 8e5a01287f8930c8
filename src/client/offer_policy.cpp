#include "client/offer_policy.hpp"

namespace meshrtc {

bool ShouldOffer(std::string_view self_id, std::string_view peer_id) {
    return self_id < peer_id;
}

} // namespace meshrtc
