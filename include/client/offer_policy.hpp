#ifndef _CLIENT_OFFER_POLICY_H_
#define _CLIENT_OFFER_POLICY_H_

#include "base/defines.hpp"

#include <string_view>

namespace meshrtc {

// Decides which side of a pair creates the offer: the participant whose id
// sorts lower (byte-wise) offers, the other one waits for the offer.
MESHRTC_EXPORT bool ShouldOffer(std::string_view self_id, std::string_view peer_id);

} // namespace meshrtc

#endif
