#include "client/offer_policy.hpp"
#include "common/utils_random.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(OfferPolicyTest, LowerIdOffers) {
    EXPECT_TRUE(ShouldOffer("p1", "p2"));
    EXPECT_FALSE(ShouldOffer("p2", "p1"));
    EXPECT_TRUE(ShouldOffer("abc", "abd"));
    EXPECT_TRUE(ShouldOffer("ab", "abc"));
}

MY_TEST(OfferPolicyTest, NeverOffersToSelf) {
    EXPECT_FALSE(ShouldOffer("p1", "p1"));
}

MY_TEST(OfferPolicyTest, ComparesBytewise) {
    // Upper case letters sort before lower case ones.
    EXPECT_TRUE(ShouldOffer("Zeta", "alpha"));
    EXPECT_TRUE(ShouldOffer("9", "a"));
}

MY_TEST(OfferPolicyTest, ExactlyOneSideOffers) {
    for (int i = 0; i < 1000; ++i) {
        auto a = utils::random::random_string(8, utils::random::kLowerAlphanumeric);
        auto b = utils::random::random_string(8, utils::random::kLowerAlphanumeric);
        if (a == b) {
            continue;
        }
        EXPECT_NE(ShouldOffer(a, b), ShouldOffer(b, a)) << a << " vs " << b;
    }
}

} // namespace test
} // namespace meshrtc
