#ifndef _COMMON_UTILS_RANDOM_H_
#define _COMMON_UTILS_RANDOM_H_

#include "base/defines.hpp"

#include <random>
#include <string>
#include <string_view>

namespace meshrtc {
namespace utils {
namespace random {

constexpr std::string_view kAlphanumeric = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kLowerAlphanumeric = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kUpperAlphanumeric = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

template <
    typename T, 
    typename std::enable_if<std::is_integral<T>::value, T>::type* = nullptr>
T random(T lhs, T rhs) {
    std::mt19937 gen{std::random_device()()};
    std::uniform_int_distribution<T> dis(lhs, rhs);
    return dis(gen);
};

// Random string of `length` characters picked from `possible_characters`.
MESHRTC_EXPORT std::string random_string(int length, std::string_view possible_characters = kAlphanumeric);

} // namespace random
} // namespace utils
} // meshrtc

#endif
