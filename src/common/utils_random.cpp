#include "common/utils_random.hpp"

#include <stdexcept>

namespace meshrtc {
namespace utils {
namespace random {

std::string random_string(int length, std::string_view possible_characters) {
    if (possible_characters.empty()) {
        throw std::invalid_argument("Empty character set for random string.");
    }
    std::random_device rd;
    std::mt19937 engine(rd());
    std::uniform_int_distribution<size_t> dist(0, possible_characters.size()-1);
    std::string ret;
    ret.reserve(length > 0 ? length : 0);
    for (int i = 0; i < length; i++) {
        ret += possible_characters[dist(engine)];
    }
    return ret;
}

} // namespace random
} // namespace utils
} // meshrtc
