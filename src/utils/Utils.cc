#include "dojo/utils/Utils.hh"
#include <algorithm>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace dojo {

std::string Utils::generateUniqueId(const std::string& prefix, int length) {
    static std::mutex idMutex;
    std::lock_guard<std::mutex> lock(idMutex);

    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << prefix;

    for (int i = 0; i < length; i++) {
        ss << std::hex << dis(gen);
    }

    return ss.str();
}

float Utils::lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

float Utils::easeInCubic(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return t * t * t;
}

float Utils::easeOutQuad(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return 1.0f - (1.0f - t) * (1.0f - t);
}

} // namespace dojo
