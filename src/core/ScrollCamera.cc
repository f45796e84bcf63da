#include "dojo/core/ScrollCamera.hh"

#include <algorithm>

namespace dojo {

ScrollCamera::ScrollCamera(const CameraConfig& config) : config_(config) {}

void ScrollCamera::follow(float playerX) {
    offset_ += (targetFor(playerX) - offset_) * config_.smoothing;
}

void ScrollCamera::snapTo(float playerX) {
    offset_ = targetFor(playerX);
}

float ScrollCamera::targetFor(float playerX) const {
    return std::clamp(playerX - config_.marginLeft, 0.0f, maxOffset());
}

float ScrollCamera::offset() const {
    return offset_;
}

float ScrollCamera::maxOffset() const {
    return std::max(0.0f, config_.worldWidth - config_.viewWidth);
}

CameraConfig& ScrollCamera::config() {
    return config_;
}

} // namespace dojo
