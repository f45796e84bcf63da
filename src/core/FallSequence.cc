#include "dojo/core/FallSequence.hh"

#include "dojo/core/Fighter.hh"
#include "dojo/core/Log.hh"
#include "dojo/utils/Utils.hh"

#include <algorithm>

namespace dojo {

FallSequence::FallSequence(Fighter& player, const FallConfig& config)
    : config_(config), startX_(player.x()), startY_(player.y()), startHealth_(player.health()) {
    player.beginFall();
    DOJO_LOG_INFO("{} slipped off the edge", player.name());
}

bool FallSequence::shouldTrigger(const Fighter& player, bool hasOpponent, float cameraOffset,
                                 const FallConfig& config) {
    return player.alive() && !hasOpponent && player.x() < config.boundaryX && cameraOffset <= config.cameraEpsilon;
}

bool FallSequence::update(float dtMs, Fighter& player) {
    if (complete_)
        return false;

    elapsedMs_ = std::min(config_.durationMs, elapsedMs_ + std::max(0.0f, dtMs));
    float t = progress();

    float x = Utils::lerp(startX_, startX_ - config_.dropX, Utils::easeOutQuad(t));
    float y = Utils::lerp(startY_, startY_ + config_.dropY, Utils::easeInCubic(t));
    player.setPosition(x, y);
    player.setOpacity(1.0f - t);

    if (elapsedMs_ >= config_.durationMs) {
        complete_ = true;
        player.forceDefeat();
        return true;
    }

    // Health drains with time; stays positive until the final tick.
    player.setHealth(std::max(Utils::lerp(startHealth_, 0.0f, t), 1e-3f));
    return false;
}

float FallSequence::elapsedMs() const {
    return elapsedMs_;
}

float FallSequence::progress() const {
    return config_.durationMs > 0.0f ? std::clamp(elapsedMs_ / config_.durationMs, 0.0f, 1.0f) : 1.0f;
}

bool FallSequence::complete() const {
    return complete_;
}

} // namespace dojo
