#pragma once

namespace dojo {

class Fighter;

struct FallConfig {
    // Player must be left of this with no opponent engaged.
    float boundaryX = 30.0f;
    // ...and the camera must not have scrolled past this offset.
    float cameraEpsilon = 0.5f;
    float durationMs = 2600.0f;
    float dropX = 140.0f;
    float dropY = 320.0f;
};

// Scripted sea-fall off the left edge. Non-cancelable once started; drives
// the player's position, opacity and health to a fixed endpoint.
class FallSequence {
  public:
    FallSequence(Fighter& player, const FallConfig& config = FallConfig());

    static bool shouldTrigger(const Fighter& player, bool hasOpponent, float cameraOffset, const FallConfig& config);

    // Returns true on the tick the fall completes. The player is defeated then.
    bool update(float dtMs, Fighter& player);

    float elapsedMs() const;
    float progress() const;
    bool complete() const;

  private:
    FallConfig config_;
    float startX_;
    float startY_;
    float startHealth_;
    float elapsedMs_ = 0.0f;
    bool complete_ = false;
};

} // namespace dojo
