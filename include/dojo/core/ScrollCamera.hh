#pragma once

namespace dojo {

struct CameraConfig {
    // Player sits this far from the left edge of the view when settled.
    float marginLeft = 300.0f;
    // Fraction of the remaining distance closed per tick.
    float smoothing = 0.08f;
    float viewWidth = 1280.0f;
    float worldWidth = 3200.0f;
};

// Horizontal side-scroll follow. Per-tick smoothing, not time scaled.
class ScrollCamera {
  public:
    explicit ScrollCamera(const CameraConfig& config = {});

    void follow(float playerX);
    void snapTo(float playerX);

    float targetFor(float playerX) const;
    float offset() const;
    float maxOffset() const;

    CameraConfig& config();

  private:
    CameraConfig config_;
    float offset_ = 0.0f;
};

} // namespace dojo
