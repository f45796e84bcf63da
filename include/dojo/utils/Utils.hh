#pragma once

#include <string>

namespace dojo {

class Utils {
public:
  // Generates prefix + `length` random hex digits. Not used for gameplay randomness.
  static std::string generateUniqueId(const std::string& prefix, int length = 8);

  static float lerp(float a, float b, float t);

  // Cubic ease-in on t clamped to [0,1].
  static float easeInCubic(float t);
  // Quadratic ease-out on t clamped to [0,1].
  static float easeOutQuad(float t);
};

} // namespace dojo
