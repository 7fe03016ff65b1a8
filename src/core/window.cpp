/// @file window.cpp
/// @brief Implementation of window functions.

#include "core/window.h"

#include <cmath>

namespace cadence {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

/// @brief Blackman coefficients for alpha = 0.16.
constexpr float kBlackmanA0 = 0.42f;
constexpr float kBlackmanA1 = 0.5f;
constexpr float kBlackmanA2 = 0.08f;

float coefficient(WindowType type, float phase) {
  switch (type) {
    case WindowType::Hann:
      return 0.5f * (1.0f - std::cos(kTwoPi * phase));
    case WindowType::Hamming:
      return 0.54f - 0.46f * std::cos(kTwoPi * phase);
    case WindowType::Blackman:
      return kBlackmanA0 - kBlackmanA1 * std::cos(kTwoPi * phase) +
             kBlackmanA2 * std::cos(2.0f * kTwoPi * phase);
    case WindowType::Rectangular:
      return 1.0f;
  }
  return 1.0f;
}
}  // namespace

std::vector<float> create_window(WindowType type, int length, bool periodic) {
  if (length <= 0) {
    return {};
  }
  if (length == 1) {
    return {1.0f};
  }

  const float denom = static_cast<float>(periodic ? length : length - 1);
  std::vector<float> window(static_cast<size_t>(length));
  for (int i = 0; i < length; ++i) {
    window[i] = coefficient(type, static_cast<float>(i) / denom);
  }
  return window;
}

}  // namespace cadence
