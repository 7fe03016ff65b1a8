#pragma once

/// @file window.h
/// @brief Window function generators.

#include <vector>

#include "util/types.h"

namespace cadence {

/// @brief Creates a window of the specified type.
/// @param type Window type
/// @param length Window length in samples
/// @param periodic If true, the window is periodic (denominator N, as used for spectral
///                 analysis by Web Audio); otherwise symmetric (denominator N - 1)
/// @return Vector containing window coefficients (empty if length <= 0)
std::vector<float> create_window(WindowType type, int length, bool periodic = true);

}  // namespace cadence
