#pragma once

/// @file types.h
/// @brief Common type definitions for libcadence.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cadence {

/// @brief Magnitude spectrum with 8-bit bins (0-255), one per analysis tick.
using Spectrum = std::vector<uint8_t>;

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  InvalidConfiguration,
  SourceUnavailable,
  OutOfMemory,
};

/// @brief Window function types.
enum class WindowType {
  Hann,
  Hamming,
  Blackman,
  Rectangular,
};

/// @brief Playback phase of an analysis session.
enum class PlaybackPhase {
  Idle,
  Playing,
  Paused,
};

/// @brief Returns the name of a playback phase.
/// @param phase Playback phase
/// @return "idle", "playing" or "paused"
inline const char* phase_name(PlaybackPhase phase) {
  switch (phase) {
    case PlaybackPhase::Idle:
      return "idle";
    case PlaybackPhase::Playing:
      return "playing";
    case PlaybackPhase::Paused:
      return "paused";
  }
  return "unknown";
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::InvalidConfiguration:
      return "Invalid configuration";
    case ErrorCode::SourceUnavailable:
      return "Source unavailable";
    case ErrorCode::OutOfMemory:
      return "Out of memory";
  }
  return "Unknown error";
}

}  // namespace cadence
