#pragma once

/// @file audio_io.h
/// @brief Audio file decoding (dr_wav, minimp3) for file-backed sources.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cadence {

/// @brief Detected audio container format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Decoded mono audio.
struct DecodedAudio {
  std::vector<float> samples;           ///< Mono samples in [-1, 1]
  int sample_rate = 0;                  ///< Sample rate in Hz
  int source_channels = 0;              ///< Channel count before downmix
  AudioFormat format = AudioFormat::Unknown;

  /// @brief Returns duration in seconds.
  double duration() const {
    return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
  }
};

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit). Default 500MB.
  size_t max_file_size = 500 * 1024 * 1024;
};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes an in-memory WAV or MP3 file to mono.
/// @param data Pointer to encoded data
/// @param size Size of data in bytes
/// @return Decoded audio
/// @throws CadenceException(InvalidFormat) for unknown formats
/// @throws CadenceException(DecodeFailed) on decoder errors or empty streams
DecodedAudio decode_audio(const uint8_t* data, size_t size);

/// @brief Loads and decodes an audio file (format auto-detected).
/// @param path Path to audio file
/// @param options Loading options
/// @return Decoded audio
/// @throws CadenceException(FileNotFound) if the file cannot be opened
/// @throws CadenceException(InvalidParameter) if the file exceeds max_file_size
/// @throws CadenceException(InvalidFormat/DecodeFailed) on decode errors
DecodedAudio load_audio(const std::string& path, const AudioLoadOptions& options = {});

/// @brief Writes mono samples to a 16-bit PCM WAV file.
/// @param path Output file path
/// @param samples Samples in [-1, 1] (clipped)
/// @param n_samples Number of samples
/// @param sample_rate Sample rate in Hz
/// @throws CadenceException(InvalidParameter) on bad arguments
/// @throws CadenceException(DecodeFailed) if the file cannot be written
void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate);

}  // namespace cadence
