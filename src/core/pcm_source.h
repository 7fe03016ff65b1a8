#pragma once

/// @file pcm_source.h
/// @brief Time-domain sample providers that feed the spectrum analyser.

#include <cstddef>
#include <vector>

#include "core/audio_io.h"

namespace cadence {

/// @brief Provider of the most recent time-domain samples at a playhead.
/// @details Implementations are not internally synchronized. A capture thread must hand
///          samples over to the control thread that drives the analysis session.
class PcmSource {
 public:
  virtual ~PcmSource() = default;

  /// @brief True if samples can be read (graph connected, playback permitted).
  virtual bool ready() const = 0;

  /// @brief Sample rate in Hz.
  virtual int sample_rate() const = 0;

  /// @brief Copies the n samples that end at the playhead, oldest first.
  /// @param out Output buffer of n samples
  /// @param n Number of samples
  /// @return False if the source is not ready (out is left untouched)
  /// @details Samples before the start of the stream are returned as zeros.
  virtual bool read_latest(float* out, size_t n) const = 0;
};

/// @brief Seekable source over a fully decoded buffer (file playback).
class BufferPcmSource : public PcmSource {
 public:
  /// @brief Constructs source over samples.
  /// @param samples Mono samples
  /// @param sample_rate Sample rate in Hz
  /// @throws CadenceException(InvalidParameter) if sample_rate <= 0
  BufferPcmSource(std::vector<float> samples, int sample_rate);

  /// @brief Constructs source over decoded audio.
  explicit BufferPcmSource(DecodedAudio audio);

  bool ready() const override { return ready_; }
  int sample_rate() const override { return sample_rate_; }
  bool read_latest(float* out, size_t n) const override;

  /// @brief Moves the playhead; clamped to [0, duration].
  void seek(double seconds);

  /// @brief Returns playhead position in seconds.
  double position() const;

  /// @brief Returns total duration in seconds.
  double duration() const;

  /// @brief True once the playhead reached the end of the buffer.
  bool ended() const { return playhead_ >= samples_.size(); }

  /// @brief Gates sample access (e.g. playback blocked until a user gesture).
  void set_ready(bool ready) { ready_ = ready; }

 private:
  std::vector<float> samples_;
  int sample_rate_;
  size_t playhead_ = 0;
  bool ready_ = true;
};

/// @brief Push-based ring buffer for live capture (microphone, system loopback).
class StreamPcmSource : public PcmSource {
 public:
  /// @brief Constructs an empty stream.
  /// @param sample_rate Sample rate in Hz
  /// @param capacity Ring capacity in samples (must cover the analyser FFT size)
  /// @throws CadenceException(InvalidParameter) on non-positive arguments
  StreamPcmSource(int sample_rate, size_t capacity);

  /// @brief Ready once connected and at least one sample was pushed.
  bool ready() const override { return connected_ && total_pushed_ > 0; }
  int sample_rate() const override { return sample_rate_; }

  /// @throws CadenceException(InvalidParameter) if n exceeds the ring capacity
  bool read_latest(float* out, size_t n) const override;

  /// @brief Appends captured samples; the oldest samples are overwritten when full.
  void push(const float* samples, size_t n);

  /// @brief Marks the device as revoked; the source stays unavailable until reconnect().
  void disconnect() { connected_ = false; }

  /// @brief Re-enables a disconnected source and drops stale samples.
  void reconnect();

  /// @brief Total samples pushed since construction or reconnect.
  size_t total_pushed() const { return total_pushed_; }

  size_t capacity() const { return ring_.size(); }

 private:
  std::vector<float> ring_;
  int sample_rate_;
  size_t write_pos_ = 0;
  size_t total_pushed_ = 0;
  bool connected_ = true;
};

}  // namespace cadence
