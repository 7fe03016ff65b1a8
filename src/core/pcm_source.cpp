#include "core/pcm_source.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "util/exception.h"

namespace cadence {

BufferPcmSource::BufferPcmSource(std::vector<float> samples, int sample_rate)
    : samples_(std::move(samples)), sample_rate_(sample_rate) {
  CADENCE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");
}

BufferPcmSource::BufferPcmSource(DecodedAudio audio)
    : BufferPcmSource(std::move(audio.samples), audio.sample_rate) {}

bool BufferPcmSource::read_latest(float* out, size_t n) const {
  if (!ready_) {
    return false;
  }

  const size_t end = std::min(playhead_, samples_.size());
  const size_t available = std::min(n, end);
  const size_t padding = n - available;

  std::fill(out, out + padding, 0.0f);
  std::copy(samples_.begin() + (end - available), samples_.begin() + end, out + padding);
  return true;
}

void BufferPcmSource::seek(double seconds) {
  if (std::isnan(seconds) || seconds <= 0.0) {
    playhead_ = 0;
    return;
  }
  // Clamp in double space: the product may exceed size_t (or be +inf)
  const double index = std::round(seconds * sample_rate_);
  if (index >= static_cast<double>(samples_.size())) {
    playhead_ = samples_.size();
    return;
  }
  playhead_ = static_cast<size_t>(index);
}

double BufferPcmSource::position() const {
  return static_cast<double>(playhead_) / static_cast<double>(sample_rate_);
}

double BufferPcmSource::duration() const {
  return static_cast<double>(samples_.size()) / static_cast<double>(sample_rate_);
}

StreamPcmSource::StreamPcmSource(int sample_rate, size_t capacity)
    : ring_(capacity, 0.0f), sample_rate_(sample_rate) {
  CADENCE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");
  CADENCE_CHECK_MSG(capacity > 0, ErrorCode::InvalidParameter, "Ring capacity must be positive");
}

bool StreamPcmSource::read_latest(float* out, size_t n) const {
  CADENCE_CHECK_MSG(n <= ring_.size(), ErrorCode::InvalidParameter,
                    "Requested block exceeds capture ring capacity");
  if (!ready()) {
    return false;
  }

  const size_t available = std::min(n, total_pushed_);
  const size_t padding = n - available;
  std::fill(out, out + padding, 0.0f);

  // Oldest requested sample sits `available` slots behind the write position
  size_t read_pos = (write_pos_ + ring_.size() - available) % ring_.size();
  for (size_t i = 0; i < available; ++i) {
    out[padding + i] = ring_[read_pos];
    read_pos = (read_pos + 1) % ring_.size();
  }
  return true;
}

void StreamPcmSource::push(const float* samples, size_t n) {
  if (samples == nullptr || n == 0) {
    return;
  }

  // Only the newest `capacity` samples can survive
  if (n > ring_.size()) {
    samples += n - ring_.size();
    total_pushed_ += n - ring_.size();
    n = ring_.size();
  }

  for (size_t i = 0; i < n; ++i) {
    ring_[write_pos_] = samples[i];
    write_pos_ = (write_pos_ + 1) % ring_.size();
  }
  total_pushed_ += n;
}

void StreamPcmSource::reconnect() {
  std::fill(ring_.begin(), ring_.end(), 0.0f);
  write_pos_ = 0;
  total_pushed_ = 0;
  connected_ = true;
}

}  // namespace cadence
