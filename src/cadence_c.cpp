/// @file cadence_c.cpp
/// @brief Implementation of C API.

#include "cadence_c.h"

#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <string>

#include "cadence.h"

using namespace cadence;

// Internal wrapper structures
struct CadenceSource {
  std::unique_ptr<PcmSource> source;
  BufferPcmSource* buffer = nullptr;
  StreamPcmSource* stream = nullptr;
};

struct CadenceSession {
  explicit CadenceSession(const SessionConfig& config) : session(provider, config) {}

  PcmSamplerProvider provider;
  AnalysisSession session;
};

namespace {

/// @brief Minimum valid sample rate (8kHz - telephone quality)
constexpr int kMinSampleRate = 8000;
/// @brief Maximum valid sample rate (384kHz - high-res audio)
constexpr int kMaxSampleRate = 384000;
/// @brief Maximum buffer size (~500M samples)
constexpr size_t kMaxBufferSize = 500000000;

CadenceError to_c_error(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return CADENCE_OK;
    case ErrorCode::FileNotFound:
      return CADENCE_ERROR_FILE_NOT_FOUND;
    case ErrorCode::InvalidFormat:
      return CADENCE_ERROR_INVALID_FORMAT;
    case ErrorCode::DecodeFailed:
      return CADENCE_ERROR_DECODE_FAILED;
    case ErrorCode::InvalidParameter:
      return CADENCE_ERROR_INVALID_PARAMETER;
    case ErrorCode::InvalidConfiguration:
      return CADENCE_ERROR_INVALID_CONFIGURATION;
    case ErrorCode::SourceUnavailable:
      return CADENCE_ERROR_SOURCE_UNAVAILABLE;
    case ErrorCode::OutOfMemory:
      return CADENCE_ERROR_OUT_OF_MEMORY;
  }
  return CADENCE_ERROR_UNKNOWN;
}

/// @brief Runs fn and converts exceptions to error codes at the C boundary.
template <typename Fn>
CadenceError guarded(Fn&& fn) {
  try {
    fn();
    return CADENCE_OK;
  } catch (const CadenceException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return CADENCE_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception& e) {
    logger()->error("C API: {}", e.what());
    return CADENCE_ERROR_UNKNOWN;
  }
}

CadenceSource* wrap_buffer(std::unique_ptr<BufferPcmSource> buffer) {
  auto* wrapper = new CadenceSource;
  wrapper->buffer = buffer.get();
  wrapper->source = std::move(buffer);
  return wrapper;
}

SessionConfig to_session_config(const CadenceConfig& config) {
  SessionConfig result;
  result.analyser.fft_size = config.fft_size;
  result.analyser.smoothing = config.smoothing;
  result.peaks.threshold = config.peak_threshold;
  result.peaks.rise_ratio = config.rise_ratio;
  result.peaks.min_peak_distance = config.min_peak_distance;
  result.beat_grid.tolerance = config.beat_tolerance;
  result.tempo.default_bpm = config.default_bpm;
  return result;
}

CadencePhase to_c_phase(PlaybackPhase phase) {
  switch (phase) {
    case PlaybackPhase::Playing:
      return CADENCE_PHASE_PLAYING;
    case PlaybackPhase::Paused:
      return CADENCE_PHASE_PAUSED;
    case PlaybackPhase::Idle:
      break;
  }
  return CADENCE_PHASE_IDLE;
}

}  // namespace

// Source functions

CadenceError cadence_source_from_buffer(const float* data, size_t length, int sample_rate,
                                        CadenceSource** out) {
  if (data == nullptr || out == nullptr || length == 0) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  if (sample_rate < kMinSampleRate || sample_rate > kMaxSampleRate) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  if (length > kMaxBufferSize) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    *out = wrap_buffer(
        std::make_unique<BufferPcmSource>(std::vector<float>(data, data + length), sample_rate));
  });
}

CadenceError cadence_source_from_memory(const uint8_t* data, size_t length, CadenceSource** out) {
  if (data == nullptr || out == nullptr || length == 0) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }

  return guarded(
      [&] { *out = wrap_buffer(std::make_unique<BufferPcmSource>(decode_audio(data, length))); });
}

CadenceError cadence_source_from_file(const char* path, CadenceSource** out) {
  if (path == nullptr || out == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }

  return guarded(
      [&] { *out = wrap_buffer(std::make_unique<BufferPcmSource>(load_audio(path))); });
}

CadenceError cadence_source_create_stream(int sample_rate, size_t capacity, CadenceSource** out) {
  if (out == nullptr || capacity == 0 || capacity > kMaxBufferSize) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  if (sample_rate < kMinSampleRate || sample_rate > kMaxSampleRate) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    auto stream = std::make_unique<StreamPcmSource>(sample_rate, capacity);
    auto* wrapper = new CadenceSource;
    wrapper->stream = stream.get();
    wrapper->source = std::move(stream);
    *out = wrapper;
  });
}

void cadence_source_free(CadenceSource* source) { delete source; }

CadenceError cadence_source_seek(CadenceSource* source, double seconds) {
  if (source == nullptr || source->buffer == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  source->buffer->seek(seconds);
  return CADENCE_OK;
}

CadenceError cadence_source_push(CadenceSource* source, const float* samples, size_t length) {
  if (source == nullptr || source->stream == nullptr || (samples == nullptr && length > 0)) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  source->stream->push(samples, length);
  return CADENCE_OK;
}

double cadence_source_position(const CadenceSource* source) {
  if (source == nullptr || source->buffer == nullptr) {
    return 0.0;
  }
  return source->buffer->position();
}

int cadence_source_ended(const CadenceSource* source) {
  if (source == nullptr || source->buffer == nullptr) {
    return 0;
  }
  return source->buffer->ended() ? 1 : 0;
}

double cadence_source_duration(const CadenceSource* source) {
  if (source == nullptr || source->buffer == nullptr) {
    return 0.0;
  }
  return source->buffer->duration();
}

int cadence_source_sample_rate(const CadenceSource* source) {
  if (source == nullptr) {
    return 0;
  }
  return source->source->sample_rate();
}

// Session functions

void cadence_config_default(CadenceConfig* config) {
  if (config == nullptr) {
    return;
  }
  SessionConfig defaults;
  config->fft_size = defaults.analyser.fft_size;
  config->smoothing = defaults.analyser.smoothing;
  config->peak_threshold = defaults.peaks.threshold;
  config->rise_ratio = defaults.peaks.rise_ratio;
  config->min_peak_distance = defaults.peaks.min_peak_distance;
  config->beat_tolerance = defaults.beat_grid.tolerance;
  config->default_bpm = defaults.tempo.default_bpm;
}

CadenceError cadence_session_create(const CadenceConfig* config, CadenceSession** out) {
  if (out == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    SessionConfig session_config = config ? to_session_config(*config) : SessionConfig();
    *out = new CadenceSession(session_config);
  });
}

void cadence_session_free(CadenceSession* session) { delete session; }

CadenceError cadence_session_add_source(CadenceSession* session, const char* source_id,
                                        const CadenceSource* source) {
  if (session == nullptr || source_id == nullptr || source == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  // The active sampler keeps reading the source registered at start
  if (session->session.active() && session->session.source_id() == source_id) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->provider.add_source(source_id, source->source.get()); });
}

CadenceError cadence_session_remove_source(CadenceSession* session, const char* source_id) {
  if (session == nullptr || source_id == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  if (session->session.active() && session->session.source_id() == source_id) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->provider.remove_source(source_id); });
}

CadenceError cadence_session_start(CadenceSession* session, const char* source_id,
                                   int preserve_tempo) {
  if (session == nullptr || source_id == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->session.start(source_id, preserve_tempo != 0); });
}

CadenceError cadence_session_pause(CadenceSession* session) {
  if (session == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->session.pause(); });
}

CadenceError cadence_session_resume(CadenceSession* session) {
  if (session == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->session.resume(); });
}

CadenceError cadence_session_switch_source(CadenceSession* session, const char* source_id,
                                           int preserve_tempo) {
  if (session == nullptr || source_id == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->session.switch_source(source_id, preserve_tempo != 0); });
}

CadenceError cadence_session_stop(CadenceSession* session) {
  if (session == nullptr) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { session->session.stop(); });
}

CadenceError cadence_session_advance(CadenceSession* session, double now, CadenceFrame* out) {
  if (session == nullptr || out == nullptr || !(now > 0.0)) {
    return CADENCE_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    AnalysisFrame frame = session->session.advance(now);
    out->bass = frame.bands.bass;
    out->mid = frame.bands.mid;
    out->high = frame.bands.high;
    out->amplitude = frame.amplitude;
    out->on_beat = frame.on_beat ? 1 : 0;
    out->bpm = frame.bpm;
    out->beat_time = frame.beat_time;
    out->timestamp = frame.timestamp;
    out->status = to_c_error(frame.status);
  });
}

CadencePhase cadence_session_phase(const CadenceSession* session) {
  if (session == nullptr) {
    return CADENCE_PHASE_IDLE;
  }
  return to_c_phase(session->session.phase());
}

size_t cadence_session_spectrum(const CadenceSession* session, uint8_t* out, size_t capacity) {
  if (session == nullptr || out == nullptr) {
    return 0;
  }
  const Spectrum& spectrum = session->session.last_frame().spectrum;
  size_t n = std::min(capacity, spectrum.size());
  if (n > 0) {
    std::memcpy(out, spectrum.data(), n);
  }
  return n;
}

// Error handling

const char* cadence_error_message(CadenceError error) {
  switch (error) {
    case CADENCE_OK:
      return "OK";
    case CADENCE_ERROR_FILE_NOT_FOUND:
      return "File not found";
    case CADENCE_ERROR_INVALID_FORMAT:
      return "Invalid format";
    case CADENCE_ERROR_DECODE_FAILED:
      return "Decode failed";
    case CADENCE_ERROR_INVALID_PARAMETER:
      return "Invalid parameter";
    case CADENCE_ERROR_OUT_OF_MEMORY:
      return "Out of memory";
    case CADENCE_ERROR_INVALID_CONFIGURATION:
      return "Invalid configuration";
    case CADENCE_ERROR_SOURCE_UNAVAILABLE:
      return "Audio source unavailable";
    default:
      return "Unknown error";
  }
}

// Version

const char* cadence_version(void) { return CADENCE_VERSION_STRING; }
