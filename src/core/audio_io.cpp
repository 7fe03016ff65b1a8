#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "util/exception.h"
#include "util/log.h"

// dr_wav implementation
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// minimp3 implementation
#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace cadence {

namespace {

constexpr float kInt16Scale = 1.0f / 32768.0f;

/// @brief Owns the sample buffer minimp3 allocates with malloc.
struct Mp3Buffer {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3Buffer() { std::free(ptr); }
};

/// @brief Owns an initialized drwav handle.
struct WavHandle {
  drwav wav;
  bool open = false;
  ~WavHandle() {
    if (open) drwav_uninit(&wav);
  }
};

/// @brief Averages interleaved channels into mono, converting each sample with `to_float`.
template <typename Sample, typename Convert>
std::vector<float> downmix(const Sample* interleaved, size_t frames, int channels,
                           Convert to_float) {
  std::vector<float> mono(frames);
  const float inv_channels = 1.0f / static_cast<float>(channels);
  for (size_t i = 0; i < frames; ++i) {
    float sum = 0.0f;
    for (int ch = 0; ch < channels; ++ch) {
      sum += to_float(interleaved[i * channels + ch]);
    }
    mono[i] = sum * inv_channels;
  }
  return mono;
}

DecodedAudio decode_wav(const uint8_t* data, size_t size) {
  WavHandle handle;
  handle.open = drwav_init_memory(&handle.wav, data, size, nullptr) != 0;
  CADENCE_CHECK_MSG(handle.open, ErrorCode::DecodeFailed, "Failed to parse WAV data");

  const int channels = static_cast<int>(handle.wav.channels);
  CADENCE_CHECK_MSG(channels > 0, ErrorCode::DecodeFailed, "WAV data has no channels");

  std::vector<float> interleaved(static_cast<size_t>(handle.wav.totalPCMFrameCount) * channels);
  drwav_uint64 frames =
      drwav_read_pcm_frames_f32(&handle.wav, handle.wav.totalPCMFrameCount, interleaved.data());
  CADENCE_CHECK_MSG(frames > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");

  DecodedAudio audio;
  audio.samples = downmix(interleaved.data(), static_cast<size_t>(frames), channels,
                          [](float s) { return s; });
  audio.sample_rate = static_cast<int>(handle.wav.sampleRate);
  audio.source_channels = channels;
  audio.format = AudioFormat::WAV;
  return audio;
}

DecodedAudio decode_mp3(const uint8_t* data, size_t size) {
  mp3dec_t decoder;
  mp3dec_file_info_t info{};
  mp3dec_init(&decoder);

  int result = mp3dec_load_buf(&decoder, data, size, &info, nullptr, nullptr);
  Mp3Buffer buffer;
  buffer.ptr = info.buffer;
  CADENCE_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");
  CADENCE_CHECK_MSG(info.samples > 0 && info.channels > 0, ErrorCode::DecodeFailed,
                    "No audio samples in MP3 data");

  const size_t frames = static_cast<size_t>(info.samples) / static_cast<size_t>(info.channels);

  DecodedAudio audio;
  audio.samples = downmix(info.buffer, frames, info.channels,
                          [](mp3d_sample_t s) { return static_cast<float>(s) * kInt16Scale; });
  audio.sample_rate = info.hz;
  audio.source_channels = info.channels;
  audio.format = AudioFormat::MP3;
  return audio;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (data == nullptr || size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (std::equal(data, data + 4, "RIFF") && std::equal(data + 8, data + 12, "WAVE")) {
    return AudioFormat::WAV;
  }

  // MP3: ID3 tag or 11-bit frame sync
  if (std::equal(data, data + 3, "ID3") || (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0)) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

DecodedAudio decode_audio(const uint8_t* data, size_t size) {
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      return decode_wav(data, size);
    case AudioFormat::MP3:
      return decode_mp3(data, size);
    case AudioFormat::Unknown:
      break;
  }
  throw CadenceException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
}

DecodedAudio load_audio(const std::string& path, const AudioLoadOptions& options) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  CADENCE_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  const auto size = static_cast<size_t>(file.tellg());
  CADENCE_CHECK_MSG(options.max_file_size == 0 || size <= options.max_file_size,
                    ErrorCode::InvalidParameter,
                    "File too large: " + std::to_string(size) + " bytes (max: " +
                        std::to_string(options.max_file_size) + " bytes)");

  std::vector<uint8_t> bytes(size);
  file.seekg(0, std::ios::beg);
  file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
  CADENCE_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);

  DecodedAudio audio = decode_audio(bytes.data(), bytes.size());
  logger()->debug("decoded {} ({} ch, {} Hz, {:.2f}s)", path, audio.source_channels,
                  audio.sample_rate, audio.duration());
  return audio;
}

void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate) {
  CADENCE_CHECK_MSG(samples != nullptr && n_samples > 0, ErrorCode::InvalidParameter,
                    "No samples to save");
  CADENCE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = 1;
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = 16;

  std::vector<int16_t> pcm(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    pcm[i] = static_cast<int16_t>(std::clamp(samples[i], -1.0f, 1.0f) * 32767.0f);
  }

  WavHandle handle;
  handle.open = drwav_init_file_write(&handle.wav, path.c_str(), &format, nullptr) != 0;
  CADENCE_CHECK_MSG(handle.open, ErrorCode::DecodeFailed, "Failed to create WAV file: " + path);

  drwav_uint64 written = drwav_write_pcm_frames(&handle.wav, n_samples, pcm.data());
  CADENCE_CHECK_MSG(written == n_samples, ErrorCode::DecodeFailed, "Failed to write all samples");
}

}  // namespace cadence
