/// @file audio_io_test.cpp
/// @brief Tests for audio file decoding and WAV export.

#include "core/audio_io.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "util/exception.h"

using namespace cadence;
using Catch::Matchers::WithinAbs;

namespace {

/// @brief Creates an interleaved float32 WAV file in memory.
std::vector<uint8_t> create_wav_buffer(const float* samples, size_t sample_count, int sample_rate,
                                       uint16_t channels = 1) {
  struct WavHeader {
    char riff[4] = {'R', 'I', 'F', 'F'};
    uint32_t file_size;
    char wave[4] = {'W', 'A', 'V', 'E'};
    char fmt[4] = {'f', 'm', 't', ' '};
    uint32_t fmt_size = 16;
    uint16_t audio_format = 3;  // IEEE float
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample = 32;
    char data[4] = {'d', 'a', 't', 'a'};
    uint32_t data_size;
  };

  WavHeader header;
  header.num_channels = channels;
  header.sample_rate = static_cast<uint32_t>(sample_rate);
  header.block_align = static_cast<uint16_t>(channels * 4);
  header.byte_rate = header.sample_rate * header.block_align;
  header.data_size = static_cast<uint32_t>(sample_count * 4);
  header.file_size = 36 + header.data_size;

  std::vector<uint8_t> buffer(sizeof(WavHeader) + header.data_size);
  std::memcpy(buffer.data(), &header, sizeof(WavHeader));
  std::memcpy(buffer.data() + sizeof(WavHeader), samples, sample_count * 4);

  return buffer;
}

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

std::vector<float> generate_sine(int samples, float freq, int sr) {
  std::vector<float> result(samples);
  for (int i = 0; i < samples; ++i) {
    result[i] = std::sin(kTwoPi * freq * i / sr);
  }
  return result;
}

std::string temp_path(const char* name) {
  return std::string(P_tmpdir) + "/cadence_" + name;
}

}  // namespace

TEST_CASE("detect_format WAV", "[audio_io]") {
  std::vector<uint8_t> wav_header = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
  REQUIRE(detect_format(wav_header.data(), wav_header.size()) == AudioFormat::WAV);
}

TEST_CASE("detect_format MP3", "[audio_io]") {
  SECTION("ID3 tag") {
    std::vector<uint8_t> mp3_header = {'I', 'D', '3', 0x04, 0x00, 0, 0, 0, 0, 0, 0, 0};
    REQUIRE(detect_format(mp3_header.data(), mp3_header.size()) == AudioFormat::MP3);
  }

  SECTION("frame sync") {
    std::vector<uint8_t> mp3_header = {0xFF, 0xFB, 0x90, 0x00, 0, 0, 0, 0, 0, 0, 0, 0};
    REQUIRE(detect_format(mp3_header.data(), mp3_header.size()) == AudioFormat::MP3);
  }
}

TEST_CASE("detect_format unknown or truncated", "[audio_io]") {
  std::vector<uint8_t> unknown = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05,
                                  0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B};
  REQUIRE(detect_format(unknown.data(), unknown.size()) == AudioFormat::Unknown);

  std::vector<uint8_t> small = {'R', 'I', 'F'};
  REQUIRE(detect_format(small.data(), small.size()) == AudioFormat::Unknown);
  REQUIRE(detect_format(nullptr, 64) == AudioFormat::Unknown);
}

TEST_CASE("decode_audio float32 WAV", "[audio_io]") {
  constexpr int sr = 22050;
  constexpr int samples = 1000;
  std::vector<float> original = generate_sine(samples, 440.0f, sr);
  std::vector<uint8_t> wav_data = create_wav_buffer(original.data(), original.size(), sr);

  DecodedAudio audio = decode_audio(wav_data.data(), wav_data.size());

  REQUIRE(audio.format == AudioFormat::WAV);
  REQUIRE(audio.sample_rate == sr);
  REQUIRE(audio.source_channels == 1);
  REQUIRE(audio.samples.size() == samples);
  REQUIRE_THAT(audio.duration(), WithinAbs(1000.0 / 22050.0, 1e-9));
  for (size_t i = 0; i < samples; ++i) {
    REQUIRE(audio.samples[i] == original[i]);
  }
}

TEST_CASE("decode_audio downmixes stereo", "[audio_io]") {
  // Left 0.8, right 0.2 -> mono 0.5
  std::vector<float> interleaved;
  for (int i = 0; i < 100; ++i) {
    interleaved.push_back(0.8f);
    interleaved.push_back(0.2f);
  }
  std::vector<uint8_t> wav_data = create_wav_buffer(interleaved.data(), interleaved.size(), 8000, 2);

  DecodedAudio audio = decode_audio(wav_data.data(), wav_data.size());

  REQUIRE(audio.source_channels == 2);
  REQUIRE(audio.samples.size() == 100);
  for (float s : audio.samples) {
    REQUIRE_THAT(s, WithinAbs(0.5f, 1e-6f));
  }
}

TEST_CASE("decode_audio errors", "[audio_io]") {
  SECTION("unknown format") {
    std::vector<uint8_t> junk(64, 0x42);
    try {
      decode_audio(junk.data(), junk.size());
      FAIL("expected InvalidFormat");
    } catch (const CadenceException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidFormat);
    }
  }

  SECTION("truncated WAV") {
    std::vector<uint8_t> header = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
    try {
      decode_audio(header.data(), header.size());
      FAIL("expected DecodeFailed");
    } catch (const CadenceException& e) {
      REQUIRE(e.code() == ErrorCode::DecodeFailed);
    }
  }
}

TEST_CASE("load_audio missing file", "[audio_io]") {
  try {
    load_audio(temp_path("does_not_exist.wav"));
    FAIL("expected FileNotFound");
  } catch (const CadenceException& e) {
    REQUIRE(e.code() == ErrorCode::FileNotFound);
  }
}

TEST_CASE("save_wav and load_audio", "[audio_io]") {
  constexpr int sr = 44100;
  std::vector<float> original = generate_sine(2000, 1000.0f, sr);
  const std::string path = temp_path("save_wav_test.wav");

  save_wav(path, original.data(), original.size(), sr);
  DecodedAudio audio = load_audio(path);
  std::remove(path.c_str());

  REQUIRE(audio.sample_rate == sr);
  REQUIRE(audio.samples.size() == original.size());
  // 16-bit quantization
  for (size_t i = 0; i < original.size(); ++i) {
    REQUIRE_THAT(audio.samples[i], WithinAbs(original[i], 2.0f / 32767.0f));
  }

  SECTION("file size limit") {
    save_wav(path, original.data(), original.size(), sr);
    AudioLoadOptions options;
    options.max_file_size = 100;
    try {
      load_audio(path, options);
      std::remove(path.c_str());
      FAIL("expected InvalidParameter");
    } catch (const CadenceException& e) {
      std::remove(path.c_str());
      REQUIRE(e.code() == ErrorCode::InvalidParameter);
    }
  }
}

TEST_CASE("save_wav rejects bad arguments", "[audio_io]") {
  std::vector<float> samples(10, 0.0f);
  REQUIRE_THROWS_AS(save_wav(temp_path("bad.wav"), nullptr, 10, 44100), CadenceException);
  REQUIRE_THROWS_AS(save_wav(temp_path("bad.wav"), samples.data(), 0, 44100), CadenceException);
  REQUIRE_THROWS_AS(save_wav(temp_path("bad.wav"), samples.data(), samples.size(), 0),
                    CadenceException);
}

TEST_CASE("AudioLoadOptions defaults", "[audio_io]") {
  AudioLoadOptions opts;
  REQUIRE(opts.max_file_size == 500 * 1024 * 1024);
}
