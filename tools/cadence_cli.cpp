/// @file cadence_cli.cpp
/// @brief Command-line interface for replaying audio files through an analysis session.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "cadence.h"

using namespace cadence;

// ============================================================================
// JSON Builder - Fluent interface for building JSON output
// ============================================================================

class JsonBuilder {
 public:
  JsonBuilder& begin_object() {
    append_separator();
    ss_ << "{";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_object() {
    ss_ << "}";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& begin_array() {
    append_separator();
    ss_ << "[";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_array() {
    ss_ << "]";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& key(const std::string& k) {
    append_separator();
    ss_ << "\"" << escape(k) << "\": ";
    needs_comma_.back() = false;
    return *this;
  }

  JsonBuilder& value(const std::string& v) {
    append_separator();
    ss_ << "\"" << escape(v) << "\"";
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(const char* v) { return value(std::string(v)); }

  JsonBuilder& value(int v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(uint32_t v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(size_t v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(float v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(double v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(bool v) {
    append_separator();
    ss_ << (v ? "true" : "false");
    needs_comma_.back() = true;
    return *this;
  }

  // Convenience: key-value pairs
  JsonBuilder& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, uint32_t v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, size_t v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, float v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, double v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, bool v) { return key(k).value(v); }

  JsonBuilder& double_array(const std::vector<double>& arr) {
    begin_array();
    for (double v : arr) value(v);
    end_array();
    return *this;
  }

  JsonBuilder& byte_array(const Spectrum& arr) {
    begin_array();
    for (uint8_t v : arr) value(static_cast<int>(v));
    end_array();
    return *this;
  }

  void print() const { std::cout << ss_.str() << "\n"; }

 private:
  void append_separator() {
    if (!needs_comma_.empty() && needs_comma_.back()) {
      ss_ << ", ";
    }
  }

  static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '"':
          result += "\\\"";
          break;
        case '\\':
          result += "\\\\";
          break;
        case '\n':
          result += "\\n";
          break;
        case '\r':
          result += "\\r";
          break;
        case '\t':
          result += "\\t";
          break;
        default:
          result += c;
      }
    }
    return result;
  }

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::string input_file;
  std::string click_track;
  bool json_output = false;
  bool quiet = false;
  bool verbose = false;
  bool help = false;

  double tick_rate = 30.0;
  SessionConfig config;

  std::map<std::string, std::string> options;

  bool has(const std::string& k) const { return options.count(k) > 0; }
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
      } else if (try_parse_global_option(args, arg, argv, i, argc)) {
        // Handled
      } else if (arg.substr(0, 2) == "--") {
        parse_option(args, arg.substr(2), argv, i, argc);
      } else if (args.command.empty()) {
        args.command = arg;
      } else if (args.input_file.empty()) {
        args.input_file = arg;
      }
    }

    return args;
  }

 private:
  static bool try_parse_global_option(CliArgs& args, const std::string& arg, char* argv[], int& i,
                                      int argc) {
    static const std::map<std::string, std::function<void(CliArgs&, const std::string&)>>
        global_opts = {
            {"--tick-rate", [](CliArgs& a, const std::string& v) { a.tick_rate = std::stod(v); }},
            {"--fft-size",
             [](CliArgs& a, const std::string& v) { a.config.analyser.fft_size = std::stoi(v); }},
            {"--smoothing",
             [](CliArgs& a, const std::string& v) { a.config.analyser.smoothing = std::stof(v); }},
            {"--threshold",
             [](CliArgs& a, const std::string& v) { a.config.peaks.threshold = std::stof(v); }},
            {"--min-distance",
             [](CliArgs& a,
                const std::string& v) { a.config.peaks.min_peak_distance = std::stod(v); }},
            {"--tolerance",
             [](CliArgs& a, const std::string& v) { a.config.beat_grid.tolerance = std::stod(v); }},
            {"--click-track", [](CliArgs& a, const std::string& v) { a.click_track = v; }},
        };

    auto it = global_opts.find(arg);
    if (it != global_opts.end() && i + 1 < argc) {
      it->second(args, argv[++i]);
      return true;
    }
    return false;
  }

  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    static const std::vector<std::string> bool_flags = {"spectrum"};

    if (std::find(bool_flags.begin(), bool_flags.end(), key) != bool_flags.end()) {
      args.options[key] = "true";
      return;
    }

    if (i + 1 < argc) {
      std::string next = argv[i + 1];
      bool is_negative_num = next.size() > 1 && next[0] == '-' && std::isdigit(next[1]);
      bool is_option = next.size() > 1 && next[0] == '-' && !is_negative_num;

      if (!is_option) {
        args.options[key] = argv[++i];
        return;
      }
    }
    args.options[key] = "true";
  }
};

// ============================================================================
// Replay - drives a session over a decoded file at the tick rate
// ============================================================================

struct ReplayResult {
  std::vector<AnalysisFrame> frames;
  TempoState tempo;
  size_t peaks_in_window = 0;
};

ReplayResult replay(const CliArgs& args, const DecodedAudio& audio) {
  static const std::string kSourceId = "file";

  CADENCE_CHECK_MSG(std::isfinite(args.tick_rate) && args.tick_rate > 0.0,
                    ErrorCode::InvalidParameter, "Tick rate must be positive");

  BufferPcmSource source(audio.samples, audio.sample_rate);
  PcmSamplerProvider provider;
  provider.add_source(kSourceId, &source);

  AnalysisSession session(provider, args.config);
  session.start(kSourceId);

  // Tick times start one period in: 0 is reserved for "no beat yet"
  const double step = 1.0 / args.tick_rate;
  const auto n_ticks = static_cast<size_t>(std::floor(audio.duration() * args.tick_rate));

  ReplayResult result;
  result.frames.reserve(n_ticks);
  for (size_t i = 1; i <= n_ticks; ++i) {
    double now = static_cast<double>(i) * step;
    source.seek(now);
    result.frames.push_back(session.advance(now));
  }

  result.tempo = session.tempo();
  result.peaks_in_window = session.peak_window().size();
  session.stop();
  return result;
}

std::vector<double> beat_times(const ReplayResult& result) {
  std::vector<double> times;
  for (const auto& frame : result.frames) {
    if (frame.on_beat) times.push_back(frame.timestamp);
  }
  return times;
}

/// @brief Mixes a short decaying 1 kHz click at each beat over the input.
std::vector<float> render_click_track(const DecodedAudio& audio, const std::vector<double>& beats) {
  constexpr float kClickHz = 1000.0f;
  constexpr float kClickSeconds = 0.03f;
  constexpr float kClickGain = 0.5f;
  constexpr float kPi = 3.14159265358979f;

  std::vector<float> out(audio.samples.size());
  std::transform(audio.samples.begin(), audio.samples.end(), out.begin(),
                 [](float s) { return s * 0.5f; });

  const auto click_len = static_cast<size_t>(kClickSeconds * audio.sample_rate);
  for (double t : beats) {
    auto start = static_cast<size_t>(std::lround(t * audio.sample_rate));
    for (size_t i = 0; i < click_len && start + i < out.size(); ++i) {
      float phase = 2.0f * kPi * kClickHz * static_cast<float>(i) / audio.sample_rate;
      float envelope = 1.0f - static_cast<float>(i) / static_cast<float>(click_len);
      out[start + i] += kClickGain * envelope * std::sin(phase);
    }
  }
  return out;
}

// ============================================================================
// Output Helpers
// ============================================================================

const char* format_name(AudioFormat format) {
  switch (format) {
    case AudioFormat::WAV:
      return "wav";
    case AudioFormat::MP3:
      return "mp3";
    case AudioFormat::Unknown:
      break;
  }
  return "unknown";
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&, const DecodedAudio&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonBuilder().begin_object().kv("cli_version", "1.0.0").kv("lib_version", version()).end_object().print();
  } else {
    std::cout << "cadence-cli version 1.0.0\n";
    std::cout << "libcadence version " << version() << "\n";
  }
  return 0;
}

int cmd_info(const CliArgs& args, const DecodedAudio& audio) {
  float peak = 0.0f, rms_sum = 0.0f;
  for (float s : audio.samples) {
    peak = std::max(peak, std::abs(s));
    rms_sum += s * s;
  }
  float rms = std::sqrt(rms_sum / static_cast<float>(audio.samples.size()));
  float peak_db = 20.0f * std::log10(std::max(peak, 1e-10f));
  float rms_db = 20.0f * std::log10(std::max(rms, 1e-10f));

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("path", args.input_file)
        .kv("format", format_name(audio.format))
        .kv("duration", audio.duration())
        .kv("sample_rate", audio.sample_rate)
        .kv("channels", audio.source_channels)
        .kv("samples", audio.samples.size())
        .kv("peak_db", peak_db)
        .kv("rms_db", rms_db)
        .end_object()
        .print();
  } else {
    int mins = static_cast<int>(audio.duration()) / 60;
    double secs = audio.duration() - mins * 60;
    std::cout << "Audio File: " << args.input_file << "\n";
    std::cout << "  Format:      " << format_name(audio.format) << "\n";
    std::cout << "  Duration:    " << mins << ":" << std::fixed << std::setprecision(1) << secs
              << " (" << audio.duration() << "s)\n";
    std::cout << "  Sample Rate: " << audio.sample_rate << " Hz\n";
    std::cout << "  Channels:    " << audio.source_channels << " (mixed to mono)\n";
    std::cout << "  Samples:     " << audio.samples.size() << "\n";
    std::cout << "  Peak Level:  " << std::fixed << std::setprecision(1) << peak_db << " dB\n";
    std::cout << "  RMS Level:   " << rms_db << " dB\n";
  }
  return 0;
}

int cmd_bpm(const CliArgs& args, const DecodedAudio& audio) {
  ReplayResult result = replay(args, audio);

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("bpm", result.tempo.bpm)
        .kv("beat_interval", result.tempo.beat_interval)
        .kv("peaks_in_window", result.peaks_in_window)
        .end_object()
        .print();
  } else {
    std::cout << "BPM: " << result.tempo.bpm << "\n";
  }
  return 0;
}

int cmd_beats(const CliArgs& args, const DecodedAudio& audio) {
  ReplayResult result = replay(args, audio);
  std::vector<double> beats = beat_times(result);

  if (!args.click_track.empty()) {
    std::vector<float> mix = render_click_track(audio, beats);
    save_wav(args.click_track, mix.data(), mix.size(), audio.sample_rate);
    if (!args.quiet && !args.json_output) {
      std::cerr << "Wrote click track to " << args.click_track << "\n";
    }
  }

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("bpm", result.tempo.bpm)
        .kv("count", beats.size())
        .key("beats")
        .double_array(beats)
        .end_object()
        .print();
  } else {
    std::cout << "Beats (" << beats.size() << " at " << result.tempo.bpm << " BPM):\n";
    for (double t : beats) {
      std::cout << "  " << std::fixed << std::setprecision(3) << t << "s\n";
    }
  }
  return 0;
}

int cmd_frames(const CliArgs& args, const DecodedAudio& audio) {
  ReplayResult result = replay(args, audio);
  const bool with_spectrum = args.has("spectrum");

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object().kv("tick_rate", args.tick_rate).key("frames").begin_array();
    for (const auto& frame : result.frames) {
      json.begin_object()
          .kv("time", frame.timestamp)
          .kv("bass", frame.bands.bass)
          .kv("mid", frame.bands.mid)
          .kv("high", frame.bands.high)
          .kv("amplitude", frame.amplitude)
          .kv("on_beat", frame.on_beat)
          .kv("bpm", frame.bpm);
      if (with_spectrum) {
        json.key("spectrum").byte_array(frame.spectrum);
      }
      json.end_object();
    }
    json.end_array().end_object().print();
  } else {
    printf("%8s %6s %6s %6s %6s %4s %4s\n", "time", "bass", "mid", "high", "amp", "bpm", "beat");
    for (const auto& frame : result.frames) {
      printf("%8.3f %6.3f %6.3f %6.3f %6.3f %4u %4s\n", frame.timestamp, frame.bands.bass,
             frame.bands.mid, frame.bands.high, frame.amplitude, frame.bpm,
             frame.on_beat ? "*" : "");
    }
  }
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"bpm", "Replay the file and report the locked tempo", cmd_bpm},
      {"beats", "Replay the file and list beat times", cmd_beats},
      {"frames", "Dump per-tick band energies and beat flags", cmd_frames},
      {"info", "Show audio file information", cmd_info},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] <audio_file>\n\n";

  std::cerr << "COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json               Output results in JSON format\n"
            << "  --quiet, -q          Suppress progress and log output\n"
            << "  --verbose, -v        Log session events (debug level)\n"
            << "  --help, -h           Show help\n"
            << "  --tick-rate <hz>     Analysis ticks per second (default: 30)\n"
            << "  --fft-size <int>     Analyser FFT size (default: 128)\n"
            << "  --smoothing <float>  Spectrum smoothing in [0, 1) (default: 0.5)\n"
            << "  --threshold <float>  Bass peak threshold (default: 0.65)\n"
            << "  --min-distance <s>   Minimum time between peaks (default: 0.2)\n"
            << "  --tolerance <s>      Beat grid tolerance (default: 0.05)\n"
            << "\nCOMMAND OPTIONS:\n"
            << "  beats --click-track <out.wav>  Mix clicks at each beat into a WAV file\n"
            << "  frames --spectrum              Include the byte spectrum per frame\n"
            << "\nExamples:\n"
            << "  " << prog << " bpm music.mp3\n"
            << "  " << prog << " beats music.wav --json\n"
            << "  " << prog << " beats music.wav --click-track clicks.wav\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  CliArgs args;
  try {
    args = ArgParser::parse(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: Invalid option value (" << e.what() << ")\n";
    return 1;
  }

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command.empty()) {
    std::cerr << "Error: No command specified\n\n";
    print_usage(argv[0]);
    return 1;
  }

  // Version command (no audio needed)
  if (args.command == "version") {
    return cmd_version(args);
  }

  const CommandInfo* cmd = find_command(args.command);
  if (!cmd) {
    std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.input_file.empty()) {
    std::cerr << "Error: Missing audio file\n\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.quiet) {
    set_log_level(spdlog::level::off);
  } else if (args.verbose) {
    set_log_level(spdlog::level::debug);
  }

  try {
    if (!args.quiet && !args.json_output) {
      std::cerr << "Loading " << args.input_file << "...\n";
    }

    DecodedAudio audio = load_audio(args.input_file);

    if (!args.quiet && !args.json_output) {
      std::cerr << "Loaded " << audio.duration() << "s @ " << audio.sample_rate << "Hz\n";
    }

    return cmd->handler(args, audio);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
