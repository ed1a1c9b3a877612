/// @file pitchtrack_cli.cpp
/// @brief Command-line interface for pitchtrack note detection.

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/roadmap_analyzer.h"
#include "core/audio.h"
#include "core/audio_io.h"
#include "core/convert.h"
#include "feature/notation.h"
#include "feature/note.h"
#include "feature/yin_estimator.h"
#include "pitchtrack.h"
#include "streaming/live_session.h"

using namespace pitchtrack;

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

  JsonBuilder& null_value() {
    append_separator();
    ss_ << "null";
    needs_comma_.back() = true;
    return *this;
  }

  // Convenience: key-value pairs
  JsonBuilder& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, size_t v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, float v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, double v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, bool v) { return key(k).value(v); }

  std::string build() const { return ss_.str(); }
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
  std::string input_file;  // audio path, or frequency for "note"
  bool json_output = false;
  bool quiet = false;
  bool help = false;

  float a4 = kDefaultA4Hz;
  float silence_db = kSilenceDbDefault;
  float confidence_enter = kConfidenceEnter;
  float confidence_exit = kConfidenceExit;
  double segment_sec = 2.0;
  double max_duration_sec = 300.0;
  int chunk_size = static_cast<int>(kCaptureSize);
  std::string notation = "english";
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
      } else if (try_parse_global_option(args, arg, argv, i, argc)) {
        // Handled
      } else if (arg.substr(0, 2) == "--") {
        throw std::invalid_argument("Unknown option: " + arg);
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
            {"--a4", [](CliArgs& a, const std::string& v) { a.a4 = std::stof(v); }},
            {"--silence-db", [](CliArgs& a, const std::string& v) { a.silence_db = std::stof(v); }},
            {"--enter", [](CliArgs& a, const std::string& v) { a.confidence_enter = std::stof(v); }},
            {"--exit", [](CliArgs& a, const std::string& v) { a.confidence_exit = std::stof(v); }},
            {"--segment", [](CliArgs& a, const std::string& v) { a.segment_sec = std::stod(v); }},
            {"--max-duration",
             [](CliArgs& a, const std::string& v) { a.max_duration_sec = std::stod(v); }},
            {"--chunk", [](CliArgs& a, const std::string& v) { a.chunk_size = std::stoi(v); }},
            {"--notation", [](CliArgs& a, const std::string& v) { a.notation = v; }},
        };

    auto it = global_opts.find(arg);
    if (it == global_opts.end()) {
      return false;
    }
    if (i + 1 >= argc) {
      throw std::invalid_argument("Missing value for " + arg);
    }
    const std::string value = argv[++i];
    try {
      it->second(args, value);
    } catch (const std::logic_error&) {
      // std::stof and friends throw invalid_argument / out_of_range
      throw std::invalid_argument("Invalid value for " + arg + ": " + value);
    }
    return true;
  }
};

// ============================================================================
// Output Helpers
// ============================================================================

void progress_callback(float progress, const char* stage) {
  std::cerr << "\r" << stage << ": " << static_cast<int>(progress * 100) << "%   " << std::flush;
}

void clear_progress() { std::cerr << "\r                              \r"; }

std::string display_full_name(const NotationPreset& preset, const char* note_name, int octave) {
  return preset.translate(std::string(note_name)) + std::to_string(octave);
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&, const Audio&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonBuilder().begin_object().kv("cli_version", "1.0.0").kv("lib_version", version()).end_object().print();
  } else {
    std::cout << "pitchtrack-cli version 1.0.0\n";
    std::cout << "libpitchtrack version " << version() << "\n";
  }
  return 0;
}

int cmd_note(const CliArgs& args) {
  if (args.input_file.empty()) {
    std::cerr << "Error: note requires a frequency in Hz\n";
    return 1;
  }
  float frequency = std::stof(args.input_file);
  const NotationPreset& preset = builtin_preset(parse_notation(args.notation));
  auto note = frequency_to_note(frequency, args.a4);

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object().kv("frequency", frequency).kv("a4", args.a4);
    if (note) {
      json.kv("note", preset.translate(note->pitch_class))
          .kv("octave", note->octave)
          .kv("name", display_full_name(preset, note->note_name(), note->octave))
          .kv("cents", note->cents)
          .kv("midi", note->midi);
    } else {
      json.key("note").null_value();
    }
    json.end_object().print();
  } else if (note) {
    std::cout << "Note:  " << display_full_name(preset, note->note_name(), note->octave) << "\n";
    std::cout << "Cents: " << std::showpos << note->cents << std::noshowpos << "\n";
    std::cout << "MIDI:  " << note->midi << "\n";
  } else {
    std::cout << "No note (frequency must be in (" << kNoteMinHz << ", " << kNoteMaxHz
              << "] Hz)\n";
  }
  return 0;
}

int cmd_info(const CliArgs& args, const Audio& audio) {
  float peak = 0.0f;
  for (size_t i = 0; i < audio.size(); ++i) {
    peak = std::max(peak, std::abs(audio.data()[i]));
  }
  float peak_db = amplitude_to_db(peak);
  float rms_db = amplitude_to_db(rms(audio.data(), audio.size()));

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("path", args.input_file)
        .kv("duration", audio.duration())
        .kv("sample_rate", audio.sample_rate())
        .kv("samples", audio.size())
        .kv("peak_db", peak_db)
        .kv("rms_db", rms_db)
        .end_object()
        .print();
  } else {
    int mins = static_cast<int>(audio.duration()) / 60;
    double secs = audio.duration() - mins * 60;
    std::cout << "Audio File: " << args.input_file << "\n";
    std::cout << "  Duration:    " << mins << ":" << std::fixed << std::setprecision(1) << secs
              << " (" << audio.duration() << "s)\n";
    std::cout << "  Sample Rate: " << audio.sample_rate() << " Hz\n";
    std::cout << "  Samples:     " << audio.size() << "\n";
    std::cout << "  Peak Level:  " << std::fixed << std::setprecision(1) << peak_db << " dB\n";
    std::cout << "  RMS Level:   " << rms_db << " dB\n";
  }
  return 0;
}

int cmd_roadmap(const CliArgs& args, const Audio& audio) {
  RoadmapConfig config;
  config.segment_sec = args.segment_sec;
  config.max_duration_sec = args.max_duration_sec;
  config.chunk_size = static_cast<size_t>(std::max(1, args.chunk_size));
  config.silence_db = args.silence_db;
  config.confidence_enter = args.confidence_enter;
  config.a4_reference_hz = args.a4;

  const NotationPreset& preset = builtin_preset(parse_notation(args.notation));

  RoadmapAnalyzer analyzer(config);
  bool show_progress = !args.quiet && !args.json_output;
  if (show_progress) {
    analyzer.set_progress_callback(progress_callback);
  }
  RoadmapResult result = analyzer.analyze(audio);
  if (show_progress) clear_progress();

  // dominant_note is "<English name><octave>"
  std::string dominant;
  if (!result.dominant_note.empty()) {
    size_t digits = result.dominant_note.find_first_of("-0123456789");
    dominant = preset.translate(result.dominant_note.substr(0, digits)) +
               result.dominant_note.substr(digits);
  }

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object()
        .kv("dominant_note", dominant)
        .kv("total_duration", result.total_duration_sec)
        .kv("segment_count", result.segments.size())
        .kv("segments_with_notes", result.segments_with_notes())
        .key("segments")
        .begin_array();
    for (const auto& s : result.segments) {
      json.begin_object().kv("start", s.start_sec).kv("end", s.end_sec).kv("has_note", s.has_note);
      if (s.has_note) {
        json.kv("note", preset.translate(s.note_name))
            .kv("octave", s.octave)
            .kv("name", display_full_name(preset, s.note_name.c_str(), s.octave))
            .kv("confidence", s.confidence);
      }
      json.end_object();
    }
    json.end_array().end_object().print();
  } else {
    std::cout << "Dominant note: " << (dominant.empty() ? "-" : dominant) << "\n";
    std::cout << "Duration: " << result.total_duration_sec << "s, " << result.segments.size()
              << " segments (" << result.segments_with_notes() << " with notes)\n\n";
    std::cout << "Start     End       Note     Confidence\n";
    for (const auto& s : result.segments) {
      if (s.has_note) {
        printf("%-9.2f %-9.2f %-8s %.2f\n", s.start_sec, s.end_sec,
               display_full_name(preset, s.note_name.c_str(), s.octave).c_str(), s.confidence);
      } else {
        printf("%-9.2f %-9.2f %-8s -\n", s.start_sec, s.end_sec, "-");
      }
    }
  }
  return 0;
}

int cmd_track(const CliArgs& args, const Audio& audio) {
  // Stream time stands in for the wall clock so staleness follows the file.
  double stream_ms = 0.0;
  SessionConfig config;
  config.silence_db = args.silence_db;
  config.confidence_enter = args.confidence_enter;
  config.confidence_exit = args.confidence_exit;
  config.a4_reference_hz = args.a4;
  config.clock = [&stream_ms]() { return stream_ms; };

  const NotationPreset& preset = builtin_preset(parse_notation(args.notation));
  LiveDetectionSession session(static_cast<float>(audio.sample_rate()), config);

  size_t chunk = static_cast<size_t>(std::max(1, args.chunk_size));
  JsonBuilder json;
  if (args.json_output) json.begin_array();
  else std::cout << "Time      Note     Cents   Frequency   Confidence\n";

  uint64_t published = 0;
  for (size_t pos = 0; pos < audio.size(); pos += chunk) {
    size_t n = std::min(chunk, audio.size() - pos);
    stream_ms = samples_to_time(pos + n, audio.sample_rate()) * 1000.0;
    session.on_chunk(audio.data() + pos, n);

    SessionStats stats = session.stats();
    if (stats.estimates_published != published) {
      published = stats.estimates_published;
      PitchEstimate e = session.peek();
      std::string name = display_full_name(preset, e.note_name(), e.octave);
      if (args.json_output) {
        json.begin_object()
            .kv("time", e.timestamp_ms / 1000.0)
            .kv("note", name)
            .kv("cents", e.cents)
            .kv("frequency", e.frequency)
            .kv("confidence", e.confidence)
            .end_object();
      } else {
        printf("%-9.3f %-8s %+-7d %-11.2f %.2f\n", e.timestamp_ms / 1000.0, name.c_str(), e.cents,
               e.frequency, e.confidence);
      }
    }
  }

  SessionStats stats = session.stats();
  if (args.json_output) {
    json.end_array().print();
  } else if (!args.quiet) {
    std::cerr << "Windows: " << stats.windows_analyzed << ", published: "
              << stats.estimates_published << ", clears: " << stats.clears << "\n";
  }
  return 0;
}

int cmd_pitch(const CliArgs& args, const Audio& audio) {
  const NotationPreset& preset = builtin_preset(parse_notation(args.notation));
  YinEstimator estimator(static_cast<float>(audio.sample_rate()));
  size_t window = estimator.window_size();
  size_t hop = static_cast<size_t>(std::max(1, args.chunk_size));

  JsonBuilder json;
  if (args.json_output) json.begin_array();
  else std::cout << "Time      Frequency   Confidence  Note\n";

  size_t voiced = 0;
  size_t frames = 0;
  for (size_t pos = 0; pos + window <= audio.size(); pos += hop) {
    ++frames;
    double time = samples_to_time(pos, audio.sample_rate());
    auto raw = estimator.estimate(audio.data() + pos);
    std::optional<NoteInfo> note;
    if (raw) {
      ++voiced;
      note = frequency_to_note(raw->frequency, args.a4);
    }
    std::string name = note ? display_full_name(preset, note->note_name(), note->octave) : "-";

    if (args.json_output) {
      json.begin_object().kv("time", time);
      if (raw) {
        json.kv("frequency", raw->frequency).kv("confidence", raw->confidence).kv("note", name);
      } else {
        json.key("frequency").null_value();
      }
      json.end_object();
    } else if (raw) {
      printf("%-9.3f %-11.2f %-11.2f %s\n", time, raw->frequency, raw->confidence, name.c_str());
    } else {
      printf("%-9.3f %-11s %-11s %s\n", time, "-", "-", "-");
    }
  }

  if (args.json_output) {
    json.end_array().print();
  } else if (!args.quiet) {
    std::cerr << "Frames: " << frames << ", voiced: " << voiced << "\n";
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
  bool requires_audio;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      // Analysis
      {"roadmap", "Segment-wise note roadmap and dominant note", cmd_roadmap, true},
      {"track", "Stream the file through a live session", cmd_track, true},
      {"pitch", "Raw YIN estimate per analysis window", cmd_pitch, true},
      // Utility
      {"info", "Show audio file information", cmd_info, true},
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

  std::cerr << "ANALYSIS COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    if (cmd.name == "info") std::cerr << "\nUTILITY COMMANDS:\n";
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  note <hz>      Convert a frequency to a note\n";
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json               Output results in JSON format\n"
            << "  --quiet, -q          Suppress progress output\n"
            << "  --help, -h           Show help\n"
            << "  --a4 <hz>            A4 reference (default: 440)\n"
            << "  --silence-db <db>    Silence gate in dBFS (default: -40)\n"
            << "  --enter <0-1>        Confidence to start showing a note (default: 0.85)\n"
            << "  --exit <0-1>         Confidence to keep showing a note (default: 0.75)\n"
            << "  --segment <sec>      Roadmap segment duration (default: 2.0)\n"
            << "  --max-duration <sec> Roadmap processing cap (default: 300)\n"
            << "  --chunk <int>        Samples per chunk / hop (default: 1024)\n"
            << "  --notation <name>    english, solfege or german (default: english)\n"
            << "\nExamples:\n"
            << "  " << prog << " roadmap vocals.mp3\n"
            << "  " << prog << " track guitar.wav --json\n"
            << "  " << prog << " note 445 --a4 442\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    CliArgs args = ArgParser::parse(argc, argv);

    if (args.help) {
      print_usage(argv[0]);
      return 0;
    }

    if (args.command.empty()) {
      std::cerr << "Error: No command specified\n\n";
      print_usage(argv[0]);
      return 1;
    }

    // Commands without audio
    if (args.command == "version") {
      return cmd_version(args);
    }
    if (args.command == "note") {
      return cmd_note(args);
    }

    const CommandInfo* cmd = find_command(args.command);
    if (!cmd) {
      std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (cmd->requires_audio && args.input_file.empty()) {
      std::cerr << "Error: Missing audio file\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (!args.quiet && !args.json_output) {
      std::cerr << "Loading " << args.input_file << "...\n";
    }

    auto [samples, sample_rate] = load_audio(args.input_file);
    if (samples.empty()) {
      std::cerr << "Error: Failed to load audio file\n";
      return 1;
    }

    Audio audio = Audio::from_vector(std::move(samples), sample_rate);

    if (!args.quiet && !args.json_output) {
      std::cerr << "Loaded " << audio.duration() << "s @ " << sample_rate << "Hz\n";
    }

    return cmd->handler(args, audio);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
