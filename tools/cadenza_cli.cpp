/// @file cadenza_cli.cpp
/// @brief Command-line interface for cadenza loudness/chroma extraction.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "cadenza.h"

using namespace cadenza;

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
  JsonBuilder& kv(const std::string& k, size_t v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, float v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, bool v) { return key(k).value(v); }

  // Array of floats
  template <typename Container>
  JsonBuilder& float_array(const Container& arr) {
    begin_array();
    for (float v : arr) value(v);
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
  std::string output_file;
  bool json_output = false;
  bool quiet = false;
  bool help = false;

  StreamConfig stream;

  std::map<std::string, std::string> options;

  int get_int(const std::string& k, int def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stoi(it->second) : def;
  }
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
    using Setter = std::function<void(CliArgs&, const std::string&)>;
    static const std::map<std::string, Setter> global_opts = {
        {"--sensitivity",
         [](CliArgs& a, const std::string& v) { a.stream.pipeline.sensitivity = std::stof(v); }},
        {"--skip-bins",
         [](CliArgs& a, const std::string& v) { a.stream.pipeline.skip_bins = std::stoi(v); }},
        {"--threshold",
         [](CliArgs& a, const std::string& v) {
           a.stream.pipeline.activity_threshold = std::stof(v);
         }},
        {"--decay",
         [](CliArgs& a, const std::string& v) { a.stream.pipeline.decay_factor = std::stof(v); }},
        {"--low-cut",
         [](CliArgs& a, const std::string& v) { a.stream.pipeline.low_cut = std::stoi(v); }},
        {"--high-cut",
         [](CliArgs& a, const std::string& v) { a.stream.pipeline.high_cut = std::stoi(v); }},
        {"--tuning",
         [](CliArgs& a, const std::string& v) { a.stream.pipeline.tuning_ref_hz = std::stof(v); }},
        {"--n-bins", [](CliArgs& a, const std::string& v) { a.stream.n_bins = std::stoi(v); }},
        {"--hop-length",
         [](CliArgs& a, const std::string& v) { a.stream.hop_length = std::stoi(v); }},
        {"--window",
         [](CliArgs& a, const std::string& v) { a.stream.window = window_from_name(v); }},
        {"-o", [](CliArgs& a, const std::string& v) { a.output_file = v; }},
        {"--output", [](CliArgs& a, const std::string& v) { a.output_file = v; }},
    };

    auto it = global_opts.find(arg);
    if (it != global_opts.end() && i + 1 < argc) {
      it->second(args, argv[++i]);
      return true;
    }
    return false;
  }

  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
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
// Output Helpers
// ============================================================================

std::string bar(float value, int width) {
  int filled = static_cast<int>(std::round(clamp(value, 0.0f, 1.0f) * width));
  return std::string(filled, '#') + std::string(width - filled, ' ');
}

/// @brief One character per pitch class, darker for more energy.
std::string chroma_cells(const ChromaVector& chroma) {
  static const char kRamp[] = " .:-=+*#%@";
  constexpr int kLevels = sizeof(kRamp) - 2;
  std::string cells;
  for (float v : chroma) {
    cells += kRamp[static_cast<int>(std::round(clamp(v, 0.0f, 1.0f) * kLevels))];
  }
  return cells;
}

const char* dominant_name(const ChromaVector& chroma) {
  if (*std::max_element(chroma.begin(), chroma.end()) <= 0.0f) return "-";
  return pitch_class_name(static_cast<PitchClass>(argmax(chroma.data(), chroma.size())));
}

/// @brief Runs the whole file through a ChromaStream in hop-sized chunks.
std::vector<StreamFrame> extract_frames(const CliArgs& args, const DecodedAudio& audio) {
  StreamConfig config = args.stream;
  config.sample_rate = audio.sample_rate;
  config.emit_every_n_frames = std::max(1, args.get_int("every", 1));

  ChromaStream stream(config);
  std::vector<StreamFrame> frames;
  size_t chunk = static_cast<size_t>(config.hop_length);
  for (size_t pos = 0; pos < audio.samples.size(); pos += chunk) {
    size_t n = std::min(chunk, audio.samples.size() - pos);
    stream.process(audio.samples.data() + pos, n);
    auto ready = stream.read_frames(stream.available_frames());
    frames.insert(frames.end(), ready.begin(), ready.end());
  }
  return frames;
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonBuilder().begin_object().kv("cli_version", "1.0.0").kv("lib_version", version()).end_object().print();
  } else {
    std::cout << "cadenza-cli version 1.0.0\n";
    std::cout << "libcadenza version " << version() << "\n";
  }
  return 0;
}

DecodedAudio load_input(const CliArgs& args) {
  if (!args.quiet && !args.json_output) {
    std::cerr << "Loading " << args.input_file << "...\n";
  }
  DecodedAudio audio = load_audio(args.input_file);
  if (!args.quiet && !args.json_output) {
    std::cerr << "Loaded " << audio.duration() << "s @ " << audio.sample_rate << "Hz\n";
  }
  return audio;
}

int cmd_info(const CliArgs& args) {
  DecodedAudio audio = load_input(args);
  float resolution = static_cast<float>(bin_resolution(audio.sample_rate, args.stream.n_bins));

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("path", args.input_file)
        .kv("duration", audio.duration())
        .kv("sample_rate", audio.sample_rate)
        .kv("samples", audio.samples.size())
        .kv("n_bins", args.stream.n_bins)
        .kv("bin_resolution_hz", resolution)
        .end_object()
        .print();
  } else {
    std::cout << "Audio Information:\n";
    printf("  Path:           %s\n", args.input_file.c_str());
    printf("  Duration:       %.2f seconds\n", audio.duration());
    printf("  Sample Rate:    %d Hz\n", audio.sample_rate);
    printf("  Samples:        %zu\n", audio.samples.size());
    printf("  Bin Resolution: %.2f Hz (%d bins)\n", resolution, args.stream.n_bins);
  }
  return 0;
}

int cmd_chroma(const CliArgs& args) {
  DecodedAudio audio = load_input(args);
  std::vector<StreamFrame> frames = extract_frames(args, audio);

  ReferenceSequence sequence;
  size_t active_frames = 0;
  for (const auto& frame : frames) {
    sequence.append(frame.chroma);
    if (frame.active) ++active_frames;
  }
  ChromaVector mean_energy = sequence.mean();

  if (!args.output_file.empty()) {
    sequence.save(args.output_file);
    if (!args.quiet && !args.json_output) {
      std::cerr << "Saved " << sequence.size() << " frames to " << args.output_file << "\n";
    }
  }

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object()
        .kv("n_frames", frames.size())
        .kv("active_frames", active_frames)
        .kv("duration", audio.duration())
        .key("mean_energy")
        .begin_object();
    for (int i = 0; i < kNumChroma; ++i) {
      json.kv(pitch_class_name(static_cast<PitchClass>(i)), mean_energy[i]);
    }
    json.end_object().key("frames").begin_array();
    for (const auto& frame : frames) json.float_array(frame.chroma);
    json.end_array().end_object().print();
  } else {
    std::cout << "Chroma Sequence:\n";
    printf("  Frames:   %zu (%zu active)\n", frames.size(), active_frames);
    printf("  Duration: %.2fs\n", audio.duration());
    std::cout << "\nMean Energy by Pitch Class:\n";
    for (int i = 0; i < kNumChroma; ++i) {
      printf("  %-2s: %.3f %s\n", pitch_class_name(static_cast<PitchClass>(i)), mean_energy[i],
             bar(mean_energy[i], 20).c_str());
    }
  }
  return 0;
}

int cmd_monitor(const CliArgs& args) {
  DecodedAudio audio = load_input(args);
  std::vector<StreamFrame> frames = extract_frames(args, audio);

  if (args.json_output) {
    JsonBuilder json;
    json.begin_array();
    for (const auto& frame : frames) {
      json.begin_object()
          .kv("time", frame.timestamp)
          .kv("loudness", frame.loudness)
          .kv("active", frame.active)
          .kv("status", activity_name(frame.activity))
          .key("chroma")
          .float_array(frame.chroma)
          .end_object();
    }
    json.end_array().print();
    return 0;
  }

  std::cout << "   time  loudness      note  CC#DD#EFF#GG#AA#B  status\n";
  for (const auto& frame : frames) {
    printf("%6.2fs  [%s]  %-3s  [%s]  %s\n", frame.timestamp, bar(frame.loudness, 10).c_str(),
           dominant_name(frame.chroma), chroma_cells(frame.chroma).c_str(),
           activity_name(frame.activity));
  }
  return 0;
}

int cmd_reference(const CliArgs& args) {
  ReferenceSequence sequence = ReferenceSequence::load(args.input_file);
  ChromaVector mean_energy = sequence.mean();

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object().kv("n_frames", sequence.size()).key("mean_energy").begin_object();
    for (int i = 0; i < kNumChroma; ++i) {
      json.kv(pitch_class_name(static_cast<PitchClass>(i)), mean_energy[i]);
    }
    json.end_object().end_object().print();
  } else {
    std::cout << "Reference Sequence:\n";
    printf("  Path:   %s\n", args.input_file.c_str());
    printf("  Frames: %zu\n", sequence.size());
    std::cout << "\nMean Energy by Pitch Class:\n";
    for (int i = 0; i < kNumChroma; ++i) {
      printf("  %-2s: %.3f %s\n", pitch_class_name(static_cast<PitchClass>(i)), mean_energy[i],
             bar(mean_energy[i], 20).c_str());
    }
  }
  return 0;
}

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"chroma", "Extract per-frame chroma (-o writes a reference file)", cmd_chroma},
      {"monitor", "Show loudness and pitch-class bars per frame", cmd_monitor},
      {"reference", "Summarize a reference chroma JSON file", cmd_reference},
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
  std::cerr << "Usage: " << prog << " <command> [options] <file> [-o output]\n\n";

  std::cerr << "COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json              Output results in JSON format\n"
            << "  --quiet, -q         Suppress status output\n"
            << "  --help, -h          Show help\n"
            << "  -o, --output        Output file path\n"
            << "\nPIPELINE OPTIONS:\n"
            << "  --sensitivity <f>   Gain, clamped to [1, 20] (default: 5)\n"
            << "  --skip-bins <int>   Low bins ignored for loudness (default: 4)\n"
            << "  --threshold <f>     Activity gate on raw loudness (default: 0.1)\n"
            << "  --decay <f>         Chroma decay per silent frame (default: 0.8)\n"
            << "  --low-cut <int>     First bin mapped to a pitch class (default: 10)\n"
            << "  --high-cut <int>    Last bin mapped to a pitch class (default: 500)\n"
            << "  --tuning <f>        Reference frequency for A4 (default: 440)\n"
            << "  --n-bins <int>      Magnitudes per frame (default: 1024)\n"
            << "  --hop-length <int>  Samples between frames (default: 1024)\n"
            << "  --window <name>     hann, hamming, blackman, rect (default: hann)\n"
            << "  --every <int>       Report every Nth frame (default: 1)\n"
            << "\nExamples:\n"
            << "  " << prog << " monitor take1.wav --sensitivity 8\n"
            << "  " << prog << " chroma ballade.mp3 -o ballade_features.json\n"
            << "  " << prog << " reference ballade_features.json --json\n";
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
    std::cerr << "Error: invalid option value (" << e.what() << ")\n";
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

  // Version command (no input needed)
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
    std::cerr << "Error: Missing input file\n\n";
    print_usage(argv[0]);
    return 1;
  }

  float requested = args.stream.pipeline.sensitivity;
  args.stream.pipeline.sensitivity = clamp_sensitivity(requested);
  if (args.stream.pipeline.sensitivity != requested && !args.quiet) {
    std::cerr << "Warning: sensitivity " << requested << " clamped to "
              << args.stream.pipeline.sensitivity << "\n";
  }

  try {
    args.stream.validate();
    return cmd->handler(args);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
