/// @file
/// @brief Option parsing and command dispatch for tonal_cli.

#include "cli/cli.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string_view>

#include "core/json_writer.h"
#include "descriptor_json.h"
#include "interval/interval.h"
#include "midi/midi_convert.h"
#include "midi/pcset.h"
#include "note/note.h"

namespace tonal {
namespace cli {

void printUsage(std::FILE* out) {
  std::fprintf(out, "tonal_cli - note, interval and pitch-class toolkit\n\n");
  std::fprintf(out, "Usage: tonal_cli [options] <command> [args...]\n\n");
  std::fprintf(out, "Options:\n");
  std::fprintf(out, "  --json           JSON output\n");
  std::fprintf(out, "  --sharps         Spell black keys with sharps\n");
  std::fprintf(out, "  --tuning HZ      Frequency of A4 (default 440)\n");
  std::fprintf(out, "  --config FILE    Load settings from a JSON file\n");
  std::fprintf(out, "  --verbose        Trace commands to stderr\n");
  std::fprintf(out, "  --help           Show this help\n");
  std::fprintf(out, "\nCommands:\n");
  std::fprintf(out, "  note NOTE...                  Note descriptors\n");
  std::fprintf(out, "  interval IVL...               Interval descriptors\n");
  std::fprintf(out, "  distance NOTE NOTE            Interval between two notes\n");
  std::fprintf(out, "  transpose NOTE IVL            Transpose a note\n");
  std::fprintf(out, "  transpose-fifths NOTE N       Transpose by N fifths\n");
  std::fprintf(out, "  enharmonic NOTE [PC]          Enharmonic respelling\n");
  std::fprintf(out, "  simplify NOTE                 Fewest accidentals\n");
  std::fprintf(out, "  add IVL IVL                   Sum of two intervals\n");
  std::fprintf(out, "  subtract IVL IVL              Difference of two intervals\n");
  std::fprintf(out, "  invert IVL                    Interval inversion\n");
  std::fprintf(out, "  simplify-interval IVL         Octave-reduce an interval\n");
  std::fprintf(out, "  from-semitones N              Interval of a semitone count\n");
  std::fprintf(out, "  from-midi N                   Note name of a MIDI number\n");
  std::fprintf(out, "  midi-to-freq MIDI|NOTE        Frequency in Hz\n");
  std::fprintf(out, "  freq-to-midi HZ               Real-valued MIDI number\n");
  std::fprintf(out, "  sort [--desc|--uniq] NOTE...  Sort notes by pitch\n");
  std::fprintf(out, "  nearest SET MIDI...           Snap to the nearest set member\n");
  std::fprintf(out, "  steps SET TONIC STEP...       Scale steps from a tonic\n");
  std::fprintf(out, "  degrees SET TONIC DEGREE...   Scale degrees from a tonic\n");
  std::fprintf(out, "\nSET is a 12-digit chroma (\"101011010101\") or a MIDI list "
                    "(\"60,64,67\").\n");
}

bool parseArgs(int argc, const char* const argv[], CliOptions& opts, int& exit_code) {
  int idx = 1;
  for (; idx < argc; ++idx) {
    const char* arg = argv[idx];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage(stdout);
      exit_code = 0;
      return false;
    }
    if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "--sharps") == 0) {
      opts.sharps = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(arg, "--tuning") == 0 && idx + 1 < argc) {
      char* end = nullptr;
      double hz = std::strtod(argv[++idx], &end);
      if (end == argv[idx] || *end != '\0' || !std::isfinite(hz) || hz <= 0.0) {
        std::fprintf(stderr, "[CLI] ERROR: invalid tuning \"%s\"\n", argv[idx]);
        exit_code = kExitUsage;
        return false;
      }
      opts.tuning = hz;
    } else if (std::strcmp(arg, "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (arg[0] == '-' && arg[1] == '-') {
      std::fprintf(stderr, "[CLI] ERROR: unknown option %s\n", arg);
      exit_code = kExitUsage;
      return false;
    } else {
      break;
    }
  }

  if (idx >= argc) {
    printUsage(stderr);
    exit_code = kExitUsage;
    return false;
  }
  opts.command = argv[idx++];
  for (; idx < argc; ++idx) {
    opts.args.emplace_back(argv[idx]);
  }
  return true;
}

bool buildConfig(const CliOptions& opts, TonalConfig& config) {
  if (!opts.config_path.empty()) {
    std::string error;
    if (!loadConfigFile(opts.config_path, config, error)) {
      std::fprintf(stderr, "[Config] ERROR: %s\n", error.c_str());
      return false;
    }
  }
  if (opts.tuning.has_value()) config.tuning = *opts.tuning;
  if (opts.sharps) config.sharps = true;
  if (opts.json_output) config.json_output = true;
  if (opts.verbose) config.verbose = true;
  return true;
}

// ---------------------------------------------------------------------------
// Argument parsing helpers
// ---------------------------------------------------------------------------

bool parseInt(const std::string& text, int& out) {
  std::string_view view(text);
  if (!view.empty() && view[0] == '+') view.remove_prefix(1);
  if (view.empty()) return false;
  const char* last = view.data() + view.size();
  auto result = std::from_chars(view.data(), last, out);
  return result.ec == std::errc() && result.ptr == last;
}

bool parseDouble(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return end == text.c_str() + text.size();
}

bool parseSet(const std::string& text, std::vector<int>& out) {
  if (text.size() == 12 && text.find_first_not_of("01") == std::string::npos) {
    out = pcset::pcsetFromChroma(text);
    return true;
  }
  out.clear();
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    int value = 0;
    if (!parseInt(text.substr(start, comma - start), value)) return false;
    out.push_back(value);
    start = comma + 1;
  }
  return true;
}

namespace {

bool badArgument(const char* what, const std::string& text) {
  std::fprintf(stderr, "[CLI] ERROR: invalid %s \"%s\"\n", what, text.c_str());
  return false;
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

/// @brief Collects one command's result as text lines or a JSON envelope.
///
/// JSON output has the form {"command":..., "args":[...], "result":...}.
class ResultPrinter {
 public:
  ResultPrinter(const CliOptions& opts, const TonalConfig& config)
      : json_(config.json_output), tuning_(config.tuning) {
    if (!json_) return;
    writer_.beginObject();
    writer_.key("command");
    writer_.value(opts.command);
    writer_.key("args");
    writer_.value(opts.args);
    writer_.key("result");
  }

  /// @return False when the result is empty.
  bool name(const std::string& result) {
    written_ = true;
    if (json_) {
      if (result.empty()) {
        writer_.valueNull();
      } else {
        writer_.value(result);
      }
    } else {
      text_ += result + "\n";
    }
    return !result.empty();
  }

  bool number(std::optional<double> result) {
    written_ = true;
    if (result.has_value() && !std::isfinite(*result)) result.reset();
    if (json_) {
      writer_.value(result);
    } else if (result.has_value()) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.15g\n", *result);
      text_ += buf;
    } else {
      text_ += "\n";
    }
    return result.has_value();
  }

  /// @return False when any entry is missing.
  bool integers(const std::vector<std::optional<int>>& results) {
    written_ = true;
    bool all_present = true;
    if (json_) writer_.beginArray();
    for (size_t idx = 0; idx < results.size(); ++idx) {
      all_present = all_present && results[idx].has_value();
      if (json_) {
        writer_.value(results[idx]);
        continue;
      }
      if (idx > 0) text_ += ' ';
      text_ += results[idx].has_value() ? std::to_string(*results[idx]) : "-";
    }
    if (json_) {
      writer_.endArray();
    } else {
      text_ += "\n";
    }
    return all_present;
  }

  void names(const std::vector<std::string>& results) {
    written_ = true;
    if (json_) {
      writer_.value(results);
      return;
    }
    for (size_t idx = 0; idx < results.size(); ++idx) {
      if (idx > 0) text_ += ' ';
      text_ += results[idx];
    }
    text_ += "\n";
  }

  /// @return False when any note is invalid.
  bool notes(const std::vector<std::string>& items) {
    written_ = true;
    bool all_valid = true;
    if (json_) writer_.beginArray();
    for (const auto& item : items) {
      const NoteInfo& info = note::get(item);
      all_valid = all_valid && !info.empty;
      if (json_) {
        writeNoteInfo(writer_, info, tuning_);
      } else {
        text_ += describeNote(info) + "\n";
      }
    }
    if (json_) writer_.endArray();
    return all_valid;
  }

  /// @return False when any interval is invalid.
  bool intervals(const std::vector<std::string>& items) {
    written_ = true;
    bool all_valid = true;
    if (json_) writer_.beginArray();
    for (const auto& item : items) {
      IntervalInfo info = interval::get(item);
      all_valid = all_valid && !info.empty;
      if (json_) {
        writeIntervalInfo(writer_, info);
      } else {
        text_ += describeInterval(info) + "\n";
      }
    }
    if (json_) writer_.endArray();
    return all_valid;
  }

  /// @brief Close the output and return it.
  ///
  /// A command that failed before writing a result gets a null result
  /// (an empty line as text).
  std::string finish() {
    if (json_) {
      if (!written_) writer_.valueNull();
      writer_.endObject();
      return writer_.toString() + "\n";
    }
    if (!written_) text_ = "\n";
    return text_;
  }

 private:
  std::string describeNote(const NoteInfo& info) const {
    if (info.empty) return "";
    std::string line = info.name + " pc=" + info.pitch_class + " chroma=" +
                       std::to_string(info.chroma);
    if (info.octave.has_value()) line += " oct=" + std::to_string(*info.octave);
    if (info.midi.has_value()) line += " midi=" + std::to_string(*info.midi);
    if (info.octave.has_value()) {
      char buf[48];
      std::snprintf(buf, sizeof(buf), " freq=%.3f",
                    midi::midiToFreq(info.height, tuning_));
      line += buf;
    }
    return line;
  }

  static std::string describeInterval(const IntervalInfo& info) {
    if (info.empty) return "";
    return info.name + " type=" + intervalTypeToString(info.type) +
           " semitones=" + std::to_string(info.semitones) +
           " simple=" + std::to_string(info.simple) + info.quality;
  }

  bool json_;
  bool written_ = false;
  double tuning_;
  JsonWriter writer_;
  std::string text_;
};

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

using Args = std::vector<std::string>;
using Handler = bool (*)(const Args&, const TonalConfig&, ResultPrinter&);

struct Command {
  const char* name;
  size_t min_args;
  size_t max_args;  ///< 0 = unlimited.
  Handler run;
};

bool runScaleLookup(const Args& args, ResultPrinter& out, bool degrees) {
  std::vector<int> set;
  int tonic = 0;
  if (!parseSet(args[0], set)) return badArgument("set", args[0]);
  if (!parseInt(args[1], tonic)) return badArgument("tonic", args[1]);

  pcset::PcsetSteps steps(set, tonic);
  pcset::PcsetDegrees degree_of(set, tonic);
  std::vector<std::optional<int>> results;
  for (size_t idx = 2; idx < args.size(); ++idx) {
    int position = 0;
    if (!parseInt(args[idx], position)) return badArgument("index", args[idx]);
    results.push_back(degrees ? degree_of(position) : steps(position));
  }
  return out.integers(results);
}

const Command kCommands[] = {
    {"note", 1, 0,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.notes(args);
     }},
    {"interval", 1, 0,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.intervals(args);
     }},
    {"distance", 2, 2,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(note::distance(args[0], args[1]));
     }},
    {"transpose", 2, 2,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(note::transpose(args[0], args[1]));
     }},
    {"transpose-fifths", 2, 2,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       int fifths = 0;
       if (!parseInt(args[1], fifths)) return badArgument("fifths", args[1]);
       return out.name(note::transposeFifths(args[0], fifths));
     }},
    {"enharmonic", 1, 2,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(note::enharmonic(args[0], args.size() > 1 ? args[1] : ""));
     }},
    {"simplify", 1, 1,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(note::simplify(args[0]));
     }},
    {"add", 2, 2,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(interval::add(args[0], args[1]));
     }},
    {"subtract", 2, 2,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(interval::subtract(args[0], args[1]));
     }},
    {"invert", 1, 1,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(interval::invert(args[0]));
     }},
    {"simplify-interval", 1, 1,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return out.name(interval::simplify(args[0]));
     }},
    {"from-semitones", 1, 1,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       int semitones = 0;
       if (!parseInt(args[0], semitones)) return badArgument("semitones", args[0]);
       return out.name(interval::fromSemitones(semitones));
     }},
    {"from-midi", 1, 1,
     [](const Args& args, const TonalConfig& config, ResultPrinter& out) {
       double midi = 0.0;
       if (!parseDouble(args[0], midi)) return badArgument("MIDI number", args[0]);
       return out.name(config.sharps ? note::fromMidiSharps(midi)
                                     : note::fromMidi(midi));
     }},
    {"midi-to-freq", 1, 1,
     [](const Args& args, const TonalConfig& config, ResultPrinter& out) {
       std::optional<int> midi = midi::toMidi(std::string_view(args[0]));
       std::optional<double> freq;
       if (midi.has_value()) freq = midi::midiToFreq(*midi, config.tuning);
       return out.number(freq);
     }},
    {"freq-to-midi", 1, 1,
     [](const Args& args, const TonalConfig& config, ResultPrinter& out) {
       double freq = 0.0;
       if (!parseDouble(args[0], freq)) return badArgument("frequency", args[0]);
       std::optional<double> midi;
       if (freq > 0.0) midi = midi::freqToMidi(freq, config.tuning);
       return out.number(midi);
     }},
    {"sort", 0, 0,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       Args notes = args;
       bool descending = false;
       bool uniq = false;
       if (!notes.empty() && (notes[0] == "--desc" || notes[0] == "--uniq")) {
         descending = notes[0] == "--desc";
         uniq = notes[0] == "--uniq";
         notes.erase(notes.begin());
       }
       if (uniq) {
         out.names(note::sortedUniqNames(notes));
       } else {
         out.names(note::sortedNames(
             notes, descending ? note::SortOrder::Descending
                               : note::SortOrder::Ascending));
       }
       return true;
     }},
    {"nearest", 2, 0,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       std::vector<int> set;
       if (!parseSet(args[0], set)) return badArgument("set", args[0]);
       pcset::PcsetNearest nearest(set);
       std::vector<std::optional<int>> results;
       for (size_t idx = 1; idx < args.size(); ++idx) {
         int midi = 0;
         if (!parseInt(args[idx], midi)) return badArgument("MIDI number", args[idx]);
         results.push_back(nearest(midi));
       }
       return out.integers(results);
     }},
    {"steps", 3, 0,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return runScaleLookup(args, out, false);
     }},
    {"degrees", 3, 0,
     [](const Args& args, const TonalConfig&, ResultPrinter& out) {
       return runScaleLookup(args, out, true);
     }},
};

const Command* findCommand(const std::string& name) {
  for (const auto& command : kCommands) {
    if (name == command.name) return &command;
  }
  return nullptr;
}

}  // namespace

int runCommand(const CliOptions& opts, const TonalConfig& config, std::string& output) {
  const Command* command = findCommand(opts.command);
  if (command == nullptr) {
    std::fprintf(stderr, "[CLI] ERROR: unknown command \"%s\"\n", opts.command.c_str());
    printUsage(stderr);
    return kExitUsage;
  }
  if (opts.args.size() < command->min_args ||
      (command->max_args > 0 && opts.args.size() > command->max_args)) {
    std::fprintf(stderr, "[CLI] ERROR: wrong number of arguments for \"%s\"\n",
                 command->name);
    return kExitUsage;
  }

  if (config.verbose) {
    std::fprintf(stderr, "[CLI] %s (%zu args) tuning=%.2f sharps=%d json=%d\n",
                 command->name, opts.args.size(), config.tuning, config.sharps ? 1 : 0,
                 config.json_output ? 1 : 0);
  }

  ResultPrinter printer(opts, config);
  bool ok = command->run(opts.args, config, printer);
  if (!ok && config.verbose) {
    std::fprintf(stderr, "[CLI] %s: invalid input\n", command->name);
  }
  output = printer.finish();
  return ok ? kExitOk : kExitInvalid;
}

}  // namespace cli
}  // namespace tonal
