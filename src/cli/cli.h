// Command-line front end: option parsing, argument helpers and the command
// table shared by tonal_cli and its tests.

#ifndef TONAL_CLI_CLI_H
#define TONAL_CLI_CLI_H

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"

namespace tonal {
namespace cli {

/// Exit code when every result was produced.
constexpr int kExitOk = 0;

/// Exit code for invalid input (unparseable names, bad config file).
constexpr int kExitInvalid = 1;

/// Exit code for malformed command lines.
constexpr int kExitUsage = 2;

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string config_path;
  std::optional<double> tuning;
  bool sharps = false;
  bool json_output = false;
  bool verbose = false;
  std::string command;
  std::vector<std::string> args;
};

/// @brief Print usage information.
void printUsage(std::FILE* out);

/// @brief Parse global options up to the command name.
///
/// Options must precede the command; everything after it is an argument.
/// @param exit_code Set when parsing stops: 0 after --help, kExitUsage for
///        an unknown option, a bad --tuning value, or a missing command.
/// @return False when the program should exit with exit_code.
bool parseArgs(int argc, const char* const argv[], CliOptions& opts, int& exit_code);

/// @brief Resolve the effective config: file first, then CLI flags.
/// @return False (error logged) when the config file cannot be loaded.
bool buildConfig(const CliOptions& opts, TonalConfig& config);

// ---------------------------------------------------------------------------
// Argument parsing helpers
// ---------------------------------------------------------------------------

/// @brief Parse a whole decimal int, with optional sign.
bool parseInt(const std::string& text, int& out);

/// @brief Parse a whole real number.
bool parseDouble(const std::string& text, double& out);

/// @brief Parse a set argument.
///
/// Exactly 12 characters of '0'/'1' read as a chroma string; anything
/// else is a comma-separated MIDI list, so "101" is the single MIDI note 101.
/// @code
///   parseSet("101011010101", set);  // -> {0, 2, 4, 5, 7, 9, 11}
///   parseSet("60,64,67", set);      // -> {60, 64, 67}
/// @endcode
bool parseSet(const std::string& text, std::vector<int>& out);

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

/// @brief Run opts.command with opts.args.
///
/// Text output is one line per result; JSON output is an envelope
/// {"command":..., "args":[...], "result":...} with null for no result.
/// @param output Receives what the command prints to stdout.
/// @return kExitOk, kExitInvalid when any result is missing, or kExitUsage
///         for an unknown command or a wrong argument count.
int runCommand(const CliOptions& opts, const TonalConfig& config, std::string& output);

}  // namespace cli
}  // namespace tonal

#endif  // TONAL_CLI_CLI_H
