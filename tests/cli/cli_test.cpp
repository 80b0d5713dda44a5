// Tests for cli/cli.h -- option parsing, set arguments, exit codes and output.

#include "cli/cli.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace tonal {
namespace cli {
namespace {

/// @brief Run parseArgs over a list of words (argv[0] is added).
bool parseWords(const std::vector<const char*>& words, CliOptions& opts, int& exit_code) {
  std::vector<const char*> argv = {"tonal_cli"};
  argv.insert(argv.end(), words.begin(), words.end());
  return parseArgs(static_cast<int>(argv.size()), argv.data(), opts, exit_code);
}

/// @brief Run one command with the given config and capture its output.
int run(const std::string& command, const std::vector<std::string>& args, std::string& output,
        const TonalConfig& config = TonalConfig{}) {
  CliOptions opts;
  opts.command = command;
  opts.args = args;
  return runCommand(opts, config, output);
}

TonalConfig jsonConfig() {
  TonalConfig config;
  config.json_output = true;
  return config;
}

// ---------------------------------------------------------------------------
// parseArgs
// ---------------------------------------------------------------------------

TEST(ParseArgsTest, OptionsThenCommandAndArguments) {
  CliOptions opts;
  int exit_code = -1;
  ASSERT_TRUE(parseWords({"--json", "--sharps", "--tuning", "432", "--config", "c.json",
                          "sort", "--desc", "C4", "E4"},
                         opts, exit_code));
  EXPECT_TRUE(opts.json_output);
  EXPECT_TRUE(opts.sharps);
  EXPECT_FALSE(opts.verbose);
  ASSERT_TRUE(opts.tuning.has_value());
  EXPECT_DOUBLE_EQ(*opts.tuning, 432.0);
  EXPECT_EQ(opts.config_path, "c.json");
  EXPECT_EQ(opts.command, "sort");
  EXPECT_EQ(opts.args, (std::vector<std::string>{"--desc", "C4", "E4"}));
}

TEST(ParseArgsTest, HelpExitsWithZero) {
  CliOptions opts;
  int exit_code = -1;
  EXPECT_FALSE(parseWords({"--help"}, opts, exit_code));
  EXPECT_EQ(exit_code, 0);
}

TEST(ParseArgsTest, UsageErrors) {
  for (const auto& words : std::vector<std::vector<const char*>>{
           {},
           {"--json"},
           {"--bogus", "note", "C4"},
           {"--tuning", "abc", "note", "C4"},
           {"--tuning", "-440", "note", "C4"},
           {"--tuning", "0", "note", "C4"},
           {"--tuning"}}) {
    CliOptions opts;
    int exit_code = -1;
    EXPECT_FALSE(parseWords(words, opts, exit_code));
    EXPECT_EQ(exit_code, kExitUsage);
  }
}

// ---------------------------------------------------------------------------
// buildConfig
// ---------------------------------------------------------------------------

TEST(BuildConfigTest, FlagsOverrideFile) {
  std::string path = testing::TempDir() + "cli_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"tuning": 415, "sharps": false, "verbose": false})";
  }
  CliOptions opts;
  opts.config_path = path;
  opts.sharps = true;

  TonalConfig config;
  ASSERT_TRUE(buildConfig(opts, config));
  EXPECT_DOUBLE_EQ(config.tuning, 415.0);
  EXPECT_TRUE(config.sharps);

  opts.tuning = 440.0;
  ASSERT_TRUE(buildConfig(opts, config));
  EXPECT_DOUBLE_EQ(config.tuning, 440.0);
}

TEST(BuildConfigTest, MissingFileFails) {
  CliOptions opts;
  opts.config_path = testing::TempDir() + "no_such_tonal_config.json";
  TonalConfig config;
  EXPECT_FALSE(buildConfig(opts, config));
}

// ---------------------------------------------------------------------------
// parseInt / parseSet
// ---------------------------------------------------------------------------

TEST(ParseIntTest, WholeTokensOnly) {
  int value = 0;
  EXPECT_TRUE(parseInt("+12", value));
  EXPECT_EQ(value, 12);
  EXPECT_TRUE(parseInt("-2147483648", value));
  EXPECT_EQ(value, -2147483647 - 1);
  EXPECT_FALSE(parseInt("", value));
  EXPECT_FALSE(parseInt("12a", value));
  EXPECT_FALSE(parseInt("2147483648", value));
}

TEST(ParseSetTest, TwelveDigitChroma) {
  std::vector<int> set;
  ASSERT_TRUE(parseSet("101011010101", set));
  EXPECT_EQ(set, (std::vector<int>{0, 2, 4, 5, 7, 9, 11}));
}

TEST(ParseSetTest, MidiList) {
  std::vector<int> set;
  ASSERT_TRUE(parseSet("60,64,67", set));
  EXPECT_EQ(set, (std::vector<int>{60, 64, 67}));
}

TEST(ParseSetTest, ShortBinaryStringIsAMidiNumber) {
  std::vector<int> set;
  ASSERT_TRUE(parseSet("101", set));
  EXPECT_EQ(set, (std::vector<int>{101}));
  ASSERT_TRUE(parseSet("0", set));
  EXPECT_EQ(set, (std::vector<int>{0}));
}

TEST(ParseSetTest, MalformedLists) {
  std::vector<int> set;
  EXPECT_FALSE(parseSet("", set));
  EXPECT_FALSE(parseSet("60,,64", set));
  EXPECT_FALSE(parseSet("60,", set));
  EXPECT_FALSE(parseSet("C,E,G", set));
  // Thirteen digits are not a chroma, and too large for a MIDI number.
  EXPECT_FALSE(parseSet("1010110101010", set));
}

// ---------------------------------------------------------------------------
// runCommand: exit codes
// ---------------------------------------------------------------------------

TEST(RunCommandTest, SuccessIsZero) {
  std::string output;
  EXPECT_EQ(run("distance", {"C4", "G4"}, output), kExitOk);
  EXPECT_EQ(output, "5P\n");
}

TEST(RunCommandTest, InvalidInputIsOne) {
  std::string output;
  EXPECT_EQ(run("distance", {"C4", "nope"}, output), kExitInvalid);
  EXPECT_EQ(output, "\n");

  EXPECT_EQ(run("transpose-fifths", {"C4", "abc"}, output), kExitInvalid);
  EXPECT_EQ(output, "\n");
}

TEST(RunCommandTest, UnknownCommandAndArgumentCountAreUsageErrors) {
  std::string output;
  EXPECT_EQ(run("frobnicate", {"C4"}, output), kExitUsage);
  EXPECT_EQ(output, "");
  EXPECT_EQ(run("distance", {"C4"}, output), kExitUsage);
  EXPECT_EQ(run("invert", {"3M", "5P"}, output), kExitUsage);
  EXPECT_EQ(run("note", {}, output), kExitUsage);
}

// ---------------------------------------------------------------------------
// runCommand: JSON envelope
// ---------------------------------------------------------------------------

TEST(RunCommandTest, JsonEnvelope) {
  std::string output;
  EXPECT_EQ(run("transpose", {"C4", "5P"}, output, jsonConfig()), kExitOk);
  EXPECT_EQ(output, R"({"command":"transpose","args":["C4","5P"],"result":"G4"})" "\n");
}

TEST(RunCommandTest, JsonNullResults) {
  std::string output;
  EXPECT_EQ(run("add", {"3M", "nope"}, output, jsonConfig()), kExitInvalid);
  EXPECT_EQ(output, R"({"command":"add","args":["3M","nope"],"result":null})" "\n");

  // A bad argument stops the command before it writes a result.
  EXPECT_EQ(run("from-semitones", {"x"}, output, jsonConfig()), kExitInvalid);
  EXPECT_EQ(output, R"({"command":"from-semitones","args":["x"],"result":null})" "\n");
}

TEST(RunCommandTest, JsonIntegerListWithGaps) {
  std::string output;
  EXPECT_EQ(run("degrees", {"101011010101", "60", "1", "0", "8"}, output, jsonConfig()),
            kExitInvalid);
  EXPECT_EQ(output,
            R"({"command":"degrees","args":["101011010101","60","1","0","8"],)"
            R"("result":[60,null,72]})" "\n");
}

// ---------------------------------------------------------------------------
// runCommand: individual commands
// ---------------------------------------------------------------------------

TEST(RunCommandTest, SortOrders) {
  std::string output;
  EXPECT_EQ(run("sort", {"E4", "C4", "nope", "D4"}, output), kExitOk);
  EXPECT_EQ(output, "C4 D4 E4\n");
  EXPECT_EQ(run("sort", {"--desc", "E4", "C4", "D4"}, output), kExitOk);
  EXPECT_EQ(output, "E4 D4 C4\n");
  EXPECT_EQ(run("sort", {"--uniq", "E4", "C4", "E4"}, output), kExitOk);
  EXPECT_EQ(output, "C4 E4\n");
}

TEST(RunCommandTest, ScaleLookups) {
  std::string output;
  EXPECT_EQ(run("steps", {"101011010101", "60", "0", "1", "7", "-1"}, output), kExitOk);
  EXPECT_EQ(output, "60 62 72 59\n");

  // "101" is MIDI 101 (chroma 5), not a chroma string.
  EXPECT_EQ(run("nearest", {"101", "60", "65"}, output), kExitOk);
  EXPECT_EQ(output, "65 65\n");
}

TEST(RunCommandTest, NearestOutsideIntRangeIsMissing) {
  std::string output;
  EXPECT_EQ(run("nearest", {"0", "2147483647"}, output), kExitInvalid);
  EXPECT_EQ(output, "-\n");
  EXPECT_EQ(run("transpose-fifths", {"C4", "2147483647"}, output), kExitInvalid);
  EXPECT_EQ(output, "\n");
}

TEST(RunCommandTest, ConfigDrivesSpellingAndTuning) {
  std::string output;
  EXPECT_EQ(run("from-midi", {"61"}, output), kExitOk);
  EXPECT_EQ(output, "Db4\n");

  TonalConfig config;
  config.sharps = true;
  config.tuning = 432.0;
  EXPECT_EQ(run("from-midi", {"61"}, output, config), kExitOk);
  EXPECT_EQ(output, "C#4\n");
  EXPECT_EQ(run("midi-to-freq", {"A4"}, output, config), kExitOk);
  EXPECT_EQ(output, "432\n");
  EXPECT_EQ(run("freq-to-midi", {"432"}, output, config), kExitOk);
  EXPECT_EQ(output, "69\n");
}

}  // namespace
}  // namespace cli
}  // namespace tonal
