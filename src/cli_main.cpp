/// @file
/// @brief CLI entry point for the tonal note/interval toolkit.

#include <cstdio>
#include <string>

#include "cli/cli.h"

int main(int argc, char* argv[]) {
  tonal::cli::CliOptions opts;
  int exit_code = 0;
  if (!tonal::cli::parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  tonal::TonalConfig config;
  if (!tonal::cli::buildConfig(opts, config)) {
    return tonal::cli::kExitInvalid;
  }

  std::string output;
  exit_code = tonal::cli::runCommand(opts, config, output);
  std::fputs(output.c_str(), stdout);
  return exit_code;
}
