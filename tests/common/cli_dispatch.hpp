#ifndef SAVEFILE_TESTS_COMMON_CLI_DISPATCH_HPP_
#define SAVEFILE_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "savefile/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace savefile::tests::common {

// argv[0] is supplied here; pass only the subcommand and its arguments.
inline int DispatchArgs(const std::vector<std::string>& args) {
  std::vector<std::string> argv_storage;
  argv_storage.reserve(args.size() + 1U);
  argv_storage.emplace_back("savefile");
  argv_storage.insert(argv_storage.end(), args.begin(), args.end());

  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  return savefile::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Same as DispatchArgs, with stdout and stderr (log lines included) captured.
inline int DispatchWithCapturedOutput(const std::vector<std::string>& args,
                                      std::string& stdout_text, std::string& stderr_text) {
  std::ostringstream captured_stdout;
  std::ostringstream captured_stderr;
  std::streambuf* original_stdout = std::cout.rdbuf(captured_stdout.rdbuf());
  std::streambuf* original_stderr = std::cerr.rdbuf(captured_stderr.rdbuf());
  const int exit_code = DispatchArgs(args);
  std::cout.rdbuf(original_stdout);
  std::cerr.rdbuf(original_stderr);

  stdout_text = captured_stdout.str();
  stderr_text = captured_stderr.str();
  return exit_code;
}

} // namespace savefile::tests::common

#endif // SAVEFILE_TESTS_COMMON_CLI_DISPATCH_HPP_
