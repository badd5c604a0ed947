#pragma once

namespace savefile::cli {

// Routes `savefile` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation (bad item, unreadable input)
//   2  => usage error (unknown command / invalid args)
//   10 => invalid options file
//   20 => no free counter (allocation exhausted)
//   30 => filesystem failure while saving
int Dispatch(int argc, char** argv);

} // namespace savefile::cli
