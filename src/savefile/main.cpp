#include "savefile/cli/router.hpp"

int main(int argc, char** argv) {
  return savefile::cli::Dispatch(argc, argv);
}
