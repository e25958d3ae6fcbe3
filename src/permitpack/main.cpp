#include "permitpack/cli/router.hpp"

int main(int argc, char** argv) {
  return permitpack::cli::Dispatch(argc, argv);
}
