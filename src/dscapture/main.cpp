#include "dscapture/cli/router.hpp"

int main(int argc, char** argv) {
  return dscapture::cli::Dispatch(argc, argv);
}
