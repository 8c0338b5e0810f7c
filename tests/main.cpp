#define DOCTEST_CONFIG_IMPLEMENT
#include <cstdlib>
#include <doctest/doctest.h>
#include <string>
#include <trellis/common.hpp>

int main(int argc, char **argv) {
  // Quiet library logging unless VERBOSE=1 is set
  const char *verbose = std::getenv("VERBOSE");
  if (!verbose || std::string(verbose) != "1") {
    trellis::log::set_level(trellis::log::Level::Off);
  } else {
    trellis::log::set_level(trellis::log::Level::Debug);
  }

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  return context.run();
}
