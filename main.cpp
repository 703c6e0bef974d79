#include <cstdlib>
#include <exception>
#include <iostream>
#include <print>

#include "clseg/config.hpp"
#include "clseg/segmenter.hpp"

using std::cerr, std::cout;
using std::println;

int main(int argc, char** argv)
{
  const char *program = argc > 0 ? argv[0] : "clseg";

  auto parsed = clseg::parse_options(argc, argv);
  if (!parsed) {
    println(cerr, "{}", parsed.error());
    cerr << clseg::usage(program);
    return EXIT_FAILURE;
  }
  if (!*parsed) {
    cout << clseg::usage(program);
    return EXIT_SUCCESS;
  }

  const clseg::segment_config &config = **parsed;

  try {
    clseg::run(config, clseg::default_action_provider(config));
  } catch (const std::exception &e) {
    println(cerr, "Error: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
