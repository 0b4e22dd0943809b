#include "commands/match.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cout << "spme_cli - supplier product matching engine\n"
            << "\n"
            << "Usage: spme_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  match   Group a product batch across suppliers and compare prices\n"
            << "\n"
            << "Run 'spme_cli match --help' for the options of a command.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "match") {
    return cmd_match(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
