#include <iostream>

#include "app.hpp"
#include "cli.hpp"

int main(int argc, char* argv[]) {
  auto command = pqlens::parse_args(argc, argv);
  if (!command.ok()) {
    std::cerr << "pqlens: error: " << command.status().message() << "\n";
    std::cerr << "Use --help for usage information\n";
    return pqlens::kUsageExitCode;
  }

  switch (command->action) {
    case pqlens::CliAction::Help:
      std::cout << pqlens::usage();
      return 0;
    case pqlens::CliAction::Version:
      std::cout << "pqlens " << pqlens::kVersion << "\n";
      return 0;
    case pqlens::CliAction::Run:
      break;
  }

  pqlens::Application app(command->config);
  return app.run(std::cout, std::cerr);
}
