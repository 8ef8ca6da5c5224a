#include <csignal>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/controller.hpp"

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "obs-remote";

  obs_remote::core::CommandLine command_line{};
  try {
    command_line = obs_remote::core::parse_command_line(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << obs_remote::core::usage(program) << "config error: " << ex.what() << '\n';
    return 1;
  }

  if (command_line.help_requested) {
    std::cout << obs_remote::core::usage(program);
    return 0;
  }

  // Launched applications are never waited on; let the kernel reap them.
  std::signal(SIGCHLD, SIG_IGN);

  std::cerr << obs_remote::core::format_config_settings(command_line.config) << '\n';

  obs_remote::core::Controller controller{command_line.config};
  return controller.run();
}
