#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "docqa_cli/cli_handler.hpp"
#include "docqa_cli/config.hpp"

namespace {

Config load_config() {
  const char *config_path = std::getenv("DOCQA_CONFIG");
  if (config_path && *config_path) {
    return Config::from_file(config_path);
  }
  if (std::filesystem::exists("docqarc.json")) {
    return Config::from_file("docqarc.json");
  }
  return Config::from_json(nlohmann::json::object());
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    docqa_cli::CliOptions options = docqa_cli::CliHandler::parse_arguments(argc, argv);

    docqa_cli::CliHandler handler(load_config());
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
