#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CLI { class App; }

namespace scout {

class cmd_discover : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_discover> {
    std::filesystem::path package_root;
    std::string package_name;
    std::optional<std::filesystem::path> config_path;
    std::vector<std::string> metadata;  // key=value
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_discover(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// "version=1.2" -> {"version", "1.2"}. Throws std::runtime_error without '=' or key.
std::vector<std::pair<std::string, std::string>> cmd_discover_parse_metadata(
    std::vector<std::string> const &items);

}  // namespace scout
