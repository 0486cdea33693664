#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace scout {

// Oracle check: does a static manifest agree with a recorded dynamic one?
class cmd_compare : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_compare> {
    std::filesystem::path static_path;
    std::filesystem::path dynamic_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_compare(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace scout
