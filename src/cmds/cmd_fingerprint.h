#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace scout {

class cmd_fingerprint : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_fingerprint> {
    std::filesystem::path file_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_fingerprint(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace scout
