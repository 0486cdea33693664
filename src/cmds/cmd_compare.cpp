#include "cmd_compare.h"

#include "manifest.h"
#include "tui.h"
#include "util.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace scout {

void cmd_compare::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("compare",
                                "Compare a static manifest against a dynamic one") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("static", cfg_ptr->static_path, "Manifest JSON from static discovery")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("dynamic", cfg_ptr->dynamic_path, "Manifest JSON from dynamic discovery")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_compare::cmd_compare(cmd_compare::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_compare::execute() {
  auto const diff{ manifest_compare(util_load_text(cfg_.static_path),
                                    util_load_text(cfg_.dynamic_path)) };
  if (diff) {
    tui::error("%s", diff->describe().c_str());
    return false;
  }

  tui::info("manifests match");
  return true;
}

}  // namespace scout
