#include "cmd_discover.h"

#include "discovery.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>
#include <variant>

namespace scout {

void cmd_discover::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("discover",
                                "Print the plugin manifest of an installed package") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("package_root", cfg_ptr->package_root, "Installed package directory")
      ->required();
  sub->add_option("package_name", cfg_ptr->package_name, "Distribution name (e.g. r2x-reeds)")
      ->required();
  sub->add_option("--config", cfg_ptr->config_path, "Discovery options JSON file")
      ->check(CLI::ExistingFile);
  sub->add_option("--metadata", cfg_ptr->metadata, "Package metadata entry (key=value)")
      ->allow_extra_args(false);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

std::vector<std::pair<std::string, std::string>> cmd_discover_parse_metadata(
    std::vector<std::string> const &items) {
  std::vector<std::pair<std::string, std::string>> metadata;
  for (auto const &item : items) {
    auto const eq{ item.find('=') };
    if (eq == std::string::npos || eq == 0) {
      throw std::runtime_error("discover: metadata must be key=value: " + item);
    }
    metadata.emplace_back(item.substr(0, eq), item.substr(eq + 1));
  }
  return metadata;
}

cmd_discover::cmd_discover(cmd_discover::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_discover::execute() {
  discovery_options options;
  if (cfg_.config_path) {
    options = discovery_options_load(*cfg_.config_path);
  } else {
    discovery_options_apply_env(options);
  }

  if (!options.static_discovery) {
    tui::error("%s: static discovery is disabled and no dynamic path is available",
               cfg_.package_name.c_str());
    return false;
  }

  auto const result{ discover_package({ .package_root = cfg_.package_root,
                                        .package_name = cfg_.package_name,
                                        .metadata = cmd_discover_parse_metadata(cfg_.metadata) },
                                      options) };

  return std::visit(match{
                        [](package const &pkg) {
                          tui::print_stdout("%s\n", manifest_to_json(pkg).c_str());
                          return true;
                        },
                        [this](discovery_failure const &failure) {
                          tui::error("%s: %s",
                                     cfg_.package_name.c_str(),
                                     failure.describe().c_str());
                          return false;
                        },
                    },
                    result);
}

}  // namespace scout
