#include "cmd_fingerprint.h"

#include "blake3_util.h"
#include "tui.h"
#include "util.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>

namespace scout {

void cmd_fingerprint::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("fingerprint",
                                "Print the BLAKE3 content fingerprint of a file") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("file", cfg_ptr->file_path, "File to fingerprint")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_fingerprint::cmd_fingerprint(cmd_fingerprint::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_fingerprint::execute() {
  if (!std::filesystem::exists(cfg_.file_path)) {
    throw std::runtime_error("fingerprint: file does not exist: " + cfg_.file_path.string());
  }
  if (std::filesystem::is_directory(cfg_.file_path)) {
    throw std::runtime_error("fingerprint: path is a directory: " + cfg_.file_path.string());
  }

  tui::print_stdout("%s\n", blake3_fingerprint(util_load_text(cfg_.file_path)).c_str());
  return true;
}

}  // namespace scout
