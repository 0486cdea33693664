#include "test_support.h"

#include <atomic>
#include <string>
#include <system_error>

#include <unistd.h>

namespace scout::test {

namespace { std::atomic<int> temp_dir_counter_{ 0 }; }

scoped_temp_dir::scoped_temp_dir(std::string_view tag) {
  auto const id{ temp_dir_counter_.fetch_add(1, std::memory_order_relaxed) };
  path_ = std::filesystem::temp_directory_path() /
          ("scout-test-" + std::string{ tag } + "-" + std::to_string(::getpid()) + "-" +
           std::to_string(id));
  std::filesystem::remove_all(path_);
  std::filesystem::create_directories(path_);
}

scoped_temp_dir::~scoped_temp_dir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path scoped_temp_dir::write(std::filesystem::path const &relative,
                                             std::string_view content) const {
  auto const full{ path_ / relative };
  std::filesystem::create_directories(full.parent_path());
  util_write_file(full, content);
  return full;
}

}  // namespace scout::test
