#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace scout {

// LOCAL: bound by a top-level def, class or assignment in the file itself.
enum class alias_kind { DIRECT, ALIASED, LOCAL };

struct import_origin {
  std::string module_path;    // empty for LOCAL
  std::string original_name;  // empty when the local name binds a module
  alias_kind alias;

  bool is_module() const { return original_name.empty(); }
  bool is_local() const { return alias == alias_kind::LOCAL; }
};

struct import_warning {
  std::size_t line_number;
  std::string text;
  std::string reason;
};

// Local name -> origin for every import statement in one file, plus the names that
// top-level definitions and assignments rebind. Later bindings of the same local name
// replace earlier ones. Unrecognized import statements are skipped and recorded as
// warnings.
class import_map {
 public:
  using symbols_t = std::map<std::string, import_origin, std::less<>>;

  // `package_module` anchors relative imports ("from .parser import X").
  static import_map build(std::string_view content, std::string_view package_module = {});

  import_origin const *find(std::string_view local_name) const;

  symbols_t const &symbols() const { return symbols_; }
  std::vector<import_warning> const &warnings() const { return warnings_; }

 private:
  symbols_t symbols_;
  std::vector<import_warning> warnings_;
};

}  // namespace scout
