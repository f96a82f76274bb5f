#pragma once

#include <sid/declaration.hpp>
#include <sid/descriptor.hpp>

#include <optional>
#include <vector>

namespace sid {

  // Reference types are not applicable and produce no descriptor.
  std::optional<descriptor>
  extract(const declaration& decl);

  std::vector<descriptor>
  extract_all(const std::vector<declaration>& decls);

} // namespace sid
