#pragma once

#include <sid/backing_kind.hpp>

#include <string>

namespace sid {

  struct descriptor {
    std::string namespace_name;
    std::string type_name;
    std::string fully_qualified_name;
    backing_kind kind = default_backing_kind;
    bool is_public = true;

    bool
    operator==(const descriptor&) const = default;
  };

} // namespace sid
