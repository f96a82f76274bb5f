#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace sid {

  enum class access_level { public_access, internal_access };

  enum class type_category { value_type, reference_type };

  // One marked declaration as the input boundary reports it, before
  // normalization. backing_argument is the marker's raw argument text.
  struct declaration {
    std::string name;
    std::string namespace_name;
    access_level access = access_level::public_access;
    type_category category = type_category::value_type;
    std::optional<std::string> backing_argument;
    std::size_t line = 0;

    bool
    operator==(const declaration&) const = default;
  };

} // namespace sid
