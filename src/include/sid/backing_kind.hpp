#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sid {

  // Selector values are fixed: they are what a manifest or marker argument
  // carries as an integer.
  enum class backing_kind : std::int64_t {
    opaque_id = 0,
    int32 = 1,
    int64 = 2,
    text = 3,
  };

  inline constexpr backing_kind default_backing_kind = backing_kind::opaque_id;

  // Absent or out-of-range selectors fall back to opaque_id.
  backing_kind
  backing_kind_from_selector(std::optional<std::int64_t> selector) noexcept;

  // Resolves a raw marker argument (a decimal selector or an enumerant name)
  // to its integer selector. Returns nullopt when the text names nothing.
  std::optional<std::int64_t>
  resolve_backing_selector(std::string_view argument);

  std::string_view
  to_string(backing_kind kind) noexcept;

} // namespace sid
