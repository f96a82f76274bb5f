#pragma once

#include <sid/backing_kind.hpp>
#include <sid/cpp_code.hpp>
#include <sid/descriptor.hpp>
#include <sid/naming.hpp>

#include <variant>
#include <vector>

namespace sid {

  struct opaque_id_backing {};
  struct int32_backing {};
  struct int64_backing {};
  struct text_backing {};

  // One alternative per backing kind; the set is closed.
  using backing = std::variant<opaque_id_backing, int32_backing, int64_backing,
                               text_backing>;

  backing
  backing_for(backing_kind kind) noexcept;

  class codegen {
    codegen_options options_;

  public:
    explicit codegen(codegen_options options = {});

    cpp_file
    generate(const descriptor& desc) const;

    // One file per descriptor, or a single combined file in header_only
    // mode.
    std::vector<cpp_file>
    generate(const std::vector<descriptor>& descs) const;
  };

} // namespace sid
