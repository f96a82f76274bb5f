#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace sid {

  enum class output_mode { header_only, file_per_type };

  struct codegen_options {
    // Declared (dotted) namespace -> C++ namespace
    std::unordered_map<std::string, std::string> namespace_map;
    output_mode mode = output_mode::file_per_type;
    std::string header_name = "strong_ids.g.hpp";
  };

  bool
  is_cpp_keyword(std::string_view name);

  bool
  is_valid_identifier(std::string_view name);

  // Empty (global scope) or dot-separated identifiers.
  bool
  is_valid_namespace_path(std::string_view path);

  std::string
  fully_qualified_name(std::string_view namespace_name,
                       std::string_view type_name);

  std::string
  cpp_namespace_for(const std::string& namespace_name,
                    const codegen_options& opts);

  std::string
  output_filename_for(std::string_view fully_qualified_name);

  std::string
  json_converter_name(std::string_view type_name);

  std::string
  type_converter_name(std::string_view type_name);

} // namespace sid
