#pragma once

#include <string>
#include <variant>
#include <vector>

namespace sid {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_field {
    std::string type;
    std::string name;
    std::string default_value;

    bool
    operator==(const cpp_field&) const = default;
  };

  struct cpp_type_alias {
    std::string name;
    std::string target;

    bool
    operator==(const cpp_type_alias&) const = default;
  };

  // A free function, member function, constructor (empty return_type) or
  // conversion operator (empty return_type, name "operator T").
  struct cpp_function {
    std::string template_header;
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string body;
    std::string attributes;
    std::string specifiers;
    std::string qualifiers;
    std::string initializers;
    bool is_inline = true;
    bool is_defaulted = false;

    bool
    operator==(const cpp_function&) const = default;
  };

  using cpp_member = std::variant<cpp_type_alias, cpp_function>;

  struct cpp_struct {
    std::string name;
    std::string attributes;
    std::string template_header;
    std::vector<cpp_member> members;
    std::vector<cpp_struct> nested;
    std::vector<cpp_field> fields;
    std::vector<cpp_member> private_members;
    std::vector<cpp_field> private_fields;
    bool generate_equality = true;
    bool generate_ordering = false;

    bool
    operator==(const cpp_struct&) const = default;
  };

  using cpp_decl = std::variant<cpp_struct, cpp_type_alias, cpp_function>;

  // An empty name renders the declarations at global scope.
  struct cpp_namespace {
    std::string name;
    std::vector<cpp_decl> declarations;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  struct cpp_file {
    std::string filename;
    std::vector<std::string> banner;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;

    bool
    operator==(const cpp_file&) const = default;
  };

} // namespace sid
