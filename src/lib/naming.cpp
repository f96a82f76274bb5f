#include <sid/naming.hpp>

#include <unordered_set>

namespace sid {

  namespace {

    bool
    is_alpha(char c) {
      return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    const std::unordered_set<std::string_view>&
    cpp_keywords() {
      static const std::unordered_set<std::string_view> keywords = {
          "alignas",       "alignof",     "and",
          "and_eq",        "asm",         "auto",
          "bitand",        "bitor",       "bool",
          "break",         "case",        "catch",
          "char",          "char8_t",     "char16_t",
          "char32_t",      "class",       "compl",
          "concept",       "const",       "consteval",
          "constexpr",     "constinit",   "const_cast",
          "continue",      "co_await",    "co_return",
          "co_yield",      "decltype",    "default",
          "delete",        "do",          "double",
          "dynamic_cast",  "else",        "enum",
          "explicit",      "export",      "extern",
          "false",         "float",       "for",
          "friend",        "goto",        "if",
          "inline",        "int",         "long",
          "mutable",       "namespace",   "new",
          "noexcept",      "not",         "not_eq",
          "nullptr",       "operator",    "or",
          "or_eq",         "private",     "protected",
          "public",        "register",    "reinterpret_cast",
          "requires",      "return",      "short",
          "signed",        "sizeof",      "static",
          "static_assert", "static_cast", "struct",
          "switch",        "template",    "this",
          "thread_local",  "throw",       "true",
          "try",           "typedef",     "typeid",
          "typename",      "union",       "unsigned",
          "using",         "virtual",     "void",
          "volatile",      "wchar_t",     "while",
          "xor",           "xor_eq",
      };
      return keywords;
    }

  } // namespace

  bool
  is_cpp_keyword(std::string_view name) {
    return cpp_keywords().count(name) != 0;
  }

  bool
  is_valid_identifier(std::string_view name) {
    if (name.empty()) return false;
    if (!is_alpha(name.front()) && name.front() != '_') return false;
    for (char c : name) {
      if (!is_alpha(c) && !is_digit(c) && c != '_') return false;
    }
    return !is_cpp_keyword(name);
  }

  bool
  is_valid_namespace_path(std::string_view path) {
    if (path.empty()) return true;

    while (true) {
      auto dot = path.find('.');
      if (!is_valid_identifier(path.substr(0, dot))) return false;
      if (dot == std::string_view::npos) return true;
      path.remove_prefix(dot + 1);
    }
  }

  std::string
  fully_qualified_name(std::string_view namespace_name,
                       std::string_view type_name) {
    std::string result;
    if (!namespace_name.empty()) {
      result += namespace_name;
      result += '.';
    }
    result += type_name;
    return result;
  }

  std::string
  cpp_namespace_for(const std::string& namespace_name,
                    const codegen_options& opts) {
    if (namespace_name.empty()) return {};

    // Check explicit mapping first
    auto it = opts.namespace_map.find(namespace_name);
    if (it != opts.namespace_map.end()) return it->second;

    std::string result;
    result.reserve(namespace_name.size() + 4);
    for (char c : namespace_name) {
      if (c == '.')
        result += "::";
      else
        result += c;
    }
    return result;
  }

  std::string
  output_filename_for(std::string_view fully_qualified_name) {
    std::string result(fully_qualified_name);
    result += ".g.hpp";
    return result;
  }

  std::string
  json_converter_name(std::string_view type_name) {
    return std::string(type_name) + "JsonConverter";
  }

  std::string
  type_converter_name(std::string_view type_name) {
    return std::string(type_name) + "TypeConverter";
  }

} // namespace sid
