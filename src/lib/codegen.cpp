#include <sid/codegen.hpp>

#include <set>
#include <string>
#include <utility>

namespace sid {

  backing
  backing_for(backing_kind kind) noexcept {
    switch (kind) {
    case backing_kind::opaque_id: return opaque_id_backing{};
    case backing_kind::int32: return int32_backing{};
    case backing_kind::int64: return int64_backing{};
    case backing_kind::text: return text_backing{};
    }
    return opaque_id_backing{};
  }

  codegen::codegen(codegen_options options) : options_(std::move(options)) {}

  namespace {

    // The kind-specific cells of the strong id template. Everything else
    // about the emitted type is shared by all four kinds.
    struct backing_cells {
      std::string primitive;
      std::vector<std::string> headers;
      bool has_new_id = false;
      bool rejects_empty = false;
      bool converts_from_primitive = true;
      bool pass_by_move = false;
      std::string parse_value_body;
      std::string to_string_body;
      std::string json_write_body;
      std::string json_read_body;
    };

    const char* const integer_parse_value_body = R"(auto is_space = [](char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' ||
         ch == '\f';
};
while (!text.empty() && is_space(text.front()))
  text.remove_prefix(1);
while (!text.empty() && is_space(text.back()))
  text.remove_suffix(1);
if (!text.empty() && text.front() == '+') {
  text.remove_prefix(1);
  if (!text.empty() && text.front() == '-') return false;
}
if (text.empty()) return false;
const char* last = text.data() + text.size();
auto [ptr, ec] = std::from_chars(text.data(), last, out);
return ec == std::errc{} && ptr == last;
)";

    backing_cells
    cells_for(const opaque_id_backing&, const std::string& type_name) {
      backing_cells c;
      c.primitive = "boost::uuids::uuid";
      c.headers = {"<boost/uuid/random_generator.hpp>",
                   "<boost/uuid/string_generator.hpp>",
                   "<boost/uuid/uuid.hpp>", "<boost/uuid/uuid_hash.hpp>",
                   "<boost/uuid/uuid_io.hpp>"};
      c.has_new_id = true;
      c.parse_value_body = "try {\n"
                           "  out = boost::uuids::string_generator{}(text.begin(), "
                           "text.end());\n"
                           "  return true;\n"
                           "} catch (const std::runtime_error&) {\n"
                           "  return false;\n"
                           "}\n";
      c.to_string_body = "return boost::uuids::to_string(value_);\n";
      c.json_write_body = "j = id.to_string();\n";
      c.json_read_body =
          "return " + type_name + "::parse(j.get<std::string>());\n";
      return c;
    }

    // Only integral JSON numbers inside value_type's range are accepted
    std::string
    integer_json_read_body(const std::string& type_name) {
      std::string fail = "  throw std::runtime_error(\"invalid " + type_name +
                         " format: \" + j.dump());\n";
      return "if (!j.is_number_integer())\n" + fail +
             "if (j.is_number_unsigned()) {\n"
             "  auto raw = j.get<std::uint64_t>();\n"
             "  if (raw > static_cast<std::uint64_t>(\n"
             "                std::numeric_limits<value_type>::max()))\n"
             "  " + fail +
             "  return " + type_name +
             "::from(static_cast<value_type>(raw));\n"
             "}\n"
             "auto raw = j.get<std::int64_t>();\n"
             "if (raw < std::numeric_limits<value_type>::min() ||\n"
             "    raw > std::numeric_limits<value_type>::max())\n" +
             fail + "return " + type_name +
             "::from(static_cast<value_type>(raw));\n";
    }

    backing_cells
    integer_cells(const std::string& primitive, const std::string& type_name) {
      backing_cells c;
      c.primitive = primitive;
      c.headers = {"<charconv>", "<cstdint>", "<limits>", "<system_error>"};
      c.parse_value_body = integer_parse_value_body;
      c.to_string_body = "return std::to_string(value_);\n";
      c.json_write_body = "j = id.value();\n";
      c.json_read_body = integer_json_read_body(type_name);
      return c;
    }

    backing_cells
    cells_for(const int32_backing&, const std::string& type_name) {
      return integer_cells("std::int32_t", type_name);
    }

    backing_cells
    cells_for(const int64_backing&, const std::string& type_name) {
      return integer_cells("std::int64_t", type_name);
    }

    backing_cells
    cells_for(const text_backing&, const std::string& type_name) {
      backing_cells c;
      c.primitive = "std::string";
      c.headers = {"<new>"};
      c.rejects_empty = true;
      c.converts_from_primitive = false;
      c.pass_by_move = true;
      c.to_string_body = "return value_;\n";
      c.json_write_body = "j = id.value();\n";
      c.json_read_body =
          "return " + type_name + "::from(j.get<std::string>());\n";
      return c;
    }

    const std::vector<std::string> common_headers = {
        "<compare>", "<cstddef>",     "<functional>", "<ostream>",
        "<stdexcept>", "<string>",    "<string_view>", "<type_traits>",
        "<utility>", "<nlohmann/json.hpp>",
    };

    std::string
    visibility_attribute(bool is_public) {
      return is_public ? "[[gnu::visibility(\"default\")]]"
                       : "[[gnu::visibility(\"hidden\")]]";
    }

    cpp_function
    static_function(std::string return_type, std::string name,
                    std::string parameters, std::string body,
                    std::string qualifiers = {}) {
      cpp_function f;
      f.return_type = std::move(return_type);
      f.name = std::move(name);
      f.parameters = std::move(parameters);
      f.body = std::move(body);
      f.specifiers = "static";
      f.qualifiers = std::move(qualifiers);
      return f;
    }

    cpp_function
    member_function(std::string return_type, std::string name,
                    std::string body, std::string qualifiers) {
      cpp_function f;
      f.return_type = std::move(return_type);
      f.name = std::move(name);
      f.body = std::move(body);
      f.qualifiers = std::move(qualifiers);
      return f;
    }

    void
    add_construction(cpp_struct& s, const std::string& t,
                     const backing_cells& c) {
      cpp_function default_ctor;
      default_ctor.name = t;
      default_ctor.is_defaulted = true;
      s.members.emplace_back(std::move(default_ctor));

      cpp_function value_ctor;
      value_ctor.name = t;
      value_ctor.specifiers = "explicit";
      value_ctor.parameters = "value_type value";
      value_ctor.qualifiers = "noexcept";
      value_ctor.initializers =
          c.pass_by_move ? "value_(std::move(value))" : "value_(value)";
      s.members.emplace_back(std::move(value_ctor));

      if (c.rejects_empty) {
        s.members.emplace_back(static_function(
            t, "from", "value_type value",
            "if (value.empty())\n"
            "  throw std::invalid_argument(\"" +
                t +
                " value cannot be empty\");\n"
                "return " +
                t + "(std::move(value));\n"));
        s.members.emplace_back(
            static_function(t, "from", "const char* value",
                            "if (value == nullptr)\n"
                            "  throw std::invalid_argument(\"" +
                                t +
                                " value cannot be null\");\n"
                                "return from(value_type(value));\n"));
      } else {
        s.members.emplace_back(static_function(
            t, "from", "value_type value", "return " + t + "(value);\n",
            "noexcept"));
      }

      s.members.emplace_back(
          static_function(t, "empty", "", "return " + t + "{};\n", "noexcept"));

      if (c.has_new_id) {
        s.members.emplace_back(static_function(
            t, "new_id", "",
            "thread_local boost::uuids::random_generator generator;\n"
            "return " +
                t + "(generator());\n"));
      }
    }

    void
    add_parsing(cpp_struct& s, const std::string& t, const backing_cells& c) {
      if (c.rejects_empty) {
        s.members.emplace_back(static_function(
            t, "parse", "std::string_view text",
            "return from(value_type(text));\n"));
      } else {
        s.members.emplace_back(static_function(
            t, "parse", "std::string_view text",
            "value_type value{};\n"
            "if (!parse_value(text, value))\n"
            "  throw std::runtime_error(\"invalid " +
                t +
                " format: \\\"\" + std::string(text) + \"\\\"\");\n"
                "return " +
                t + "(value);\n"));
      }

      s.members.emplace_back(static_function(
          "bool", "try_parse", "const char* text, " + t + "& result",
          "if (text == nullptr) {\n"
          "  result = empty();\n"
          "  return false;\n"
          "}\n"
          "return try_parse(std::string_view(text), result);\n",
          "noexcept"));

      if (c.rejects_empty) {
        s.members.emplace_back(static_function(
            "bool", "try_parse", "std::string_view text, " + t + "& result",
            "if (text.empty()) {\n"
            "  result = empty();\n"
            "  return false;\n"
            "}\n"
            "try {\n"
            "  result = " +
                t +
                "(value_type(text));\n"
                "} catch (const std::bad_alloc&) {\n"
                "  result = empty();\n"
                "  return false;\n"
                "}\n"
                "return true;\n",
            "noexcept"));
      } else {
        s.members.emplace_back(static_function(
            "bool", "try_parse", "std::string_view text, " + t + "& result",
            "value_type value{};\n"
            "if (!parse_value(text, value)) {\n"
            "  result = empty();\n"
            "  return false;\n"
            "}\n"
            "result = " +
                t +
                "(value);\n"
                "return true;\n",
            "noexcept"));

        s.private_members.emplace_back(static_function(
            "bool", "parse_value", "std::string_view text, value_type& out",
            c.parse_value_body, "noexcept"));
      }
    }

    void
    add_access(cpp_struct& s, const backing_cells& c) {
      s.members.emplace_back(member_function(
          "const value_type&", "value", "return value_;\n", "const noexcept"));
      s.members.emplace_back(member_function("std::string", "to_string",
                                             c.to_string_body, "const"));

      cpp_function conversion;
      conversion.name = "operator const value_type&";
      conversion.body = "return value_;\n";
      conversion.qualifiers = "const noexcept";
      s.members.emplace_back(std::move(conversion));
    }

    cpp_struct
    json_converter(const std::string& t, const std::string& attributes,
                   const backing_cells& c) {
      cpp_struct conv;
      conv.name = json_converter_name(t);
      conv.attributes = attributes;
      conv.generate_equality = false;
      conv.members.emplace_back(static_function(
          "void", "write", "nlohmann::json& j, const " + t + "& id",
          c.json_write_body));
      conv.members.emplace_back(static_function(
          t, "read", "const nlohmann::json& j", c.json_read_body));
      return conv;
    }

    cpp_struct
    type_converter(const std::string& t, const std::string& attributes,
                   const backing_cells& c) {
      cpp_struct conv;
      conv.name = type_converter_name(t);
      conv.attributes = attributes;
      conv.generate_equality = false;

      std::string accepted =
          "return std::is_convertible_v<source_type, std::string_view>";
      if (c.converts_from_primitive)
        accepted += " ||\n       std::is_same_v<source_type, value_type>";
      accepted += ";\n";

      cpp_function can_convert = static_function(
          "bool", "can_convert_from", "",
          "using source_type = std::remove_cvref_t<Source>;\n" + accepted,
          "noexcept");
      can_convert.template_header = "template <typename Source>";
      can_convert.specifiers = "static constexpr";
      conv.members.emplace_back(std::move(can_convert));

      conv.members.emplace_back(
          static_function(t, "convert_from", "std::string_view text",
                          "return " + t + "::parse(text);\n"));
      if (c.converts_from_primitive) {
        conv.members.emplace_back(static_function(
            t, "convert_from", "const value_type& value",
            "return " + t + "::from(value);\n", "noexcept"));
      }
      return conv;
    }

    std::vector<cpp_decl>
    free_functions(const std::string& t, const std::string& attributes) {
      std::vector<cpp_decl> result;

      cpp_function to_string_fn;
      to_string_fn.attributes = attributes;
      to_string_fn.return_type = "std::string";
      to_string_fn.name = "to_string";
      to_string_fn.parameters = "const " + t + "& id";
      to_string_fn.body = "return id.to_string();\n";
      result.emplace_back(std::move(to_string_fn));

      cpp_function stream_fn;
      stream_fn.attributes = attributes;
      stream_fn.return_type = "std::ostream&";
      stream_fn.name = "operator<<";
      stream_fn.parameters = "std::ostream& os, const " + t + "& id";
      stream_fn.body = "return os << id.to_string();\n";
      result.emplace_back(std::move(stream_fn));

      cpp_function to_json_fn;
      to_json_fn.attributes = attributes;
      to_json_fn.return_type = "void";
      to_json_fn.name = "to_json";
      to_json_fn.parameters = "nlohmann::json& j, const " + t + "& id";
      to_json_fn.body =
          t + "::" + json_converter_name(t) + "::write(j, id);\n";
      result.emplace_back(std::move(to_json_fn));

      cpp_function from_json_fn;
      from_json_fn.attributes = attributes;
      from_json_fn.return_type = "void";
      from_json_fn.name = "from_json";
      from_json_fn.parameters = "const nlohmann::json& j, " + t + "& id";
      from_json_fn.body =
          "id = " + t + "::" + json_converter_name(t) + "::read(j);\n";
      result.emplace_back(std::move(from_json_fn));

      return result;
    }

    cpp_struct
    hash_specialization(const std::string& qualified) {
      cpp_struct h;
      h.template_header = "template <>";
      h.name = "std::hash<" + qualified + ">";
      h.generate_equality = false;

      cpp_function call;
      call.return_type = "std::size_t";
      call.name = "operator()";
      call.parameters = "const " + qualified + "& id";
      call.qualifiers = "const noexcept";
      call.body = "return std::hash<" + qualified +
                  "::value_type>{}(id.value());\n";
      h.members.emplace_back(std::move(call));
      return h;
    }

    // Everything one descriptor contributes to a file.
    struct rendered_id {
      std::string cpp_namespace;
      std::vector<cpp_decl> declarations;
      cpp_struct hash;
      std::vector<std::string> headers;
    };

    rendered_id
    render(const descriptor& desc, const codegen_options& options) {
      const std::string& t = desc.type_name;
      backing_cells c = std::visit(
          [&t](const auto& b) { return cells_for(b, t); },
          backing_for(desc.kind));

      std::string attributes = visibility_attribute(desc.is_public);

      cpp_struct s;
      s.name = t;
      s.attributes = attributes;
      s.generate_equality = true;
      s.generate_ordering = true;
      s.members.emplace_back(cpp_type_alias{"value_type", c.primitive});

      add_construction(s, t, c);
      add_parsing(s, t, c);
      add_access(s, c);

      s.nested.push_back(json_converter(t, attributes, c));
      s.nested.push_back(type_converter(t, attributes, c));
      s.private_fields.push_back({"value_type", "value_", "{}"});

      rendered_id result;
      result.cpp_namespace = cpp_namespace_for(desc.namespace_name, options);
      result.declarations.emplace_back(std::move(s));
      for (auto& f : free_functions(t, attributes))
        result.declarations.push_back(std::move(f));

      std::string qualified =
          result.cpp_namespace.empty() ? t : result.cpp_namespace + "::" + t;
      result.hash = hash_specialization(qualified);

      result.headers = common_headers;
      result.headers.insert(result.headers.end(), c.headers.begin(),
                            c.headers.end());
      return result;
    }

    std::string
    describe(const descriptor& desc) {
      return desc.fully_qualified_name + " (" +
             std::string(to_string(desc.kind)) + ", " +
             (desc.is_public ? "public" : "internal") + ")";
    }

    // System headers sorted, nlohmann and boost after the standard ones.
    std::vector<cpp_include>
    make_includes(const std::set<std::string>& headers) {
      std::vector<cpp_include> std_headers;
      std::vector<cpp_include> library_headers;
      for (const auto& h : headers) {
        if (h.find('/') == std::string::npos)
          std_headers.push_back({h});
        else
          library_headers.push_back({h});
      }
      std_headers.insert(std_headers.end(), library_headers.begin(),
                         library_headers.end());
      return std_headers;
    }

    cpp_file
    assemble(std::string filename, std::vector<std::string> banner,
             std::vector<rendered_id> ids) {
      cpp_file file;
      file.filename = std::move(filename);
      file.banner = std::move(banner);

      std::set<std::string> headers;
      cpp_namespace hashes;

      for (auto& id : ids) {
        headers.insert(id.headers.begin(), id.headers.end());

        // Consecutive ids in the same namespace share one block
        if (file.namespaces.empty() ||
            file.namespaces.back().name != id.cpp_namespace) {
          file.namespaces.push_back({id.cpp_namespace, {}});
        }
        auto& decls = file.namespaces.back().declarations;
        for (auto& d : id.declarations)
          decls.push_back(std::move(d));

        hashes.declarations.emplace_back(std::move(id.hash));
      }

      file.includes = make_includes(headers);
      file.namespaces.push_back(std::move(hashes));
      return file;
    }

  } // namespace

  cpp_file
  codegen::generate(const descriptor& desc) const {
    std::vector<rendered_id> ids;
    ids.push_back(render(desc, options_));
    return assemble(output_filename_for(desc.fully_qualified_name),
                    {"Generated by sid from " + describe(desc) + ".",
                     "Do not edit."},
                    std::move(ids));
  }

  std::vector<cpp_file>
  codegen::generate(const std::vector<descriptor>& descs) const {
    std::vector<cpp_file> files;

    if (options_.mode == output_mode::file_per_type) {
      files.reserve(descs.size());
      for (const auto& desc : descs)
        files.push_back(generate(desc));
      return files;
    }

    if (descs.empty()) return files;

    std::vector<rendered_id> ids;
    std::vector<std::string> banner = {"Generated by sid from:"};
    for (const auto& desc : descs) {
      ids.push_back(render(desc, options_));
      banner.push_back("  " + describe(desc));
    }
    banner.push_back("Do not edit.");
    files.push_back(
        assemble(options_.header_name, std::move(banner), std::move(ids)));
    return files;
  }

} // namespace sid
