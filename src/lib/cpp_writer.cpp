#include <sid/cpp_writer.hpp>

#include <functional>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace sid {

  namespace {

    void
    write_indent(std::ostream& os, int indent) {
      for (int i = 0; i < indent; ++i)
        os << "  ";
    }

    // Bodies are stored unindented; each non-empty line is shifted to the
    // enclosing scope's depth.
    void
    write_body(std::ostream& os, std::string_view body, int indent) {
      while (!body.empty()) {
        auto eol = body.find('\n');
        auto line = body.substr(0, eol);
        if (!line.empty()) {
          write_indent(os, indent);
          os << line;
        }
        os << '\n';
        if (eol == std::string_view::npos) break;
        body.remove_prefix(eol + 1);
      }
    }

    void
    write_includes(std::ostream& os, const std::vector<cpp_include>& includes) {
      if (includes.empty()) return;

      // Partition into system (<...>) and local ("...") includes
      std::vector<const cpp_include*> system_includes;
      std::vector<const cpp_include*> local_includes;

      for (const auto& inc : includes) {
        if (!inc.path.empty() && inc.path.front() == '<')
          system_includes.push_back(&inc);
        else
          local_includes.push_back(&inc);
      }

      os << '\n';

      for (const auto* inc : system_includes)
        os << "#include " << inc->path << '\n';

      if (!system_includes.empty() && !local_includes.empty()) os << '\n';

      for (const auto* inc : local_includes)
        os << "#include " << inc->path << '\n';
    }

    void
    write_banner(std::ostream& os, const std::vector<std::string>& banner) {
      if (banner.empty()) return;
      os << '\n';
      for (const auto& line : banner) {
        if (line.empty())
          os << "//\n";
        else
          os << "// " << line << '\n';
      }
    }

    void
    write_field(std::ostream& os, const cpp_field& field, int indent) {
      write_indent(os, indent);
      os << field.type << ' ' << field.name;
      if (!field.default_value.empty()) {
        if (field.default_value.front() == '{')
          os << field.default_value;
        else
          os << " = " << field.default_value;
      }
      os << ";\n";
    }

    void
    write_type_alias(std::ostream& os, const cpp_type_alias& a, int indent) {
      write_indent(os, indent);
      os << "using " << a.name << " = " << a.target << ";\n";
    }

    void
    write_function(std::ostream& os, const cpp_function& f, int indent,
                   bool at_namespace_scope) {
      if (!f.template_header.empty()) {
        write_indent(os, indent);
        os << f.template_header << '\n';
      }
      write_indent(os, indent);
      if (!f.attributes.empty()) os << f.attributes << ' ';
      if (at_namespace_scope && f.is_inline) os << "inline ";
      if (!f.specifiers.empty()) os << f.specifiers << ' ';
      if (!f.return_type.empty()) os << f.return_type << ' ';
      os << f.name << '(' << f.parameters << ')';
      if (!f.qualifiers.empty()) os << ' ' << f.qualifiers;
      if (!f.initializers.empty()) os << " : " << f.initializers;

      if (f.is_defaulted) {
        os << " = default;\n";
        return;
      }

      if (f.body.empty()) {
        os << " {}\n";
        return;
      }

      os << " {\n";
      write_body(os, f.body, indent + 1);
      write_indent(os, indent);
      os << "}\n";
    }

    bool
    is_empty_struct(const cpp_struct& s) {
      return s.members.empty() && s.nested.empty() && s.fields.empty() &&
             s.private_members.empty() && s.private_fields.empty() &&
             !s.generate_equality && !s.generate_ordering;
    }

    void
    write_members(std::ostream& os, const std::vector<cpp_member>& members,
                  int indent, const std::function<void(bool)>& separate) {
      for (const auto& member : members) {
        std::visit(
            [&](const auto& m) {
              using T = std::decay_t<decltype(m)>;
              if constexpr (std::is_same_v<T, cpp_type_alias>) {
                separate(true);
                write_type_alias(os, m, indent);
              } else {
                separate(false);
                write_function(os, m, indent, false);
              }
            },
            member);
      }
    }

    void
    write_struct(std::ostream& os, const cpp_struct& s, int indent) {
      if (!s.template_header.empty()) {
        write_indent(os, indent);
        os << s.template_header << '\n';
      }

      write_indent(os, indent);
      os << "struct ";
      if (!s.attributes.empty()) os << s.attributes << ' ';
      os << s.name;

      if (is_empty_struct(s)) {
        os << " {};\n";
        return;
      }

      os << " {\n";

      // Blank line between sections and between functions; consecutive
      // aliases stay grouped.
      bool first = true;
      bool previous_was_alias = false;
      std::function<void(bool)> separate = [&](bool is_alias) {
        if (!first && !(is_alias && previous_was_alias)) os << '\n';
        first = false;
        previous_was_alias = is_alias;
      };

      write_members(os, s.members, indent + 1, separate);

      if (s.generate_equality) {
        separate(false);
        write_indent(os, indent + 1);
        os << "bool operator==(const " << s.name << "&) const = default;\n";
      }

      if (s.generate_ordering) {
        if (!s.generate_equality) separate(false);
        write_indent(os, indent + 1);
        os << "std::strong_ordering operator<=>(const " << s.name
           << "&) const = default;\n";
      }

      for (const auto& n : s.nested) {
        separate(false);
        write_struct(os, n, indent + 1);
      }

      if (!s.fields.empty()) {
        separate(false);
        for (const auto& f : s.fields)
          write_field(os, f, indent + 1);
      }

      if (!s.private_members.empty() || !s.private_fields.empty()) {
        if (!first) os << '\n';
        write_indent(os, indent);
        os << "private:\n";
        first = true;
        write_members(os, s.private_members, indent + 1, separate);
        if (!s.private_fields.empty()) {
          separate(false);
          for (const auto& f : s.private_fields)
            write_field(os, f, indent + 1);
        }
      }

      write_indent(os, indent);
      os << "};\n";
    }

    void
    write_decl(std::ostream& os, const cpp_decl& decl) {
      std::visit(
          [&os](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, cpp_struct>) {
              write_struct(os, d, 0);
            } else if constexpr (std::is_same_v<T, cpp_type_alias>) {
              write_type_alias(os, d, 0);
            } else if constexpr (std::is_same_v<T, cpp_function>) {
              write_function(os, d, 0, true);
            }
          },
          decl);
    }

    void
    write_namespace(std::ostream& os, const cpp_namespace& ns) {
      if (ns.name.empty()) {
        for (const auto& decl : ns.declarations) {
          os << '\n';
          write_decl(os, decl);
        }
        return;
      }

      os << "\nnamespace " << ns.name << " {\n";
      for (const auto& decl : ns.declarations) {
        os << '\n';
        write_decl(os, decl);
      }
      os << "\n} // namespace " << ns.name << '\n';
    }

  } // namespace

  std::string
  cpp_writer::write(const cpp_file& file) const {
    std::ostringstream os;
    os << "#pragma once\n";
    write_banner(os, file.banner);
    write_includes(os, file.includes);
    for (const auto& ns : file.namespaces)
      write_namespace(os, ns);
    return os.str();
  }

} // namespace sid
