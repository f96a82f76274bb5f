#include <sid/expat_reader.hpp>
#include <sid/manifest.hpp>
#include <sid/naming.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace sid {

  namespace {

    const std::string manifest_ns(manifest_namespace);

    bool
    is_whitespace_only(std::string_view sv) {
      return std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    // Accepts "Shop.Orders" and "Shop::Orders"; stores the dotted form.
    std::string
    normalize_namespace(std::string_view ns) {
      std::string result;
      result.reserve(ns.size());
      for (std::size_t i = 0; i < ns.size(); ++i) {
        if (ns[i] == ':' && i + 1 < ns.size() && ns[i + 1] == ':') {
          result += '.';
          ++i;
        } else {
          result += ns[i];
        }
      }
      return result;
    }

    // Prefixes for error messages: "line 4" or "entry 2".
    std::string
    at_line(std::size_t line) {
      return "line " + std::to_string(line);
    }

    std::string
    at_entry(std::size_t index) {
      return "entry " + std::to_string(index);
    }

    access_level
    parse_access(std::string_view value, const std::string& where) {
      if (value.empty() || value == "public") return access_level::public_access;
      if (value == "internal") return access_level::internal_access;
      throw std::runtime_error("manifest " + where + ": unknown access '" +
                               std::string(value) +
                               "' (expected public or internal)");
    }

    type_category
    parse_category(std::string_view value, const std::string& where) {
      if (value.empty() || value == "value") return type_category::value_type;
      if (value == "reference") return type_category::reference_type;
      throw std::runtime_error("manifest " + where + ": unknown category '" +
                               std::string(value) +
                               "' (expected value or reference)");
    }

    void
    validate(const declaration& decl, const std::string& where) {
      if (decl.name.empty())
        throw std::runtime_error("manifest " + where +
                                 ": strong-id requires a name");
      if (!is_valid_identifier(decl.name))
        throw std::runtime_error("manifest " + where + ": '" + decl.name +
                                 "' is not a valid type name");
      if (!is_valid_namespace_path(decl.namespace_name))
        throw std::runtime_error("manifest " + where + ": '" +
                                 decl.namespace_name +
                                 "' is not a valid namespace");
    }

    class duplicate_check {
      std::set<std::string> seen_;

    public:
      void
      add(const declaration& decl, const std::string& where) {
        auto key = fully_qualified_name(decl.namespace_name, decl.name);
        if (!seen_.insert(key).second)
          throw std::runtime_error("manifest " + where +
                                   ": duplicate declaration of " + key);
      }
    };

  } // namespace

  manifest_format
  manifest_format_for(std::string_view path) {
    constexpr std::string_view ext = ".json";
    if (path.size() < ext.size()) return manifest_format::xml;
    auto suffix = path.substr(path.size() - ext.size());
    // Case-insensitive comparison
    for (std::size_t i = 0; i < ext.size(); ++i) {
      char c = suffix[i];
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
      if (c != ext[i]) return manifest_format::xml;
    }
    return manifest_format::json;
  }

  std::vector<declaration>
  load_manifest(xml_reader& reader) {
    const xml_name root_name{manifest_ns, "strong-ids"};
    const xml_name entry_name{manifest_ns, "strong-id"};

    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() != root_name) {
      throw std::runtime_error("manifest: expected <strong-ids> root element "
                               "in namespace " +
                               manifest_ns);
    }

    std::string default_ns =
        normalize_namespace(reader.attribute_value(xml_name{"", "namespace"}));

    std::vector<declaration> result;
    duplicate_check duplicates;

    while (read_skip_ws(reader)) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.name() == root_name) {
        break;
      }

      auto where = at_line(reader.line());

      if (reader.node_type() != xml_node_type::start_element ||
          reader.name() != entry_name) {
        throw std::runtime_error("manifest " + where +
                                 ": unexpected content inside <strong-ids>");
      }

      declaration decl;
      decl.line = reader.line();
      decl.name = std::string(reader.attribute_value(xml_name{"", "name"}));
      decl.namespace_name =
          reader.has_attribute(xml_name{"", "namespace"})
              ? normalize_namespace(
                    reader.attribute_value(xml_name{"", "namespace"}))
              : default_ns;
      decl.access =
          parse_access(reader.attribute_value(xml_name{"", "access"}), where);
      decl.category = parse_category(
          reader.attribute_value(xml_name{"", "category"}), where);
      if (reader.has_attribute(xml_name{"", "backing"}))
        decl.backing_argument =
            std::string(reader.attribute_value(xml_name{"", "backing"}));

      validate(decl, where);
      duplicates.add(decl, where);
      result.push_back(std::move(decl));

      // Advance past end_element for this entry
      if (!read_skip_ws(reader) ||
          reader.node_type() != xml_node_type::end_element) {
        throw std::runtime_error("manifest " + where +
                                 ": <strong-id> must be empty");
      }
    }

    return result;
  }

  std::vector<declaration>
  load_manifest(const nlohmann::json& doc) {
    if (!doc.is_object())
      throw std::runtime_error("manifest: expected a JSON object");

    std::string default_ns;
    if (auto it = doc.find("namespace"); it != doc.end() && !it->is_null())
      default_ns = normalize_namespace(it->get<std::string>());

    auto entries = doc.find("strong-ids");
    if (entries == doc.end() || !entries->is_array())
      throw std::runtime_error("manifest: expected a \"strong-ids\" array");

    std::vector<declaration> result;
    duplicate_check duplicates;
    std::size_t index = 0;

    for (const auto& entry : *entries) {
      auto where = at_entry(++index);
      if (!entry.is_object())
        throw std::runtime_error("manifest " + where +
                                 ": expected a JSON object");

      declaration decl;
      decl.name = entry.value("name", "");
      decl.namespace_name = entry.contains("namespace")
                                ? normalize_namespace(
                                      entry["namespace"].get<std::string>())
                                : default_ns;
      decl.access = parse_access(entry.value("access", ""), where);
      decl.category = parse_category(entry.value("category", ""), where);

      // The selector is kept as raw text; extraction decides what it means.
      if (auto it = entry.find("backing"); it != entry.end() && !it->is_null())
        decl.backing_argument =
            it->is_string() ? it->get<std::string>() : it->dump();

      validate(decl, where);
      duplicates.add(decl, where);
      result.push_back(std::move(decl));
    }

    return result;
  }

  std::vector<declaration>
  parse_manifest(std::string_view content, manifest_format format) {
    if (format == manifest_format::json)
      return load_manifest(nlohmann::json::parse(content));

    expat_reader reader(content);
    return load_manifest(reader);
  }

} // namespace sid
