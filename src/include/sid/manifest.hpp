#pragma once

#include <sid/declaration.hpp>
#include <sid/xml_reader.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string_view>
#include <vector>

namespace sid {

  inline constexpr std::string_view manifest_namespace =
      "http://sid.dev/manifest";

  enum class manifest_format { xml, json };

  // ".json" selects JSON; anything else is read as XML.
  manifest_format
  manifest_format_for(std::string_view path);

  std::vector<declaration>
  load_manifest(xml_reader& reader);

  std::vector<declaration>
  load_manifest(const nlohmann::json& doc);

  std::vector<declaration>
  parse_manifest(std::string_view content, manifest_format format);

} // namespace sid
