#include <sid/extract.hpp>
#include <sid/naming.hpp>

namespace sid {

  std::optional<descriptor>
  extract(const declaration& decl) {
    if (decl.category == type_category::reference_type) return std::nullopt;

    std::optional<std::int64_t> selector;
    if (decl.backing_argument)
      selector = resolve_backing_selector(*decl.backing_argument);

    descriptor result;
    result.namespace_name = decl.namespace_name;
    result.type_name = decl.name;
    result.fully_qualified_name =
        fully_qualified_name(decl.namespace_name, decl.name);
    result.kind = backing_kind_from_selector(selector);
    result.is_public = decl.access == access_level::public_access;
    return result;
  }

  std::vector<descriptor>
  extract_all(const std::vector<declaration>& decls) {
    std::vector<descriptor> result;
    result.reserve(decls.size());
    for (const auto& decl : decls) {
      if (auto d = extract(decl)) result.push_back(std::move(*d));
    }
    return result;
  }

} // namespace sid
