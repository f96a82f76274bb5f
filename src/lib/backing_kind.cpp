#include <sid/backing_kind.hpp>

#include <charconv>
#include <string>
#include <system_error>

namespace sid {

  namespace {

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
             c == '\f';
    }

    std::string_view
    trim(std::string_view sv) {
      while (!sv.empty() && is_space(sv.front()))
        sv.remove_prefix(1);
      while (!sv.empty() && is_space(sv.back()))
        sv.remove_suffix(1);
      return sv;
    }

    // Lowercase and drop '-' and '_' so "OpaqueId", "opaque-id" and
    // "opaque_id" compare equal.
    std::string
    fold_name(std::string_view name) {
      std::string result;
      result.reserve(name.size());
      for (char c : name) {
        if (c == '-' || c == '_') continue;
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        result += c;
      }
      return result;
    }

    std::string_view
    strip_qualifier(std::string_view name) {
      if (auto pos = name.rfind("::"); pos != std::string_view::npos)
        return name.substr(pos + 2);
      if (auto pos = name.rfind('.'); pos != std::string_view::npos)
        return name.substr(pos + 1);
      return name;
    }

    struct enumerant {
      std::string_view folded_name;
      backing_kind kind;
    };

    constexpr enumerant enumerants[] = {
        {"opaqueid", backing_kind::opaque_id},
        {"guid", backing_kind::opaque_id},
        {"uuid", backing_kind::opaque_id},
        {"int32", backing_kind::int32},
        {"int", backing_kind::int32},
        {"int64", backing_kind::int64},
        {"long", backing_kind::int64},
        {"text", backing_kind::text},
        {"string", backing_kind::text},
    };

  } // namespace

  backing_kind
  backing_kind_from_selector(std::optional<std::int64_t> selector) noexcept {
    if (!selector) return default_backing_kind;
    switch (*selector) {
    case 0: return backing_kind::opaque_id;
    case 1: return backing_kind::int32;
    case 2: return backing_kind::int64;
    case 3: return backing_kind::text;
    default: return default_backing_kind;
    }
  }

  std::optional<std::int64_t>
  resolve_backing_selector(std::string_view argument) {
    auto text = trim(argument);
    if (text.empty()) return std::nullopt;

    // Integer selector
    auto first = text.data();
    auto last = text.data() + text.size();
    if (*first == '+') ++first;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc{} && ptr == last) return value;
    if (ec == std::errc::result_out_of_range) return std::nullopt;

    auto folded = fold_name(strip_qualifier(text));
    for (const auto& e : enumerants) {
      if (e.folded_name == folded) return static_cast<std::int64_t>(e.kind);
    }
    return std::nullopt;
  }

  std::string_view
  to_string(backing_kind kind) noexcept {
    switch (kind) {
    case backing_kind::opaque_id: return "opaque-id";
    case backing_kind::int32: return "int32";
    case backing_kind::int64: return "int64";
    case backing_kind::text: return "text";
    }
    return "opaque-id";
  }

} // namespace sid
