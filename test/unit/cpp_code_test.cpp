#include <sid/cpp_code.hpp>
#include <sid/cpp_writer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace sid;

static const cpp_writer writer;

static cpp_struct
plain_struct(std::string name) {
  cpp_struct s;
  s.name = std::move(name);
  s.generate_equality = false;
  return s;
}

TEST_CASE("empty file produces pragma once", "[cpp_writer]") {
  cpp_file file;
  file.filename = "empty.hpp";

  CHECK(writer.write(file) == "#pragma once\n");
}

TEST_CASE("banner precedes includes", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.banner = {"Generated.", "", "Do not edit."};
  file.includes.push_back({"<string>"});

  auto expected = R"(#pragma once

// Generated.
//
// Do not edit.

#include <string>
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("system includes come before local includes", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.includes.push_back({"\"local.hpp\""});
  file.includes.push_back({"<string>"});
  file.includes.push_back({"<nlohmann/json.hpp>"});

  auto expected = R"(#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "local.hpp"
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("empty struct", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {plain_struct("tag")}});

  auto expected = R"(#pragma once

namespace ns {

struct tag {};

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("struct with alias, accessor, comparisons and private field",
          "[cpp_writer]") {
  cpp_struct s;
  s.name = "id";
  s.generate_ordering = true;
  s.members.emplace_back(cpp_type_alias{"value_type", "int"});

  cpp_function value;
  value.return_type = "const value_type&";
  value.name = "value";
  value.qualifiers = "const noexcept";
  value.body = "return value_;\n";
  s.members.emplace_back(value);
  s.private_fields.push_back({"value_type", "value_", "{}"});

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {s}});

  auto expected = R"(#pragma once

namespace ns {

struct id {
  using value_type = int;

  const value_type& value() const noexcept {
    return value_;
  }

  bool operator==(const id&) const = default;
  std::strong_ordering operator<=>(const id&) const = default;

private:
  value_type value_{};
};

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("consecutive aliases are not separated", "[cpp_writer]") {
  cpp_struct s = plain_struct("traits");
  s.members.emplace_back(cpp_type_alias{"first", "int"});
  s.members.emplace_back(cpp_type_alias{"second", "long"});

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"", {s}});

  auto expected = R"(#pragma once

struct traits {
  using first = int;
  using second = long;
};
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("constructors, initializers and member templates",
          "[cpp_writer]") {
  cpp_struct s = plain_struct("w");

  cpp_function default_ctor;
  default_ctor.name = "w";
  default_ctor.is_defaulted = true;
  s.members.emplace_back(default_ctor);

  cpp_function value_ctor;
  value_ctor.name = "w";
  value_ctor.specifiers = "explicit";
  value_ctor.parameters = "int v";
  value_ctor.qualifiers = "noexcept";
  value_ctor.initializers = "v_(v)";
  s.members.emplace_back(value_ctor);

  cpp_function accepts;
  accepts.template_header = "template <typename T>";
  accepts.specifiers = "static constexpr";
  accepts.return_type = "bool";
  accepts.name = "accepts";
  accepts.qualifiers = "noexcept";
  accepts.body = "return true;\n";
  s.members.emplace_back(accepts);

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"", {s}});

  auto expected = R"(#pragma once

struct w {
  w() = default;

  explicit w(int v) noexcept : v_(v) {}

  template <typename T>
  static constexpr bool accepts() noexcept {
    return true;
  }
};
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("nested struct is indented", "[cpp_writer]") {
  cpp_struct inner = plain_struct("inner");
  cpp_function f;
  f.specifiers = "static";
  f.return_type = "void";
  f.name = "f";
  inner.members.emplace_back(f);

  cpp_struct outer = plain_struct("outer");
  outer.nested.push_back(inner);

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"", {outer}});

  auto expected = R"(#pragma once

struct outer {
  struct inner {
    static void f() {}
  };
};
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("free function is inline and body lines are re-indented",
          "[cpp_writer]") {
  cpp_function f;
  f.attributes = "[[nodiscard]]";
  f.return_type = "int";
  f.name = "pick";
  f.parameters = "bool x";
  f.body = "if (x)\n  return 1;\n\nreturn 0;\n";

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"a::b", {f}});

  auto expected = R"(#pragma once

namespace a::b {

[[nodiscard]] inline int pick(bool x) {
  if (x)
    return 1;

  return 0;
}

} // namespace a::b
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("explicit specialization at global scope", "[cpp_writer]") {
  cpp_struct h = plain_struct("std::hash<ns::id>");
  h.template_header = "template <>";

  cpp_function call;
  call.return_type = "std::size_t";
  call.name = "operator()";
  call.parameters = "const ns::id& v";
  call.qualifiers = "const noexcept";
  call.body = "return 0;\n";
  h.members.emplace_back(call);

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {plain_struct("id")}});
  file.namespaces.push_back({"", {h}});

  auto expected = R"(#pragma once

namespace ns {

struct id {};

} // namespace ns

template <>
struct std::hash<ns::id> {
  std::size_t operator()(const ns::id& v) const noexcept {
    return 0;
  }
};
)";
  CHECK(writer.write(file) == expected);
}
