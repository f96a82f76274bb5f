#include <sid/extract.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace sid;

static declaration
make_decl(std::string ns, std::string name,
          std::optional<std::string> backing = std::nullopt) {
  declaration d;
  d.namespace_name = std::move(ns);
  d.name = std::move(name);
  d.backing_argument = std::move(backing);
  return d;
}

TEST_CASE("value type with no argument extracts as public opaque_id",
          "[extract]") {
  auto d = extract(make_decl("Shop", "OrderId"));
  REQUIRE(d.has_value());
  CHECK(d->namespace_name == "Shop");
  CHECK(d->type_name == "OrderId");
  CHECK(d->fully_qualified_name == "Shop.OrderId");
  CHECK(d->kind == backing_kind::opaque_id);
  CHECK(d->is_public);
}

TEST_CASE("backing argument selects the kind", "[extract]") {
  CHECK(extract(make_decl("Shop", "A", "1"))->kind == backing_kind::int32);
  CHECK(extract(make_decl("Shop", "B", "Int64"))->kind == backing_kind::int64);
  CHECK(extract(make_decl("Shop", "C", "3"))->kind == backing_kind::text);
}

TEST_CASE("out-of-range and unknown arguments normalize to opaque_id",
          "[extract]") {
  CHECK(extract(make_decl("Shop", "A", "4"))->kind == backing_kind::opaque_id);
  CHECK(extract(make_decl("Shop", "B", "-1"))->kind ==
        backing_kind::opaque_id);
  CHECK(extract(make_decl("Shop", "C", "decimal"))->kind ==
        backing_kind::opaque_id);
}

TEST_CASE("internal access clears is_public", "[extract]") {
  auto decl = make_decl("Shop", "LineNumber", "Int32");
  decl.access = access_level::internal_access;

  auto d = extract(decl);
  REQUIRE(d.has_value());
  CHECK_FALSE(d->is_public);
}

TEST_CASE("reference types are not applicable", "[extract]") {
  auto decl = make_decl("Shop", "Customer");
  decl.category = type_category::reference_type;

  CHECK_FALSE(extract(decl).has_value());
}

TEST_CASE("global namespace keeps the bare name", "[extract]") {
  auto d = extract(make_decl("", "OrderId"));
  REQUIRE(d.has_value());
  CHECK(d->namespace_name.empty());
  CHECK(d->fully_qualified_name == "OrderId");
}

TEST_CASE("extract_all keeps applicable declarations in order",
          "[extract]") {
  auto reference = make_decl("Shop", "Customer");
  reference.category = type_category::reference_type;

  auto result = extract_all({make_decl("Shop", "OrderId"), reference,
                             make_decl("Shop", "Slug", "Text")});
  REQUIRE(result.size() == 2);
  CHECK(result[0].type_name == "OrderId");
  CHECK(result[1].type_name == "Slug");
  CHECK(result[1].kind == backing_kind::text);
}

TEST_CASE("extraction is deterministic", "[extract]") {
  auto decl = make_decl("Shop.Orders", "OrderId", "2");
  CHECK(extract(decl) == extract(decl));
}
