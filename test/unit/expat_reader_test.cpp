#include <sid/expat_reader.hpp>
#include <sid/xml_reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace sid;

TEST_CASE("reader: empty element", "[expat_reader]") {
  expat_reader reader("<root/>");

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::start_element);
  CHECK(reader.name() == xml_name{"", "root"});
  CHECK(reader.depth() == 1);

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::end_element);
  CHECK(reader.name() == xml_name{"", "root"});

  CHECK_FALSE(reader.read());
}

TEST_CASE("reader: default namespace applies to elements", "[expat_reader]") {
  expat_reader reader(
      R"(<strong-ids xmlns="http://sid.dev/manifest"><strong-id/></strong-ids>)");

  REQUIRE(reader.read());
  CHECK(reader.name() == xml_name{"http://sid.dev/manifest", "strong-ids"});

  REQUIRE(reader.read());
  CHECK(reader.name() == xml_name{"http://sid.dev/manifest", "strong-id"});
  CHECK(reader.depth() == 2);
}

TEST_CASE("reader: unprefixed attributes have no namespace",
          "[expat_reader]") {
  expat_reader reader(
      R"(<e xmlns="http://sid.dev/manifest" name="OrderId" backing="1"/>)");

  REQUIRE(reader.read());
  CHECK(reader.attribute_count() == 2);
  CHECK(reader.attribute_value(xml_name{"", "name"}) == "OrderId");
  CHECK(reader.attribute_value(xml_name{"", "backing"}) == "1");
}

TEST_CASE("reader: attributes by index keep document order",
          "[expat_reader]") {
  expat_reader reader(R"(<e x="1" y="2"/>)");

  REQUIRE(reader.read());
  REQUIRE(reader.attribute_count() == 2);
  CHECK(reader.attribute_name(0).local_name == "x");
  CHECK(reader.attribute_value(0) == "1");
  CHECK(reader.attribute_name(1).local_name == "y");
  CHECK(reader.attribute_value(1) == "2");
}

TEST_CASE("reader: absent and empty attributes are distinguishable",
          "[expat_reader]") {
  expat_reader reader(R"(<e present=""/>)");

  REQUIRE(reader.read());
  CHECK(reader.has_attribute(xml_name{"", "present"}));
  CHECK(reader.attribute_value(xml_name{"", "present"}).empty());
  CHECK_FALSE(reader.has_attribute(xml_name{"", "missing"}));
  CHECK(reader.attribute_value(xml_name{"", "missing"}).empty());
}

TEST_CASE("reader: nodes report their source line", "[expat_reader]") {
  expat_reader reader("<a>\n  <b/>\n\n  <c/>\n</a>");

  REQUIRE(reader.read()); // start a
  CHECK(reader.line() == 1);

  REQUIRE(reader.read()); // whitespace
  CHECK(reader.node_type() == xml_node_type::characters);

  REQUIRE(reader.read()); // start b
  CHECK(reader.name().local_name == "b");
  CHECK(reader.line() == 2);

  REQUIRE(reader.read()); // end b
  REQUIRE(reader.read()); // whitespace
  REQUIRE(reader.read()); // start c
  CHECK(reader.name().local_name == "c");
  CHECK(reader.line() == 4);
}

TEST_CASE("reader: coalesces adjacent character data", "[expat_reader]") {
  expat_reader reader("<e>a&amp;b</e>");

  REQUIRE(reader.read());
  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::characters);
  CHECK(reader.text() == "a&b");
}

TEST_CASE("reader: malformed XML reports the line", "[expat_reader]") {
  try {
    expat_reader reader("<a>\n<b>\n</a>");
    FAIL("expected a parse error");
  } catch (const std::runtime_error& e) {
    std::string msg = e.what();
    CHECK(msg.find("XML parse error at line 3") != std::string::npos);
  }
}

TEST_CASE("reader: throws on empty input", "[expat_reader]") {
  CHECK_THROWS_AS(expat_reader(""), std::runtime_error);
}
