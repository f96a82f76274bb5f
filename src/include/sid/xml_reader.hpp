#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sid {

  struct xml_name {
    std::string namespace_uri;
    std::string local_name;

    bool
    operator==(const xml_name&) const = default;
  };

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const xml_name&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const xml_name&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    // Empty when the attribute is absent; use has_attribute to tell an
    // absent attribute from an empty one.
    virtual std::string_view
    attribute_value(const xml_name& name) const = 0;

    virtual bool
    has_attribute(const xml_name& name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // 1-based source line of the current node.
    virtual std::size_t
    line() const = 0;
  };

} // namespace sid
