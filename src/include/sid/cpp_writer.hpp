#pragma once

#include <sid/cpp_code.hpp>

#include <string>

namespace sid {

  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;
  };

} // namespace sid
