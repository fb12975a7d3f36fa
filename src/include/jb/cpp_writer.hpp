#pragma once

#include <jb/cpp_code.hpp>

#include <string>

namespace jb {

  struct write_options {
    file_kind kind = file_kind::header;
  };

  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;

    std::string
    write(const cpp_file& file, write_options opts) const;
  };

} // namespace jb
