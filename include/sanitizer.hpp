#pragma once

#include <string_view>
#include <string>
#include <vector>

namespace hasm
{
  // A sanitized, non-empty line together with the 1-based row it was read from.
  struct source_line
  {
    std::string text;
    std::size_t row;
  };

  // Drops everything after the first "//" and all whitespace.
  std::string sanitize_line(std::string_view line);

  // Sanitizes every line and keeps only those that are not empty afterwards.
  std::vector<source_line> sanitize_lines(const std::vector<std::string>& lines);

  // "(NAME)"
  bool is_label_declaration(std::string_view line);
}
