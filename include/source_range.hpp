#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <string>

// A span inside one line of a module. Rows and columns are 1-based, zero means unknown.
struct source_range
{
  std::string_view module;

  std::size_t row { 0 };

  std::size_t column_beg { 0 };
  std::size_t column_end { 0 };

  source_range() = default;

  source_range(std::string_view module, std::size_t row,
               std::size_t column_beg, std::size_t column_end);

  static source_range whole_line(std::string_view module, std::size_t row, std::string_view line);
};

void to_json(nlohmann::json& j, const source_range& s);
