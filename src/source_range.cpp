#include <source_range.hpp>

source_range::source_range(std::string_view module, std::size_t row,
                           std::size_t column_beg, std::size_t column_end)
  : module(module), row(row), column_beg(column_beg), column_end(column_end)
{  }

source_range source_range::whole_line(std::string_view module, std::size_t row, std::string_view line)
{
  return source_range { module, row, 1, line.size() + 1 };
}

void to_json(nlohmann::json& j, const source_range& s)
{
  j = nlohmann::json{
    { "module", s.module },
    { "row", s.row },
    { "col_beg", s.column_beg },
    { "col_end", s.column_end },
  };
}
