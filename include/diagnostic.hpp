#pragma once

#include <source_range.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>
#include <fmt/format.h>

#include <string_view>
#include <cstdio>
#include <string>
#include <vector>
#include <mutex>

enum class diag_level : unsigned char
{
  error = 1,
  warn  = 1 << 1,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message);
}

namespace detail
{
  struct position
  {
    std::string module;
    std::size_t row;
    std::size_t col;

    bool operator==(const position& other) const
    { return module == other.module && row == other.row && col == other.col; }

    bool operator<(const position& other) const
    {
      if(module != other.module)
        return module < other.module;
      if(row != other.row)
        return row < other.row;
      return col < other.col;
    }
  };
  inline position make_position(std::string module, std::size_t row, std::size_t col)
  {
    return position { std::move(module), row, col };
  }
}
namespace std
{
  template<>
  struct hash<::detail::position>
  {
    std::size_t operator()(const ::detail::position& p) const
    {
      return std::hash<std::string>()(p.module)
           ^ ((std::hash<std::size_t>()(p.row)
           ^ (std::hash<std::size_t>()(p.col) << 1)) << 1);
    }
  };
}

struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  bool empty() const { return data.empty(); }
  std::size_t count(diag_level level) const;

  // Messages are printed ordered by module, row and column.
  void print(std::FILE* file, bool colored = true);
  int error_code() const;

  void reset();
private:
  tsl::robin_map<::detail::position, std::vector<nlohmann::json>> data;

  int err { 0 };
  mutable std::mutex mut;

#ifndef HASM_TESTING
  bool printed { false };
#else
  bool printed { true  };
#endif
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();
