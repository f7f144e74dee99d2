#pragma once

#include <sanitizer.hpp>

#include <tsl/robin_map.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hasm
{
  using address_type = std::uint_fast16_t;

  constexpr address_type first_variable_address = 16;
  constexpr address_type screen_address         = 16384;
  constexpr address_type keyboard_address       = 24576;

  // Largest address below the compute-instruction bit.
  constexpr address_type max_address            = 32767;
  // Largest literal that still fits into one 16-bit word.
  constexpr std::uint_fast32_t max_literal      = 65535;

  // 16 binary digits, most significant bit first.
  std::string to_binary(std::uint_fast32_t value);

  // A label that replaced an earlier mapping of the same name.
  struct label_redefinition
  {
    std::string name;
    std::size_t row;
    address_type address;
    bool predefined;
  };

  class symbol_table
  {
  public:
    using map_type = tsl::robin_map<std::string, address_type>;
  public:
    symbol_table();

    // Pass one: sanitizes `raw_lines`, records every label and keeps the remaining instructions.
    explicit symbol_table(const std::vector<std::string>& raw_lines);

    // Returns the address of `name`, allocating the next variable address for unknown names.
    std::string resolve(const std::string& name);

    std::optional<address_type> lookup(const std::string& name) const;
    std::string operator[](const std::string& name) const;

    const std::vector<source_line>& lines() const
    { return instructions; }

    const std::vector<label_redefinition>& redefinitions() const
    { return redefs; }

    std::size_t variable_count() const
    { return next_variable - first_variable_address; }

    // true once a variable had to be placed at or above SCREEN
    bool variables_overflow() const
    { return next_variable > screen_address; }

    std::size_t size() const
    { return table.size(); }

    map_type::const_iterator begin() const
    { return table.begin(); }

    map_type::const_iterator end() const
    { return table.end(); }
  private:
    void seed();
    void scan(std::vector<source_line>&& lines);
  private:
    map_type table;
    std::vector<source_line> instructions;
    std::vector<label_redefinition> redefs;

    std::uint_fast32_t next_variable { first_variable_address };
  };
}
