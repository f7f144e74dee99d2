#pragma once

#include <symbol_table.hpp>
#include <instruction.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace hasm
{
  struct program
  {
    program(symbol_table&& symbols) : symbols(std::move(symbols))
    {  }

    program() : symbols()
    {  }

    std::vector<std::string> to_binary_lines() const;

    // One 16 digit word per line, in source order.
    void write(std::ostream& os) const;

    // { name: address } for every symbol that was known at the end of the run
    nlohmann::json symbols_to_json() const;

    std::vector<parsed_instruction> instructions;
    symbol_table symbols;

    std::size_t failed { 0 };
  };
}
