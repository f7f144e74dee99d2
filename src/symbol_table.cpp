#include <symbol_table.hpp>

#include <tsl/robin_set.h>

#include <stdexcept>
#include <bitset>

namespace hasm
{

std::string to_binary(std::uint_fast32_t value)
{
  return std::bitset<16>(value).to_string();
}

symbol_table::symbol_table()
{ seed(); }

symbol_table::symbol_table(const std::vector<std::string>& raw_lines)
{
  seed();
  scan(sanitize_lines(raw_lines));
}

void symbol_table::seed()
{
  for(address_type i = 0; i < 16; ++i)
    table["R" + std::to_string(i)] = i;

  table["SP"]     = 0;
  table["LCL"]    = 1;
  table["ARG"]    = 2;
  table["THIS"]   = 3;
  table["THAT"]   = 4;
  table["SCREEN"] = screen_address;
  table["KBD"]    = keyboard_address;

  next_variable = first_variable_address;
}

void symbol_table::scan(std::vector<source_line>&& lines)
{
  tsl::robin_set<std::string> labels;

  address_type pos = 0;
  for(auto& line : lines)
  {
    if(!is_label_declaration(line.text))
    {
      instructions.push_back(std::move(line));
      ++pos;
      continue;
    }
    std::string name = line.text.substr(1, line.text.size() - 2);

    // last declaration wins
    if(table.find(name) != table.end())
      redefs.push_back(label_redefinition { name, line.row, pos, labels.find(name) == labels.end() });

    labels.insert(name);
    table[name] = pos;
  }
}

std::string symbol_table::resolve(const std::string& name)
{
  auto it = table.find(name);
  if(it != table.end())
    return to_binary(it->second);

  const auto address = static_cast<address_type>(next_variable++);
  table[name] = address;

  return to_binary(address);
}

std::optional<address_type> symbol_table::lookup(const std::string& name) const
{
  auto it = table.find(name);
  if(it == table.end())
    return std::nullopt;
  return it->second;
}

std::string symbol_table::operator[](const std::string& name) const
{
  auto it = table.find(name);
  if(it == table.end())
    throw std::out_of_range("Unknown symbol \"" + name + "\".");
  return to_binary(it->second);
}

}
