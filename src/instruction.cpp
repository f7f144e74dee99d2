#include <instruction.hpp>
#include <sanitizer.hpp>

#include <tsl/robin_map.h>

#include <algorithm>
#include <system_error>
#include <charconv>
#include <vector>

using namespace std::literals::string_view_literals;

namespace hasm
{

namespace
{

// a-bit and c1..c6, prefixed with the 111 of compute instructions
auto comp_table = tsl::robin_map<std::string_view, std::string_view>({
  { "0"sv,   "1110101010"sv },
  { "1"sv,   "1110111111"sv },
  { "-1"sv,  "1110111010"sv },
  { "D"sv,   "1110001100"sv },
  { "A"sv,   "1110110000"sv },
  { "!D"sv,  "1110001101"sv },
  { "!A"sv,  "1110110001"sv },
  { "-D"sv,  "1110001111"sv },
  { "-A"sv,  "1110110011"sv },
  { "D+1"sv, "1110011111"sv },
  { "A+1"sv, "1110110111"sv },
  { "D-1"sv, "1110001110"sv },
  { "A-1"sv, "1110110010"sv },
  { "D+A"sv, "1110000010"sv },
  { "D-A"sv, "1110010011"sv },
  { "A-D"sv, "1110000111"sv },
  { "D&A"sv, "1110000000"sv },
  { "D|A"sv, "1110010101"sv },
  { "M"sv,   "1111110000"sv },
  { "!M"sv,  "1111110001"sv },
  { "-M"sv,  "1111110011"sv },
  { "M+1"sv, "1111110111"sv },
  { "M-1"sv, "1111110010"sv },
  { "D+M"sv, "1111000010"sv },
  { "D-M"sv, "1111010011"sv },
  { "M-D"sv, "1111000111"sv },
  { "D&M"sv, "1111000000"sv },
  { "D|M"sv, "1111010101"sv },
});

auto dest_table = tsl::robin_map<std::string_view, std::string_view>({
  { "M"sv,   "001"sv },
  { "D"sv,   "010"sv },
  { "MD"sv,  "011"sv },
  { "A"sv,   "100"sv },
  { "AM"sv,  "101"sv },
  { "AD"sv,  "110"sv },
  { "AMD"sv, "111"sv },
});

auto jump_table = tsl::robin_map<std::string_view, std::string_view>({
  { "JGT"sv, "001"sv },
  { "JEQ"sv, "010"sv },
  { "JGE"sv, "011"sv },
  { "JLT"sv, "100"sv },
  { "JNE"sv, "101"sv },
  { "JLE"sv, "110"sv },
  { "JMP"sv, "111"sv },
});

constexpr std::string_view no_code = "000"sv;

// Alternatives of a table, longest first so that "D+1" is preferred over "D".
std::vector<std::string_view> longest_first(const tsl::robin_map<std::string_view, std::string_view>& table)
{
  std::vector<std::string_view> keys;
  keys.reserve(table.size());
  for(auto& p : table)
    keys.push_back(p.first);

  std::sort(keys.begin(), keys.end(), [](std::string_view lhs, std::string_view rhs)
    { return lhs.size() != rhs.size() ? lhs.size() > rhs.size() : lhs < rhs; });
  return keys;
}

const auto comp_order = longest_first(comp_table);
const auto dest_order = longest_first(dest_table);
const auto jump_order = longest_first(jump_table);

bool starts_with(std::string_view str, std::string_view prefix)
{
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool is_decimal(std::string_view str)
{
  return !str.empty() && std::all_of(str.begin(), str.end(), [](char ch) { return '0' <= ch && ch <= '9'; });
}

parse_result parse_address(std::string_view operand, const std::string& line, std::size_t line_loc,
                           symbol_table* symbols)
{
  if(operand.empty())
    return parse_error { parse_error_kind::unresolvable_instruction, line, line_loc, {} };

  if(is_decimal(operand))
  {
    std::uint_fast32_t value = 0;
    auto [ptr, ec] = std::from_chars(operand.data(), operand.data() + operand.size(), value);
    if(ec != std::errc() || ptr != operand.data() + operand.size() || value > max_literal)
      return parse_error { parse_error_kind::address_out_of_range, line, line_loc, std::string(operand) };

    return parsed_instruction { instruction_kind::address, to_binary(value), line_loc };
  }

  if(symbols == nullptr)
    return parse_error { parse_error_kind::unresolved_symbol, line, line_loc, std::string(operand) };

  return parsed_instruction { instruction_kind::address, symbols->resolve(std::string(operand)), line_loc };
}

}

std::string compute_match::binary() const
{
  std::string bin;
  bin.reserve(16);
  bin.append(comp).append(dest).append(jump);
  return bin;
}

compute_match match_compute(std::string_view line)
{
  compute_match m { no_code, {}, no_code, 0 };

  auto rest = line;
  for(auto d : dest_order)
  {
    if(starts_with(rest, d) && rest.size() > d.size() && rest[d.size()] == '=')
    {
      m.dest = dest_table.at(d);
      rest.remove_prefix(d.size() + 1);
      break;
    }
  }

  for(auto c : comp_order)
  {
    if(starts_with(rest, c))
    {
      m.comp = comp_table.at(c);
      rest.remove_prefix(c.size());
      break;
    }
  }

  if(starts_with(rest, ";"))
  {
    for(auto j : jump_order)
    {
      if(starts_with(rest.substr(1), j))
      {
        m.jump = jump_table.at(j);
        rest.remove_prefix(j.size() + 1);
        break;
      }
    }
  }

  m.consumed = line.size() - rest.size();
  return m;
}

parse_result parse_line(std::string_view raw, std::size_t line_loc,
                        symbol_table* symbols, const parse_options& opts)
{
  const auto line = sanitize_line(raw);

  if(!line.empty() && line.front() == '@')
    return parse_address(std::string_view(line).substr(1), line, line_loc, symbols);

  // NOTE: anything starting with a computation is accepted here, e.g. "Memory=Address" encodes as "M".
  if(auto m = match_compute(line); m.has_comp())
  {
    if(opts.strict && m.consumed != line.size())
      return parse_error { parse_error_kind::trailing_input, line, line_loc, line.substr(m.consumed) };

    return parsed_instruction { instruction_kind::compute, m.binary(), line_loc };
  }

  // labels should have been stripped in pass one already
  if(line.empty() || is_label_declaration(line))
    return no_instruction {};

  return parse_error { parse_error_kind::unresolvable_instruction, line, line_loc, {} };
}

}
