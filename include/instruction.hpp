#pragma once

#include <symbol_table.hpp>

#include <string_view>
#include <cstdint>
#include <variant>
#include <string>

namespace hasm
{
  enum class instruction_kind : std::uint8_t
  {
    address,
    compute,
  };

  struct parsed_instruction
  {
    instruction_kind kind;
    std::string binary;
    std::size_t line_loc;
  };

  // Empty or label shaped line, contributes nothing to the output.
  struct no_instruction
  {  };

  enum class parse_error_kind : std::uint8_t
  {
    unresolvable_instruction,
    unresolved_symbol,
    address_out_of_range,
    trailing_input,
  };

  struct parse_error
  {
    parse_error_kind kind;
    std::string line;
    std::size_t line_loc;

    // offending part of `line`, if narrower than the whole line
    std::string what;
  };

  using parse_result = std::variant<parsed_instruction, no_instruction, parse_error>;

  /// Result of matching `[dest=]comp[;jump]` at the start of a line.
  ///
  /// `comp` stays empty when no computation could be bound, in which case
  /// the line is not a compute instruction. The match is only anchored at
  /// the front: a bare "M" is a valid instruction and anything after the
  /// jump is left unconsumed.
  struct compute_match
  {
    std::string_view dest;
    std::string_view comp;
    std::string_view jump;

    std::size_t consumed { 0 };

    bool has_comp() const
    { return !comp.empty(); }

    // comp (10 bits) + dest (3 bits) + jump (3 bits)
    std::string binary() const;
  };

  compute_match match_compute(std::string_view line);

  struct parse_options
  {
    // reject compute instructions that leave input unconsumed
    bool strict { false };
  };

  // Classifies and encodes one line of pass two. `symbols` may be null, symbolic
  // addresses are an error then.
  parse_result parse_line(std::string_view line, std::size_t line_loc,
                          symbol_table* symbols, const parse_options& opts = {});
}
