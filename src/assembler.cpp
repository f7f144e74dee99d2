#include <assembler.hpp>
#include <stream_lookup.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>

#include <sstream>
#include <variant>

namespace hasm
{

static std::vector<std::string> read_lines(std::istream& is)
{
  std::vector<std::string> lines;
  for(std::string line; std::getline(is, line); )
    lines.push_back(std::move(line));
  return lines;
}

assembler::assembler(std::string_view module, const std::vector<std::string>& lines, const parse_options& opts)
  : module(module), opts(opts), prog(symbol_table(lines))
{  }

std::optional<program> assembler::parse(std::string_view module, const parse_options& opts)
{
  auto& is = stream_lookup[module];
  if(!is)
  {
    stream_lookup.drop(module);
    diagnostic <<= diagnostic_db::input::cannot_open(source_range { module, 0, 0, 0 }, module);
    return std::nullopt;
  }
  auto lines = read_lines(is);
  stream_lookup.drop(module);

  return parse_lines(module, lines, opts);
}

program assembler::parse_code(const std::string& text, const parse_options& opts)
{
  std::stringstream ss(text);

  return parse_lines("#TXT#", read_lines(ss), opts);
}

program assembler::parse_lines(std::string_view module, const std::vector<std::string>& lines,
                               const parse_options& opts)
{
  assembler assm(module, lines, opts);

  assm.phase_one();
  assm.phase_two();

  return std::move(assm.prog);
}


void assembler::phase_one()
{
  // labels were already placed while building the symbol table, only report what it found
  for(auto& redef : prog.symbols.redefinitions())
  {
    const source_range range { module, redef.row, 1, redef.name.size() + 3 };

    if(redef.predefined)
      diagnostic <<= diagnostic_db::assembler::label_shadows_predefined(range, redef.name, redef.address);
    else
      diagnostic <<= diagnostic_db::assembler::label_redefined(range, redef.name, redef.address);
  }

  if(prog.symbols.lines().empty())
    diagnostic <<= diagnostic_db::assembler::empty_module(source_range { module, 0, 0, 0 });
}

void assembler::phase_two()
{
  prog.instructions.reserve(prog.symbols.lines().size());

  std::size_t line_loc = 0;
  for(auto& line : prog.symbols.lines())
  {
    ++line_loc;

    auto result = parse_line(line.text, line_loc, &prog.symbols, opts);

    if(auto* instr = std::get_if<parsed_instruction>(&result))
    {
      if(instr->kind == instruction_kind::address && instr->binary.front() == '1')
        diagnostic <<= diagnostic_db::assembler::address_sets_compute_bit(
            source_range::whole_line(module, line.row, line.text), line_loc, line.text);

      prog.instructions.push_back(std::move(*instr));
    }
    else if(auto* err = std::get_if<parse_error>(&result))
    {
      report(*err, line);
      ++prog.failed;
    }
  }

  if(prog.symbols.variables_overflow())
    diagnostic <<= diagnostic_db::assembler::variables_overflow(source_range { module, 0, 0, 0 },
                                                                 prog.symbols.variable_count());
}

void assembler::report(const parse_error& err, const source_line& line) const
{
  const auto range = source_range::whole_line(module, line.row, line.text);

  switch(err.kind)
  {
  case parse_error_kind::unresolvable_instruction:
    diagnostic <<= diagnostic_db::assembler::unresolvable_instruction(range, err.line_loc, err.line);
    break;
  case parse_error_kind::unresolved_symbol:
    diagnostic <<= diagnostic_db::assembler::unresolved_symbol(range, err.line_loc, err.line, err.what);
    break;
  case parse_error_kind::address_out_of_range:
    diagnostic <<= diagnostic_db::assembler::address_out_of_range(range, err.line_loc, err.line, err.what);
    break;
  case parse_error_kind::trailing_input:
    diagnostic <<= diagnostic_db::assembler::trailing_input(range, err.line_loc, err.line, err.what);
    break;
  }
}

}
