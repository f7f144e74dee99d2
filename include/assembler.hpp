#pragma once

#include <instruction.hpp>
#include <program.hpp>

#include <string_view>
#include <optional>
#include <string>
#include <vector>

namespace hasm
{
  // One translation run: phase one collects labels, phase two encodes instruction by instruction.
  // Failed lines are reported to `diagnostic` and left out of the program.
  class assembler
  {
  public:
    // Empty if `module` cannot be read.
    static std::optional<program> parse(std::string_view module, const parse_options& opts = {});
    static program parse_code(const std::string& text, const parse_options& opts = {});
    static program parse_lines(std::string_view module, const std::vector<std::string>& lines,
                               const parse_options& opts = {});
  private:
    assembler(std::string_view module, const std::vector<std::string>& lines, const parse_options& opts);

    void phase_one();
    void phase_two();

    void report(const parse_error& err, const source_line& line) const;
  private:
    std::string_view module;
    parse_options opts;

    program prog;
  };
}
