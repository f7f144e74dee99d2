#include <program.hpp>

#include <algorithm>
#include <iterator>

namespace hasm
{

std::vector<std::string> program::to_binary_lines() const
{
  std::vector<std::string> v;
  v.reserve(instructions.size());

  std::transform(instructions.begin(), instructions.end(), std::back_inserter(v),
                 [](const parsed_instruction& instr) { return instr.binary; });
  return v;
}

void program::write(std::ostream& os) const
{
  for(auto& instr : instructions)
    os << instr.binary << "\n";
}

nlohmann::json program::symbols_to_json() const
{
  nlohmann::json j = nlohmann::json::object();

  for(auto& p : symbols)
    j[p.first] = p.second;

  return j;
}

}
