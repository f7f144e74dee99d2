#include <sanitizer.hpp>

#include <cctype>

namespace hasm
{

std::string sanitize_line(std::string_view line)
{
  if(auto it = line.find("//"); it != std::string_view::npos)
    line.remove_suffix(line.size() - it);

  std::string sane;
  sane.reserve(line.size());
  for(std::size_t i = 0; i < line.size(); ++i)
  {
    // U+00A0 in UTF-8, other non-ASCII whitespace is kept
    if(line[i] == '\xC2' && i + 1 < line.size() && line[i + 1] == '\xA0')
    {
      ++i;
      continue;
    }
    if(!std::isspace(static_cast<unsigned char>(line[i])))
      sane.push_back(line[i]);
  }
  return sane;
}

std::vector<source_line> sanitize_lines(const std::vector<std::string>& lines)
{
  std::vector<source_line> sane_lines;
  sane_lines.reserve(lines.size());

  std::size_t row = 0;
  for(auto& line : lines)
  {
    ++row;
    auto sane = sanitize_line(line);
    if(!sane.empty())
      sane_lines.push_back(source_line { std::move(sane), row });
  }
  return sane_lines;
}

bool is_label_declaration(std::string_view line)
{
  return !line.empty() && line.front() == '(' && line.back() == ')';
}

}
