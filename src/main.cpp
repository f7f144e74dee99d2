#include <arguments_parser.hpp>
#include <diagnostic.hpp>
#include <config.hpp>
#include <driver.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <memory>

int main(int argc, const char** argv)
{
  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() != 0)
    goto end;
  if(config.print_help)
    goto end;

  { // <- needed for goto
  driver drv;
  drv.go();
  }

end:
  if(!config.log_file.empty())
  {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> log(std::fopen(config.log_file.c_str(), "w"), &std::fclose);
    if(log)
      diagnostic.print(log.get(), false);
    else
      fmt::print(stderr, "cannot open log file \"{}\"\n", config.log_file);
  }
  diagnostic.print(stderr);
  return diagnostic.error_code();
}
