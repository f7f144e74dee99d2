#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <assembler.hpp>
#include <driver.hpp>

#include <filesystem>
#include <functional>
#include <iostream>
#include <fstream>
#include <cassert>
#include <chrono>
#include <future>
#include <vector>
#include <map>
#include <set>

namespace fs = std::filesystem;

std::string output_path(std::string_view source, const config_t& cfg, std::string_view extension)
{
  if(!cfg.output_file.empty())
    return cfg.output_file;
  if(source == "STDIN")
    return "-";

  fs::path src(source);
  if(!cfg.destination.empty())
    return (fs::path(cfg.destination) / src.stem()).string() + "." + std::string(extension);

  return src.replace_extension(extension).string();
}

static void write_output(std::string_view source, std::string_view extension,
                         const std::function<void(std::ostream&)>& writer)
{
  const auto path = output_path(source, config, extension);
  if(path == "-")
  {
    writer(std::cout);
    std::cout.flush();
    return;
  }

  std::ofstream os(path);
  if(!os)
  {
    diagnostic <<= diagnostic_db::input::cannot_write(source_range { source, 0, 0, 0 }, path);
    return;
  }
  writer(os);
}

static const std::map<emit_classes, std::function<void(std::string_view)>> emitter =
{
  { emit_classes::help, [](auto){ assert(false); } },
  { emit_classes::hack, [](std::string_view t)
    {
      const auto prog = hasm::assembler::parse(t, hasm::parse_options { config.strict });
      if(!prog)
        return;

      write_output(t, "hack", [&prog](std::ostream& os) { prog->write(os); });
    } },
  { emit_classes::symbols, [](std::string_view t)
    {
      const auto prog = hasm::assembler::parse(t, hasm::parse_options { config.strict });
      if(!prog)
        return;

      write_output(t, "json", [&prog](std::ostream& os) { os << prog->symbols_to_json().dump(2) << "\n"; });
    } },
};

void driver::go()
{
  std::vector<std::string_view> tasks;
  if(config.files.empty())
    tasks = { "STDIN" };
  else
    tasks = config.files;

  // two tasks on the same file would share its stream and its output
  std::set<fs::path> seen;
  for(auto tit = tasks.begin(); tit != tasks.end(); )
  {
    if(*tit != "STDIN" && fs::path(*tit).extension() != ".asm")
    {
      diagnostic <<= diagnostic_db::input::not_an_asm_file(source_range { *tit, 0, 0, 0 }, *tit);
      tit = tasks.erase(tit);
    }
    else if(!seen.insert(fs::path(*tit).lexically_normal()).second)
    {
      diagnostic <<= diagnostic_db::input::duplicate_file(source_range { *tit, 0, 0, 0 }, *tit);
      tit = tasks.erase(tit);
    }
    else
      ++tit;
  }

  std::vector<std::future<void>> runners;
  for(auto tit = tasks.begin(); tit != tasks.end(); )
  {
    for(std::size_t i = runners.size(); tit != tasks.end() && i < config.num_cores; ++i)
    {
      auto t = *tit;

      runners.emplace_back(std::async(std::launch::async, [t]() { emitter.at(config.emit_class)(t); }));

      ++tit;
    }
    for(auto rit = runners.begin(); rit != runners.end(); )
    {
      assert(rit->valid() && "Future has become invalid!");
      if(rit->wait_for(std::chrono::milliseconds(1)) == std::future_status::ready)
      {
        rit->get();
        rit = runners.erase(rit);
      }
      else
        ++rit;
    }
  }
  for(auto& runner : runners)
    runner.get();
}
