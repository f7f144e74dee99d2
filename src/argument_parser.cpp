#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <algorithm>
#include <typeinfo>
#include <optional>
#include <thread>

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

static const source_range args_range { "args", 0, 0, 0 };

void parse(int argc, const char** argv, std::FILE* out)
{
  using detail::arity;

  detail::CmdOptions options("hasm", "The assembler for the 16-bit hack platform.");
  options.add_options()
    ("h,?,-help", "Prints this text.", arity::flag, std::make_any<bool>(false), "false",
      [](auto) { return std::make_any<bool>(true); })
    (",f,-files", "Accepts arbitrary list of .asm files.", arity::many, std::make_any<std::vector<std::string_view>>(), "STDIN",
      [](auto x) { return std::make_any<std::vector<std::string_view>>(x.begin(), x.end()); })
    ("o,-output", "Output file to write to, only for a single source file.", arity::one, std::make_any<std::string>(), "<source>.hack",
      [](auto x) { return std::make_any<std::string>(x.front()); })
    ("d,-destination", "Output directory, by default uses the directory of the source.", arity::one, std::make_any<std::string>(), "",
      [](auto x) { return std::make_any<std::string>(x.front()); })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", arity::one, std::make_any<emit_classes>(emit_classes::hack), "hack",
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = v;
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(args_range, v);
        return emit_classes::help;
      })
    ("-log=", "Additionally write all diagnostics to this file.", arity::one, std::make_any<std::string>(), "",
      [](auto x) { return std::make_any<std::string>(x.front()); })
    ("-strict", "Reject compute instructions followed by unparsed text.", arity::flag, std::make_any<bool>(false), "false",
      [](auto) { return std::make_any<bool>(true); })
    ("j,-num-cores", "Number of source files to assemble in parallel. \"*\" to determine automatically.", arity::one, std::make_any<std::size_t>(1), "1",
      [](auto x)
      {
        if(x.front() == "*")
          return static_cast<std::size_t>(std::max(1U, std::thread::hardware_concurrency()));

        std::size_t v = 0;
        try
        {
          v = static_cast<std::size_t>(std::stoull(std::string(x.front())));
        }
        catch(const std::logic_error&)
        {
          diagnostic <<= diagnostic_db::args::not_a_number(args_range, x.front());
          return static_cast<std::size_t>(1);
        }

        if(v == 0)
          diagnostic <<= diagnostic_db::args::num_cores_too_small(args_range);
        else if(v > std::thread::hardware_concurrency())
          diagnostic <<= diagnostic_db::args::num_cores_too_large(args_range);
        return std::max<std::size_t>(v, 1);
      })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  if(const auto& files = std::any_cast<std::vector<std::string_view>>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.num_cores = std::any_cast<std::size_t>(map["j"]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
  config.output_file = std::any_cast<std::string>(map["o"]);
  config.destination = std::any_cast<std::string>(map["d"]);
  config.log_file = std::any_cast<std::string>(map["-log="]);
  config.strict = std::any_cast<bool>(map["-strict"]);

  if(!config.output_file.empty() && config.files.size() > 1)
    diagnostic <<= diagnostic_db::args::output_with_many_files(args_range);
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    arity args, std::any default_value, std::string_view default_value_str,
    const std::function<std::any(const std::vector<std::string_view>&)>& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;
  auto it = opt_list.find(',');
  while(it != std::string_view::npos)
  {
    opts.emplace_back(opt_list.substr(0, it));
    opt_list.remove_prefix(it + 1); // + 1 to remove comma

    it = opt_list.find(',');
  }
  if(!opt_list.empty() && opt_list.back() == '=')
  {
    opt_list.remove_suffix(1); // <- get rid of equals
    has_equals = true;
  }
  opts.emplace_back(opt_list);

  ot->data.push_back(CmdOption { opts, description, args, std::move(default_value), default_value_str, f, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }

const CmdOption* CmdOptions::find(std::string_view opt) const
{
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      if(f == opt)
        return &v;
    }
  }
  return nullptr;
}

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;

  const auto store = [&map](const CmdOption& v, const std::any& a)
  {
    for(auto f : v.opt)
      map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = a;
  };

  for(auto& v : data)
    store(v, v.default_value);

  // positional arguments belong to the option with an empty name
  const CmdOption* implicit = find("");
  std::vector<std::string_view> implicit_args;

  const CmdOption* cur_opt = nullptr;
  std::string_view cur_name;
  std::vector<std::string_view> opt_args;

  const auto finish = [&]()
  {
    if(cur_opt == nullptr)
      return;
    if(cur_opt->args != arity::flag && opt_args.empty())
      diagnostic <<= diagnostic_db::args::missing_value(args_range, cur_name);
    else
      store(*cur_opt, cur_opt->parser(opt_args));

    cur_opt = nullptr;
    opt_args.clear();
  };

  for(int i = 1; i < argc; ++i)
  {
    std::string_view str = argv[i];
    if(str.size() < 2 || str[0] != '-')
    {
      if(cur_opt != nullptr)
      {
        opt_args.push_back(str);
        if(cur_opt->args == arity::one)
          finish();
      }
      else
        implicit_args.push_back(str);
      continue;
    }

    finish();

    // first char of str is `-`, after that it should match
    std::string_view opt = str.substr(1);
    std::optional<std::string_view> attached;
    if(auto it = opt.find('='); it != std::string_view::npos)
    {
      attached = opt.substr(it + 1);
      opt.remove_suffix(opt.size() - it);
    }

    cur_opt = find(opt);
    cur_name = str;
    if(cur_opt == nullptr)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_range, str);
      continue;
    }

    if(attached)
      opt_args.push_back(*attached);
    if(cur_opt->args == arity::flag || (cur_opt->args == arity::one && attached))
      finish();
  }
  finish();

  if(implicit != nullptr && !implicit_args.empty())
  {
    if(auto it = map.find(""); it != map.end() && it->second.type() == typeid(std::vector<std::string_view>))
    {
      // -f may have collected some files already
      auto files = std::any_cast<std::vector<std::string_view>>(it->second);
      implicit_args.insert(implicit_args.end(), files.begin(), files.end());
    }
    store(*implicit, implicit->parser(implicit_args));
  }

  return map;
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += " or ";
      args += "-";
      args += o;
      if(v.has_equals)
        args += "=";
    }
    fmt::print(f, "  {:<28} {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}
