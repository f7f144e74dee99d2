#pragma once

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace arguments
{

// Fills `config` from the command line. Problems are reported to `diagnostic`.
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  enum class arity
  {
    flag,   // -x
    one,    // -x value, -x=value
    many,   // -x value value ...
  };

  struct CmdOption
  {
    std::vector<std::string_view> opt;
    std::string_view description;
    arity args;
    std::any default_value;
    std::string_view default_value_str;
    std::function<std::any(const std::vector<std::string_view>&)> parser;
    bool has_equals;
  };
  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      CmdOptionsAdder& operator()(std::string_view opts, std::string_view description, arity args,
                                  std::any default_value, std::string_view default_value_str,
                                  const std::function<std::any(const std::vector<std::string_view>&)>& f);

      CmdOptions* ot;
    };
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    // Every option is present in the result, either parsed or with its default value.
    // Keys are the option names without the leading '-', options written as "-x=" keep the '='.
    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    const CmdOption* find(std::string_view opt) const;
  private:
    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}
