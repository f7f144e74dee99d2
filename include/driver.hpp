#pragma once

#include <config.hpp>

#include <string_view>
#include <string>

// Where the result for `source` goes. "-" stands for stdout.
std::string output_path(std::string_view source, const config_t& cfg, std::string_view extension);

struct driver
{
  void go();
};
