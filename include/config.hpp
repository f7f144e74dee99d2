#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <string>
#include <vector>

enum class emit_classes
{
  undef,
  help,
  hack,
  symbols,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::hack, "hack" },
  { emit_classes::symbols, "symbols" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::hack,
  emit_classes::symbols,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };
  bool strict { false };

  emit_classes emit_class { emit_classes::hack };
  std::size_t num_cores { 1 };

  std::vector<std::string_view> files;

  // empty means "derive from the source file"
  std::string output_file;
  std::string destination;
  std::string log_file;
};

inline config_t config;
