#pragma once

#include <unordered_map>
#include <string_view>
#include <optional>
#include <istream>
#include <memory>
#include <string>
#include <mutex>

// Hands out one input stream per module. "STDIN" is read once and replayed,
// every other module name is a path on disk.
struct stream_lookup_t
{
  stream_lookup_t() = default;
  ~stream_lookup_t();

  std::istream& operator[](std::string_view str);
  void drop(std::string_view str);

#ifdef HASM_TESTING
  void write_test(std::string_view str);
#endif
private:
  const std::string& process_stdin();
private:
  std::unordered_map<std::string, std::unique_ptr<std::istream>> streams;
  std::optional<std::string> stdin_module;
#ifdef HASM_TESTING
  std::string test_module;
#endif

  std::mutex mut;
};

inline stream_lookup_t stream_lookup;
