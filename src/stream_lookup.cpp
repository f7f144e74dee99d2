#include <stream_lookup.hpp>

#include <iostream>
#include <iterator>
#include <fstream>
#include <sstream>
#include <cassert>

stream_lookup_t::~stream_lookup_t()
{
  assert(streams.empty() && "All streams must be dropped.");
}

const std::string& stream_lookup_t::process_stdin()
{
  if(!stdin_module)
    stdin_module = std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  return *stdin_module;
}

std::istream& stream_lookup_t::operator[](std::string_view str)
{
  std::lock_guard<std::mutex> guard(mut);

  assert(streams.find(std::string(str)) == streams.end() && "Stream should have been dropped.");

  std::unique_ptr<std::istream> stream;
  if(str == "STDIN")
    stream = std::make_unique<std::istringstream>(process_stdin());
#ifdef HASM_TESTING
  else if(str == "TESTSTREAM")
    stream = std::make_unique<std::istringstream>(test_module);
#endif
  else
    stream = std::make_unique<std::ifstream>(std::string(str));

  auto& ref = *stream;
  streams[std::string(str)] = std::move(stream);

  return ref;
}

void stream_lookup_t::drop(std::string_view str)
{
  std::lock_guard<std::mutex> guard(mut);

  auto it = streams.find(std::string(str));

  assert(it != streams.end() && "Stream should exist.");

  streams.erase(it);
}

#ifdef HASM_TESTING
void stream_lookup_t::write_test(std::string_view str)
{
  std::lock_guard<std::mutex> guard(mut);

  test_module = std::string(str);
}
#endif
