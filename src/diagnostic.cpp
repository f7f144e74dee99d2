#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>
#include <cassert>

namespace mk_diag
{

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::warn;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::error;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

}

diagnostics_manager::~diagnostics_manager()
{ assert((printed || data.empty()) && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  auto row = msg["range"]["row"].get<std::size_t>();
  auto col = msg["range"]["col_beg"].get<std::size_t>();

  data[::detail::make_position(msg["range"]["module"].get<std::string>(), row, col)].push_back(msg);

  return *this;
}

std::size_t diagnostics_manager::count(diag_level level) const
{
  std::lock_guard<std::mutex> guard(mut);

  std::size_t n = 0;
  for(auto& w : data)
    n += std::count_if(w.second.begin(), w.second.end(),
                       [level](const nlohmann::json& v) { return v["level"].get<diag_level>() == level; });
  return n;
}

void diagnostics_manager::print(std::FILE* file, bool colored)
{
  std::lock_guard<std::mutex> guard(mut);

  const auto emit = [file, colored](fmt::text_style style, std::string_view text)
  {
    if(colored)
      fmt::print(file, style, "{}", text);
    else
      fmt::print(file, "{}", text);
  };

  std::vector<const ::detail::position*> order;
  order.reserve(data.size());
  for(auto& w : data)
    order.push_back(&w.first);
  std::sort(order.begin(), order.end(), [](auto* lhs, auto* rhs) { return *lhs < *rhs; });

  for(auto* pos : order)
  {
    for(auto& v : data.at(*pos))
    {
      emit(fmt::emphasis::bold | fg(fmt::color::white), fmt::format("{}:{}:{}: ",
          v["range"]["module"].get<std::string>(),
          v["range"]["row"].get<std::size_t>(),
          v["range"]["col_beg"].get<std::size_t>()));

      switch(v["level"].get<diag_level>())
      {
      default:
      case diag_level::error:
        {
          emit(fg(fmt::color::cornsilk), fmt::format("(HA-{}) ", v["hrc"].get<std::uint_fast16_t>()));
          emit(fmt::emphasis::bold | fg(fmt::color::red), "error: ");
          emit(fmt::emphasis::bold | fg(fmt::color::white), v["message"].get<std::string>());
        } break;

      case diag_level::warn:
        {
          emit(fg(fmt::color::cornsilk), fmt::format("(HA-{}) ", v["hrc"].get<std::uint_fast16_t>()));
          emit(fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          emit(fmt::emphasis::bold | fg(fmt::color::white), v["message"].get<std::string>());
        } break;
      }
      fmt::print(file, "\n");
    }
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}

void diagnostics_manager::reset()
{
  std::lock_guard<std::mutex> guard(mut);

  err = 0;
  data.clear();
#ifndef HASM_TESTING
  printed = false;
#endif
}
