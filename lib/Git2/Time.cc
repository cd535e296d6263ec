#include "Git2/Time.hpp"

#include <array>
#include <cstddef>
#include <ctime>
#include <string>

namespace git2 {

std::string Time::toDateString() const {
  const auto seconds = static_cast<std::time_t>(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::array<char, 16> buf{};
  const std::size_t len = std::strftime(buf.data(), buf.size(), "%Y-%m-%d", &utc);
  return { buf.data(), len };
}

} // namespace git2
