// Test for std::format and std::source_location.
#include <format>
#include <source_location>
#include <string_view>


int main()
{
  auto const loc{std::source_location::current()};
  auto const text{std::format("{}:{}", loc.file_name(), loc.line())};
  return std::empty(text) ? 1 : 0;
}
