// Test for consteval constructors taking string literals.
// C++20: Assume support, once every supported compiler gets this right.
#include <cstddef>
#include <string_view>


class literal
{
public:
  template<std::size_t size>
  consteval literal(char const (&text)[size]) : m_view{text, size - 1}
  {
    for (char const c : m_view) static_cast<void>(c);
  }

  constexpr std::size_t size() const noexcept { return m_view.size(); }

private:
  std::string_view m_view;
};


int size_of(literal text)
{
  return static_cast<int>(text.size());
}


int main()
{
  static_assert(literal{"abc"}.size() == 3);
  return size_of("") + size_of("x") - 1;
}
