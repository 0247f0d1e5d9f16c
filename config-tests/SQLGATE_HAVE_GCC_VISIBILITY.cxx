// Test for gcc-style "visibility" attribute.
struct [[gnu::visibility("hidden")]] hidden
{
  [[gnu::visibility("default")]] static int value() { return 0; }
};

[[gnu::visibility("default")]] int exported()
{
  return hidden::value();
}

int main()
{
  return exported();
}
