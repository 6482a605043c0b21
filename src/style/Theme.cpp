#include "sp/style/Theme.hpp"

namespace sp {

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";

  t.candleUp   = {0.1f, 0.7f, 0.3f, 1.0f};
  t.candleDown = {0.85f, 0.15f, 0.15f, 1.0f};

  t.rulerColor = {0.0f, 0.0f, 0.0f, 0.7f};
  t.textColor  = {0.15f, 0.15f, 0.2f, 1.0f};

  return t;
}

Theme themeByName(const std::string& name) {
  if (name == "Light") return lightTheme();
  return darkTheme();
}

} // namespace sp
