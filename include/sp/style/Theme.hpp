#pragma once
#include "sp/style/Color.hpp"

#include <string>

namespace sp {

struct Theme {
  std::string name;

  // Candle colors (stroke and fill)
  Color candleUp{0.0f, 0.8f, 0.4f, 1.0f};
  Color candleDown{0.9f, 0.2f, 0.2f, 1.0f};

  // Hover rulers
  Color rulerColor{0.39f, 0.39f, 0.39f, 1.0f};

  // Hover label
  Color textColor{0.8f, 0.8f, 0.85f, 1.0f};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// Preset lookup by name ("Dark", "Light"). Unknown names give the dark preset.
Theme themeByName(const std::string& name);

} // namespace sp
