#pragma once

#include <ftxui/component/screen_interactive.hpp>

namespace ui {

void run(ftxui::ScreenInteractive &screen);

} // namespace ui
