#pragma once

#include "dropcatch/config.hpp"

namespace dropcatch
{

// Opens the window and runs the game until it is closed. Throws if the
// physics world cannot be created.
void RunGame(const AppConfig& cfg);

} // namespace dropcatch
