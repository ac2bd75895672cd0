#pragma once

#include "config.h"

// Opens the window and renders the default scene into it, restarting the
// render whenever the window is resized. Returns the process exit code.
int viewer_main(const RenderConfig& render, const ViewerConfig& viewer);
