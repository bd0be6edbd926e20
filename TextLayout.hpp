// TextLayout.hpp
#pragma once

#include <string>

struct ImFont;

// Maps between byte columns of a line and horizontal pixel offsets, so the
// caret and selection line up with the glyphs ImGui draws.
float textColumnX(ImFont* font, float fontSize, const std::string& line, int byteCol);

// Byte column of the character boundary closest to x. Never points inside a
// UTF-8 sequence.
int textColumnAtX(ImFont* font, float fontSize, const std::string& line, float x);
