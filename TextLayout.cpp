// TextLayout.cpp
#include "TextLayout.hpp"
#include "imgui.h"
#include <algorithm>
#include <cfloat>

static float measure(ImFont* font, float fontSize, const char* begin, const char* end)
{
    return font->CalcTextSizeA(fontSize, FLT_MAX, 0.0f, begin, end).x;
}

float textColumnX(ImFont* font, float fontSize, const std::string& line, int byteCol)
{
    byteCol = std::clamp(byteCol, 0, (int)line.size());
    return measure(font, fontSize, line.data(), line.data() + byteCol);
}

int textColumnAtX(ImFont* font, float fontSize, const std::string& line, float x)
{
    float left = 0.0f;
    size_t i = 0;
    while (i < line.size())
    {
        size_t next = i + 1;
        while (next < line.size() && ((unsigned char)line[next] & 0xC0) == 0x80)
            next++;
        float width = measure(font, fontSize, line.data() + i, line.data() + next);
        if (x < left + width * 0.5f)
            return (int)i;
        left += width;
        i = next;
    }
    return (int)line.size();
}
