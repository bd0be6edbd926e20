// OutputLog.cpp
#include "OutputLog.hpp"

void OutputLog::add(OutputIcon icon, const std::string& text)
{
    lines_.push_back({icon, text});
    if (lines_.size() > kMaxLines)
    {
        lines_.pop_front();
    }
}
