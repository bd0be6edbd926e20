// OutputLog.hpp
#pragma once

#include <deque>
#include <string>

enum class OutputIcon
{
    None,
    Document,
    Folder,
    Save,
    Error,
    Checkmark
};

struct OutputLine {
    OutputIcon icon;
    std::string text;
};

// Application log shown in the output panel. UI thread only.
class OutputLog
{
public:
    static constexpr size_t kMaxLines = 1000;

    void add(OutputIcon icon, const std::string& text);
    void add(const std::string& text) { add(OutputIcon::None, text); }
    void clear() { lines_.clear(); }

    const std::deque<OutputLine>& lines() const { return lines_; }

private:
    std::deque<OutputLine> lines_;
};
