// FileDialogs.hpp
#pragma once

#include <string>
#include "EditorError.hpp"

// Source of file paths chosen by the user. Called from background tasks.
// A cancelled dialog yields Error::dialogClosed().
class FileDialogs
{
public:
    virtual ~FileDialogs() = default;

    virtual Result<std::string> pickOpenPath(const std::string& title) = 0;
    virtual Result<std::string> pickSavePath(const std::string& title,
                                             const std::string& defaultName) = 0;
};
