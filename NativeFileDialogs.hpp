// NativeFileDialogs.hpp
#pragma once

#include "FileDialogs.hpp"

// FileDialogs backed by nativefiledialog-extended.
class NativeFileDialogs : public FileDialogs
{
public:
    NativeFileDialogs() = default;
    ~NativeFileDialogs() override = default;

    Result<std::string> pickOpenPath(const std::string& title) override;
    Result<std::string> pickSavePath(const std::string& title,
                                     const std::string& defaultName) override;
};
