// FileOperations.hpp
#pragma once

#include <optional>
#include <string>
#include "Message.hpp"

class FileDialogs;

class FileOperations
{
public:
    explicit FileOperations(FileDialogs* dialogs);
    ~FileOperations() = default;

    // Tasks, run off the UI thread
    Task loadFile(const std::string& path) const;
    Task pickFile() const;
    Task saveFile(const std::optional<std::string>& path, std::string text) const;

    // Blocking primitives the tasks are built from
    static Result<LoadedFile> readFile(const std::string& path);
    static Result<std::string> writeFile(const std::string& path, const std::string& text);
    static bool isValidUtf8(const std::string& bytes);

private:
    FileDialogs* dialogs_;
};
