// Editor.cpp
#include "Editor.hpp"
#include "FileOperations.hpp"
#include "OutputLog.hpp"
#include <filesystem>

Editor::Editor(const FileOperations* fileOps, OutputLog* log)
    : fileOps_(fileOps),
      log_(log),
      path_(),
      document_(),
      error_(),
      busy_(false),
      saveDetached_(false)
{
}

std::optional<Task> Editor::update(Message message)
{
    return std::visit([this](auto& m) { return handle(m); }, message);
}

std::optional<Task> Editor::openPath(const std::string& path)
{
    if (refuseWhileBusy())
        return std::nullopt;
    busy_ = true;
    return fileOps_->loadFile(path);
}

bool Editor::refuseWhileBusy()
{
    if (!busy_)
        return false;
    log_->add(OutputIcon::Error, "A file operation is already in progress");
    return true;
}

std::optional<Task> Editor::handle(msg::Edit& m)
{
    document_.perform(m.action);
    error_.reset();
    return std::nullopt;
}

std::optional<Task> Editor::handle(msg::New&)
{
    // a save still in flight belongs to the old buffer
    if (busy_)
        saveDetached_ = true;
    path_.reset();
    document_ = Document();
    log_->add(OutputIcon::Document, "New file created");
    return std::nullopt;
}

std::optional<Task> Editor::handle(msg::Open&)
{
    if (refuseWhileBusy())
        return std::nullopt;
    busy_ = true;
    return fileOps_->pickFile();
}

std::optional<Task> Editor::handle(msg::Save&)
{
    if (refuseWhileBusy())
        return std::nullopt;
    busy_ = true;
    saveDetached_ = false;
    return fileOps_->saveFile(path_, document_.text());
}

std::optional<Task> Editor::handle(msg::FileOpened& m)
{
    busy_ = false;
    saveDetached_ = false;
    if (!m.result)
    {
        error_ = m.result.error();
        log_->add(OutputIcon::Error, "Could not open file: " + error_->describe());
        return std::nullopt;
    }

    const LoadedFile& file = m.result.value();
    path_ = file.path;
    document_ = Document(*file.text);

    if (file.text->empty())
        log_->add(OutputIcon::Folder, "Opened empty file: " + file.path);
    else
        log_->add(OutputIcon::Folder, "Opened: " + file.path + " (" +
                                          std::to_string(file.text->size()) + " bytes)");
    return std::nullopt;
}

std::optional<Task> Editor::handle(msg::FileSaved& m)
{
    busy_ = false;
    bool detached = saveDetached_;
    saveDetached_ = false;
    if (!m.result)
    {
        error_ = m.result.error();
        log_->add(OutputIcon::Error, "Could not save file: " + error_->describe());
        return std::nullopt;
    }

    log_->add(OutputIcon::Save, "Saved: " + m.result.value());
    if (!detached)
        path_ = m.result.value();
    return std::nullopt;
}

std::string Editor::title() const
{
    if (!path_)
        return "Jotter";
    return "Jotter - " + std::filesystem::path(*path_).filename().string();
}

std::string Editor::statusText() const
{
    if (error_)
        return error_->describe();
    if (path_)
        return *path_;
    return "New file";
}

std::string Editor::positionText() const
{
    auto [line, col] = document_.cursorPosition();

    // column counts characters, not bytes
    const std::string& text = document_.lines()[line];
    int chars = 0;
    for (int i = 0; i < col; ++i)
    {
        if (((unsigned char)text[i] & 0xC0) != 0x80)
            chars++;
    }
    return std::to_string(line + 1) + ":" + std::to_string(chars + 1);
}
