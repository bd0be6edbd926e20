// Editor.hpp
#pragma once

#include <optional>
#include <string>
#include "Document.hpp"
#include "EditorError.hpp"
#include "Message.hpp"

class FileOperations;
class OutputLog;

// Application state: the open document, where it lives on disk and the
// outcome of the last file operation. Mutated only from the UI thread;
// file work is handed out as tasks and comes back through update().
class Editor
{
public:
    Editor(const FileOperations* fileOps, OutputLog* log);
    ~Editor() = default;

    // Applies a message. Returns the background task to run, if any.
    std::optional<Task> update(Message message);

    // Schedules loading of a known path, as done for the startup file.
    std::optional<Task> openPath(const std::string& path);

    std::string title() const;
    std::string statusText() const;
    std::string positionText() const;

    const Document& document() const { return document_; }
    const std::optional<std::string>& path() const { return path_; }
    const std::optional<Error>& error() const { return error_; }
    bool busy() const { return busy_; }

private:
    const FileOperations* fileOps_;
    OutputLog* log_;

    std::optional<std::string> path_;
    Document document_;
    std::optional<Error> error_;
    bool busy_;
    // New arrived while a save was running; its path is not adopted
    bool saveDetached_;

    std::optional<Task> handle(msg::Edit& m);
    std::optional<Task> handle(msg::New& m);
    std::optional<Task> handle(msg::Open& m);
    std::optional<Task> handle(msg::Save& m);
    std::optional<Task> handle(msg::FileOpened& m);
    std::optional<Task> handle(msg::FileSaved& m);

    bool refuseWhileBusy();
};
