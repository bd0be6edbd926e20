// Message.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include "EditAction.hpp"
#include "EditorError.hpp"

struct LoadedFile
{
    std::string path;
    std::shared_ptr<const std::string> text;
};

namespace msg
{
struct Edit { EditAction action; };
struct New {};
struct Open {};
struct Save {};
struct FileOpened { Result<LoadedFile> result; };
struct FileSaved { Result<std::string> result; };
}

using Message = std::variant<msg::Edit, msg::New, msg::Open, msg::Save,
                             msg::FileOpened, msg::FileSaved>;

// Background work whose outcome comes back to the editor as a message.
using Task = std::function<Message()>;
