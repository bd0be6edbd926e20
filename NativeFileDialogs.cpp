// NativeFileDialogs.cpp
#include "NativeFileDialogs.hpp"
#include <nfd.h>

namespace
{
// nfd has to be initialised on the thread that shows the dialog, and tasks
// run on pooled threads, so every dialog gets its own Init/Quit pair.
struct NfdSession
{
    nfdresult_t status;
    NfdSession() : status(NFD_Init()) {}
    ~NfdSession()
    {
        if (status == NFD_OKAY)
            NFD_Quit();
    }
};

Error nfdFailure()
{
    const char* message = NFD_GetError();
    return Error::ioFailed(std::make_error_code(std::errc::io_error),
                           message ? message : "native file dialog failed");
}
} // namespace

// nfd dialogs carry no title, so the title arguments go unused here.
Result<std::string> NativeFileDialogs::pickOpenPath(const std::string& /*title*/)
{
    NfdSession session;
    if (session.status != NFD_OKAY)
        return nfdFailure();

    nfdu8char_t* outPath = nullptr;
    nfdresult_t result = NFD_OpenDialogU8(&outPath, nullptr, 0, nullptr);
    if (result == NFD_CANCEL)
        return Error::dialogClosed();
    if (result != NFD_OKAY)
        return nfdFailure();

    std::string path(outPath);
    NFD_FreePathU8(outPath);
    return path;
}

Result<std::string> NativeFileDialogs::pickSavePath(const std::string& /*title*/,
                                                    const std::string& defaultName)
{
    NfdSession session;
    if (session.status != NFD_OKAY)
        return nfdFailure();

    nfdu8filteritem_t filters[1] = {{"Text File", "txt"}};

    nfdu8char_t* savePath = nullptr;
    nfdresult_t result =
        NFD_SaveDialogU8(&savePath, filters, 1, nullptr, defaultName.c_str());
    if (result == NFD_CANCEL)
        return Error::dialogClosed();
    if (result != NFD_OKAY)
        return nfdFailure();

    std::string path(savePath);
    NFD_FreePathU8(savePath);
    return path;
}
