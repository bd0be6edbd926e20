#include "FileOperations.hpp"
#include "FileDialogs.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

FileOperations::FileOperations(FileDialogs *dialogs) : dialogs_(dialogs) {}

static std::error_code lastOsError() {
  int err = errno;
  if (err == 0)
    return std::make_error_code(std::errc::io_error);
  return std::error_code(err, std::generic_category());
}

Result<LoadedFile> FileOperations::readFile(const std::string &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec))
    return Error::ioFailed(std::errc::is_a_directory);

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return Error::ioFailed(lastOsError());

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad())
    return Error::ioFailed(lastOsError());

  std::string text = buffer.str();
  if (!isValidUtf8(text))
    return Error::ioFailed(std::errc::illegal_byte_sequence);

  return LoadedFile{path, std::make_shared<const std::string>(std::move(text))};
}

Result<std::string> FileOperations::writeFile(const std::string &path,
                                              const std::string &text) {
  errno = 0;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open())
    return Error::ioFailed(lastOsError());

  file.write(text.data(), (std::streamsize)text.size());
  file.close();
  if (file.fail())
    return Error::ioFailed(lastOsError());

  return path;
}

bool FileOperations::isValidUtf8(const std::string &bytes) {
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    unsigned char c = (unsigned char)bytes[i];
    size_t extra;
    unsigned int cp;
    if (c < 0x80) {
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= n)
      return false;
    for (size_t k = 1; k <= extra; ++k) {
      unsigned char cc = (unsigned char)bytes[i + k];
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    // overlong forms, surrogates and out of range code points
    static const unsigned int minimum[4] = {0, 0x80, 0x800, 0x10000};
    if (cp < minimum[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += extra + 1;
  }
  return true;
}

Task FileOperations::loadFile(const std::string &path) const {
  return [path]() -> Message { return msg::FileOpened{readFile(path)}; };
}

Task FileOperations::pickFile() const {
  FileDialogs *dialogs = dialogs_;
  return [dialogs]() -> Message {
    Result<std::string> picked =
        dialogs->pickOpenPath("Choose a file to open...");
    if (!picked)
      return msg::FileOpened{picked.error()};
    return msg::FileOpened{readFile(picked.value())};
  };
}

Task FileOperations::saveFile(const std::optional<std::string> &path,
                              std::string text) const {
  FileDialogs *dialogs = dialogs_;
  return [dialogs, path, text = std::move(text)]() -> Message {
    std::string target;
    if (path) {
      target = *path;
    } else {
      Result<std::string> picked =
          dialogs->pickSavePath("Choose a file name...", "untitled.txt");
      if (!picked)
        return msg::FileSaved{picked.error()};
      target = picked.value();
    }
    return msg::FileSaved{writeFile(target, text)};
  };
}
