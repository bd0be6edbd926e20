#include "FileOperations.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static fs::path scratchDir() {
  fs::path dir = fs::temp_directory_path() / "jotter_test_file_operations";
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void writeRaw(const fs::path &path, const std::string &bytes) {
  std::ofstream out(path, std::ios::binary);
  out.write(bytes.data(), (std::streamsize)bytes.size());
}

int main() {
  fs::path dir = scratchDir();

  // exact bytes survive a write/read cycle, CRLF and tabs included
  const std::string text = "line one\r\n\tline two\ncaf\xC3\xA9 \xF0\x9F\x98\x80\n";
  std::string path = (dir / "sample.txt").string();
  Result<std::string> written = FileOperations::writeFile(path, text);
  assert(written.ok());
  assert(written.value() == path);
  Result<LoadedFile> loaded = FileOperations::readFile(path);
  assert(loaded.ok());
  assert(loaded.value().path == path);
  assert(*loaded.value().text == text);

  // saving truncates the previous content
  assert(FileOperations::writeFile(path, "short").ok());
  assert(*FileOperations::readFile(path).value().text == "short");

  // empty files load as empty documents
  std::string empty = (dir / "empty.txt").string();
  writeRaw(empty, "");
  Result<LoadedFile> emptyLoaded = FileOperations::readFile(empty);
  assert(emptyLoaded.ok());
  assert(emptyLoaded.value().text->empty());

  Result<LoadedFile> missing = FileOperations::readFile((dir / "nope.txt").string());
  assert(!missing.ok());
  assert(missing.error().kind == Error::Kind::IOFailed);
  assert(missing.error().code == std::errc::no_such_file_or_directory);

  Result<LoadedFile> directory = FileOperations::readFile(dir.string());
  assert(!directory.ok());
  assert(directory.error().code == std::errc::is_a_directory);

  std::string binary = (dir / "latin1.txt").string();
  writeRaw(binary, "caf\xE9");
  Result<LoadedFile> latin1 = FileOperations::readFile(binary);
  assert(!latin1.ok());
  assert(latin1.error().code == std::errc::illegal_byte_sequence);

  Result<std::string> badWrite =
      FileOperations::writeFile((dir / "no_such_dir" / "x.txt").string(), "x");
  assert(!badWrite.ok());
  assert(badWrite.error().kind == Error::Kind::IOFailed);
  assert(badWrite.error().code == std::errc::no_such_file_or_directory);

  assert(FileOperations::isValidUtf8(""));
  assert(FileOperations::isValidUtf8("plain ascii"));
  assert(FileOperations::isValidUtf8("\xE2\x82\xAC"));
  assert(FileOperations::isValidUtf8("\xF0\x9F\x98\x80"));
  assert(!FileOperations::isValidUtf8("\xC0\x80"));       // overlong
  assert(!FileOperations::isValidUtf8("\xED\xA0\x80"));   // surrogate
  assert(!FileOperations::isValidUtf8("\xE2\x82"));       // truncated
  assert(!FileOperations::isValidUtf8("\xF4\x90\x80\x80")); // above U+10FFFF
  assert(!FileOperations::isValidUtf8("\x80"));

  // the load task reports through a FileOpened message
  FileOperations ops(nullptr);
  Message message = ops.loadFile(path)();
  assert(std::holds_alternative<msg::FileOpened>(message));
  assert(*std::get<msg::FileOpened>(message).result.value().text == "short");

  fs::remove_all(dir);
  return 0;
}
