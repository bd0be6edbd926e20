#include "Document.hpp"
#include "FileOperations.hpp"
#include <cassert>
#include <string>

static void typing_and_lines() {
  Document d;
  assert(d.empty());
  assert(d.lineCount() == 1);
  d.perform(EditAction::insert("ab"));
  d.perform(EditAction::enter());
  d.perform(EditAction::insert("cd"));
  assert(d.text() == "ab\ncd");
  assert(d.lineCount() == 2);
  assert(d.cursorPosition() == std::make_pair(1, 2));
  d.perform(EditAction::backspace());
  assert(d.text() == "ab\nc");
  d.perform(EditAction::move(Motion::DocumentStart));
  d.perform(EditAction::del());
  assert(d.text() == "b\nc");
  assert(d.cursorIndex() == 0);
}

static void motions() {
  Document d("first\nsecond line\nx");
  d.perform(EditAction::move(Motion::End));
  assert(d.cursorPosition() == std::make_pair(0, 5));
  d.perform(EditAction::move(Motion::Down));
  assert(d.cursorPosition() == std::make_pair(1, 5));
  d.perform(EditAction::move(Motion::Down));
  // column clamps to the short last line
  assert(d.cursorPosition() == std::make_pair(2, 1));
  d.perform(EditAction::move(Motion::Down));
  assert(d.cursorPosition() == std::make_pair(2, 1));
  d.perform(EditAction::move(Motion::Home));
  assert(d.cursorPosition() == std::make_pair(2, 0));
  d.perform(EditAction::move(Motion::Left));
  assert(d.cursorPosition() == std::make_pair(1, 11));
  d.perform(EditAction::move(Motion::DocumentEnd));
  assert(d.cursorIndex() == (int)d.size());
  d.perform(EditAction::move(Motion::Right));
  assert(d.cursorIndex() == (int)d.size());
}

static void selection() {
  Document d("hello world");
  d.perform(EditAction::move(Motion::DocumentEnd));
  for (int i = 0; i < 5; ++i)
    d.perform(EditAction::select(Motion::Left));
  assert(d.hasSelection());
  assert(d.selectedText() == "world");
  d.perform(EditAction::insert("there"));
  assert(d.text() == "hello there");
  assert(!d.hasSelection());

  d.perform(EditAction::selectAll());
  assert(d.selectedText() == "hello there");
  d.perform(EditAction::move(Motion::Left));
  assert(!d.hasSelection());
  assert(d.cursorIndex() == 0);

  d.perform(EditAction::click(6, false));
  d.perform(EditAction::drag(11));
  assert(d.selectedText() == "there");
  d.perform(EditAction::paste("you"));
  assert(d.text() == "hello you");

  d.perform(EditAction::click(100, false));
  assert(d.cursorIndex() == 9);
  d.perform(EditAction::click(0, true));
  assert(d.selectedText() == "hello you");
  d.perform(EditAction::backspace());
  assert(d.empty());
}

static void undo_redo() {
  Document d("abc");
  d.perform(EditAction::move(Motion::DocumentEnd));
  d.perform(EditAction::insert("d"));
  d.perform(EditAction::backspace());
  d.perform(EditAction::backspace());
  assert(d.text() == "ab");
  d.perform(EditAction::undo());
  assert(d.text() == "abc");
  d.perform(EditAction::undo());
  assert(d.text() == "abcd");
  d.perform(EditAction::undo());
  assert(d.text() == "abc");
  assert(!d.canUndo());
  d.perform(EditAction::undo());
  assert(d.text() == "abc");
  d.perform(EditAction::redo());
  assert(d.text() == "abcd");
  assert(d.cursorIndex() == 4);
  // a fresh edit drops the redo history
  d.perform(EditAction::insert("!"));
  assert(!d.canRedo());
  assert(d.text() == "abcd!");
}

static void utf8_and_trailing_newline() {
  const std::string text = "caf\xC3\xA9\n";
  Document d(text);
  assert(d.text() == text);
  assert(d.lineCount() == 2);
  assert(d.lines()[0] == "caf\xC3\xA9");
  assert(d.lines()[1].empty());
}

// e-acute is two bytes, the euro sign three and the emoji four
static void edits_keep_multibyte_characters_whole() {
  Document d;
  d.perform(EditAction::insert("caf\xC3\xA9"));
  d.perform(EditAction::backspace());
  assert(d.text() == "caf");
  assert(FileOperations::isValidUtf8(d.text()));

  Document e("\xC3\xA9x");
  e.perform(EditAction::move(Motion::Right));
  assert(e.cursorIndex() == 2);
  e.perform(EditAction::insert("y"));
  assert(e.text() == "\xC3\xA9yx");
  assert(FileOperations::isValidUtf8(e.text()));

  Document f("\xE2\x82\xAC\xF0\x9F\x98\x80!");
  f.perform(EditAction::del());
  assert(f.text() == "\xF0\x9F\x98\x80!");
  f.perform(EditAction::move(Motion::DocumentEnd));
  f.perform(EditAction::move(Motion::Left));
  f.perform(EditAction::move(Motion::Left));
  assert(f.cursorIndex() == 0);
  f.perform(EditAction::move(Motion::Right));
  assert(f.cursorIndex() == 4);
  f.perform(EditAction::backspace());
  assert(f.text() == "!");
  assert(FileOperations::isValidUtf8(f.text()));

  Document g("\xC3\xA9\xC3\xA9");
  g.perform(EditAction::move(Motion::DocumentEnd));
  g.perform(EditAction::select(Motion::Left));
  assert(g.selectedText() == "\xC3\xA9");
}

static void clicks_and_vertical_moves_land_on_characters() {
  Document d("\xC3\xA9\xC3\xA9\nab");
  d.perform(EditAction::click(1, false));
  assert(d.cursorIndex() == 0);
  d.perform(EditAction::click(3, false));
  assert(d.cursorIndex() == 2);
  d.perform(EditAction::drag(1));
  assert(d.cursorIndex() == 0);
  assert(d.selectedText() == "\xC3\xA9");

  // byte column 1 on "ab" maps into the middle of the first character above
  d.perform(EditAction::click(6, false));
  assert(d.cursorPosition() == std::make_pair(1, 1));
  d.perform(EditAction::move(Motion::Up));
  assert(d.cursorIndex() == 0);
  d.perform(EditAction::insert("x"));
  assert(d.text() == "x\xC3\xA9\xC3\xA9\nab");
  assert(FileOperations::isValidUtf8(d.text()));
}

int main() {
  typing_and_lines();
  motions();
  selection();
  undo_redo();
  utf8_and_trailing_newline();
  edits_keep_multibyte_characters_whole();
  clicks_and_vertical_moves_land_on_characters();
  return 0;
}
