#include "PieceTable.hpp"
#include <cassert>
#include <string>

int main() {
  PieceTable t("hello world");
  assert(t.size() == 11);
  t.insert(5, ",");
  assert(t.getText() == "hello, world");
  t.insert(t.size(), "!");
  assert(t.getText() == "hello, world!");
  t.insert(0, ">> ");
  assert(t.getText() == ">> hello, world!");

  // erase spanning several pieces
  t.erase(1, 8);
  assert(t.getText() == "> world!");
  assert(t.size() == 8);
  t.erase(0, 100);
  assert(t.getText().empty());
  assert(t.empty());

  // consecutive typing grows one piece
  PieceTable typing;
  typing.insert(0, "a");
  typing.insert(1, "b");
  typing.insert(2, "c");
  assert(typing.getText() == "abc");
  assert(typing.pieceCount() == 1);

  PieceTable r("0123456789");
  r.insert(5, "xy");
  assert(r.getText(3, 5) == "34xy5");
  assert(r.getText(8, 100) == "6789");
  assert(r.getText(20, 1).empty());

  // out of range positions are clamped or ignored
  r.erase(50, 2);
  assert(r.getText() == "01234xy56789");
  r.insert(99, "Z");
  assert(r.getText() == "01234xy56789Z");

  r.clear();
  assert(r.size() == 0);
  assert(r.getText().empty());
  return 0;
}
