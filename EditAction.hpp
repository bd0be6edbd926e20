// EditAction.hpp
#pragma once

#include <string>

// Cursor motions understood by Document::perform
enum class Motion
{
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    DocumentStart,
    DocumentEnd
};

// One input from the editing widget.
struct EditAction
{
    enum class Type
    {
        Insert,
        Paste,
        Enter,
        Backspace,
        Delete,
        Move,
        Select,
        SelectAll,
        Click,
        Drag,
        Undo,
        Redo
    };

    Type type;
    std::string text;            // Insert / Paste
    Motion motion = Motion::Left; // Move / Select
    int index = 0;               // Click / Drag
    bool extend = false;         // Click with shift held

    static EditAction insert(const std::string& t) { return {Type::Insert, t}; }
    static EditAction paste(const std::string& t) { return {Type::Paste, t}; }
    static EditAction enter() { return {Type::Enter}; }
    static EditAction backspace() { return {Type::Backspace}; }
    static EditAction del() { return {Type::Delete}; }
    static EditAction move(Motion m) { return {Type::Move, "", m}; }
    static EditAction select(Motion m) { return {Type::Select, "", m}; }
    static EditAction selectAll() { return {Type::SelectAll}; }
    static EditAction click(int idx, bool ext) { return {Type::Click, "", Motion::Left, idx, ext}; }
    static EditAction drag(int idx) { return {Type::Drag, "", Motion::Left, idx}; }
    static EditAction undo() { return {Type::Undo}; }
    static EditAction redo() { return {Type::Redo}; }
};
