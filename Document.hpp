// Document.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "EditAction.hpp"
#include "PieceTable.hpp"

// Text buffer plus caret, selection and the widget's undo history.
// Indices are byte offsets into the text; caret motions and single
// character deletes step over whole UTF-8 sequences.
class Document
{
public:
    Document();
    explicit Document(const std::string& text);

    void perform(const EditAction& action);

    std::string text() const { return content_.getText(); }
    size_t size() const { return content_.size(); }
    bool empty() const { return content_.empty(); }

    int cursorIndex() const { return cursorIndex_; }
    // zero-based (line, column) of the caret
    std::pair<int, int> cursorPosition() const;

    bool hasSelection() const;
    std::pair<int, int> selectionRange() const;
    std::string selectedText() const;

    const std::vector<std::string>& lines() const { return lineCache_; }
    int lineCount() const { return (int)lineCache_.size(); }

    void indexToLineCol(int index, int& line, int& col) const;
    int lineColToIndex(int line, int col) const;

    bool canUndo() const { return !undoStack_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }

private:
    struct Step {
        enum class Type { Insert, Erase } type;
        int pos;
        std::string text; // inserted text (for Insert) or erased text (for Erase)
    };

    PieceTable content_;
    std::vector<std::string> lineCache_;
    int cursorIndex_;
    int selectionStart_;
    int selectionEnd_;

    std::vector<Step> undoStack_;
    std::vector<Step> redoStack_;

    void rebuildCache();
    void clearSelection() { selectionStart_ = selectionEnd_ = -1; }

    void applyInsert(int pos, const std::string& text); // records step
    void applyErase(int pos, int len);                 // records step
    void deleteSelection();
    void replaceSelection(const std::string& text);
    void undo();
    void redo();

    // nearest code point start at or before index
    int snapToBoundary(int index) const;
    int previousBoundary(int index) const;
    int nextBoundary(int index) const;

    int motionTarget(Motion motion) const;
    void moveTo(int index, bool extend);
};
