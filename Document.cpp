// Document.cpp
#include "Document.hpp"
#include <algorithm>

Document::Document()
    : content_(),
      cursorIndex_(0),
      selectionStart_(-1),
      selectionEnd_(-1)
{
    rebuildCache();
}

Document::Document(const std::string& text)
    : content_(text),
      cursorIndex_(0),
      selectionStart_(-1),
      selectionEnd_(-1)
{
    rebuildCache();
}

void Document::perform(const EditAction& action)
{
    switch (action.type)
    {
    case EditAction::Type::Insert:
    case EditAction::Type::Paste:
        replaceSelection(action.text);
        break;
    case EditAction::Type::Enter:
        replaceSelection("\n");
        break;
    case EditAction::Type::Backspace:
        if (hasSelection())
            deleteSelection();
        else if (cursorIndex_ > 0)
        {
            int start = previousBoundary(cursorIndex_);
            applyErase(start, cursorIndex_ - start);
        }
        break;
    case EditAction::Type::Delete:
        if (hasSelection())
            deleteSelection();
        else if (cursorIndex_ < (int)content_.size())
            applyErase(cursorIndex_, nextBoundary(cursorIndex_) - cursorIndex_);
        break;
    case EditAction::Type::Move:
        if (hasSelection() && action.motion == Motion::Left)
        {
            cursorIndex_ = selectionRange().first;
            clearSelection();
        }
        else if (hasSelection() && action.motion == Motion::Right)
        {
            cursorIndex_ = selectionRange().second;
            clearSelection();
        }
        else
        {
            moveTo(motionTarget(action.motion), false);
        }
        break;
    case EditAction::Type::Select:
        moveTo(motionTarget(action.motion), true);
        break;
    case EditAction::Type::SelectAll:
        selectionStart_ = 0;
        selectionEnd_ = (int)content_.size();
        cursorIndex_ = selectionEnd_;
        break;
    case EditAction::Type::Click:
        moveTo(snapToBoundary(action.index), action.extend);
        break;
    case EditAction::Type::Drag:
        moveTo(snapToBoundary(action.index), true);
        break;
    case EditAction::Type::Undo:
        undo();
        break;
    case EditAction::Type::Redo:
        redo();
        break;
    }
}

void Document::rebuildCache()
{
    lineCache_.clear();

    const std::string full = content_.getText();
    size_t start = 0;
    for (size_t i = 0; i < full.size(); ++i)
    {
        if (full[i] == '\n')
        {
            lineCache_.push_back(full.substr(start, i - start));
            start = i + 1;
        }
    }
    // text after the last newline, possibly empty
    lineCache_.push_back(full.substr(start));
}

std::pair<int, int> Document::cursorPosition() const
{
    int line, col;
    indexToLineCol(cursorIndex_, line, col);
    return {line, col};
}

void Document::indexToLineCol(int index, int& line, int& col) const
{
    int pos = 0;
    line = 0;
    for (const auto& text : lineCache_)
    {
        int lineLen = (int)text.size();
        if (index <= pos + lineLen)
        {
            col = std::max(0, index - pos);
            return;
        }
        pos += lineLen + 1;
        line++;
    }

    line = (int)lineCache_.size() - 1;
    col = (int)lineCache_.back().size();
}

int Document::lineColToIndex(int line, int col) const
{
    line = std::clamp(line, 0, (int)lineCache_.size() - 1);
    int pos = 0;
    for (int i = 0; i < line; ++i)
        pos += (int)lineCache_[i].size() + 1;
    return pos + std::clamp(col, 0, (int)lineCache_[line].size());
}

bool Document::hasSelection() const
{
    return selectionStart_ != -1 && selectionEnd_ != -1 && selectionStart_ != selectionEnd_;
}

std::pair<int, int> Document::selectionRange() const
{
    if (!hasSelection())
        return {cursorIndex_, cursorIndex_};
    return {std::min(selectionStart_, selectionEnd_), std::max(selectionStart_, selectionEnd_)};
}

std::string Document::selectedText() const
{
    if (!hasSelection())
        return "";

    auto range = selectionRange();
    return content_.getText((size_t)range.first, (size_t)(range.second - range.first));
}

static bool isContinuationByte(char c)
{
    return ((unsigned char)c & 0xC0) == 0x80;
}

int Document::snapToBoundary(int index) const
{
    index = std::clamp(index, 0, (int)content_.size());
    int line, col;
    indexToLineCol(index, line, col);
    const std::string& text = lineCache_[line];
    while (col > 0 && col < (int)text.size() && isContinuationByte(text[col]))
    {
        --col;
        --index;
    }
    return index;
}

int Document::previousBoundary(int index) const
{
    if (index <= 0)
        return 0;
    return snapToBoundary(index - 1);
}

int Document::nextBoundary(int index) const
{
    int size = (int)content_.size();
    if (index >= size)
        return size;

    int line, col;
    indexToLineCol(index, line, col);
    const std::string& text = lineCache_[line];
    ++index;
    ++col;
    while (col < (int)text.size() && isContinuationByte(text[col]))
    {
        ++col;
        ++index;
    }
    return index;
}

int Document::motionTarget(Motion motion) const
{
    int line, col;
    indexToLineCol(cursorIndex_, line, col);

    switch (motion)
    {
    case Motion::Left:
        return previousBoundary(cursorIndex_);
    case Motion::Right:
        return nextBoundary(cursorIndex_);
    case Motion::Up:
        return line > 0 ? snapToBoundary(lineColToIndex(line - 1, col)) : cursorIndex_;
    case Motion::Down:
        return line < lineCount() - 1 ? snapToBoundary(lineColToIndex(line + 1, col)) : cursorIndex_;
    case Motion::Home:
        return lineColToIndex(line, 0);
    case Motion::End:
        return lineColToIndex(line, (int)lineCache_[line].size());
    case Motion::DocumentStart:
        return 0;
    case Motion::DocumentEnd:
        return (int)content_.size();
    }
    return cursorIndex_;
}

void Document::moveTo(int index, bool extend)
{
    if (extend)
    {
        if (selectionStart_ == -1)
            selectionStart_ = cursorIndex_;
        cursorIndex_ = index;
        selectionEnd_ = index;
    }
    else
    {
        cursorIndex_ = index;
        clearSelection();
    }
}

void Document::applyInsert(int pos, const std::string& text)
{
    if (text.empty()) return;
    pos = std::clamp(pos, 0, (int)content_.size());

    content_.insert((size_t)pos, text);

    undoStack_.push_back({Step::Type::Insert, pos, text});
    redoStack_.clear();

    cursorIndex_ = pos + (int)text.size();
    clearSelection();
    rebuildCache();
}

void Document::applyErase(int pos, int len)
{
    if (len <= 0) return;
    int maxPos = (int)content_.size();
    if (pos < 0) pos = 0;
    if (pos >= maxPos) return;
    if (pos + len > maxPos) len = maxPos - pos;

    std::string erased = content_.getText((size_t)pos, (size_t)len);
    content_.erase((size_t)pos, (size_t)len);

    undoStack_.push_back({Step::Type::Erase, pos, std::move(erased)});
    redoStack_.clear();

    cursorIndex_ = pos;
    clearSelection();
    rebuildCache();
}

void Document::deleteSelection()
{
    if (!hasSelection())
        return;

    auto range = selectionRange();
    applyErase(range.first, range.second - range.first);
}

void Document::replaceSelection(const std::string& text)
{
    deleteSelection();
    applyInsert(cursorIndex_, text);
}

void Document::undo()
{
    if (undoStack_.empty()) return;
    Step step = std::move(undoStack_.back());
    undoStack_.pop_back();

    if (step.type == Step::Type::Insert)
    {
        content_.erase((size_t)step.pos, step.text.size());
        cursorIndex_ = step.pos;
    }
    else
    {
        content_.insert((size_t)step.pos, step.text);
        cursorIndex_ = step.pos + (int)step.text.size();
    }
    redoStack_.push_back(std::move(step));

    clearSelection();
    rebuildCache();
}

void Document::redo()
{
    if (redoStack_.empty()) return;
    Step step = std::move(redoStack_.back());
    redoStack_.pop_back();

    if (step.type == Step::Type::Insert)
    {
        content_.insert((size_t)step.pos, step.text);
        cursorIndex_ = step.pos + (int)step.text.size();
    }
    else
    {
        content_.erase((size_t)step.pos, step.text.size());
        cursorIndex_ = step.pos;
    }
    undoStack_.push_back(std::move(step));

    clearSelection();
    rebuildCache();
}
