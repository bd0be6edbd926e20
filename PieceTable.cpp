#include "PieceTable.hpp"
#include <algorithm> // for std::min

PieceTable::PieceTable() = default;

PieceTable::PieceTable(const std::string& original)
    : originalBuffer(original), size_(original.size()) {
    if (!original.empty()) {
        pieces.push_back({Piece::BufferKind::Original, 0, original.size()});
    }
}

const std::string& PieceTable::bufferOf(const Piece& p) const {
    return (p.buffer == Piece::BufferKind::Original) ? originalBuffer : addBuffer;
}

void PieceTable::insert(size_t pos, const std::string& text) {
    if (text.empty()) return;
    pos = std::min(pos, size_);
    size_t addStart = addBuffer.size();
    addBuffer += text;
    size_ += text.size();

    size_t cur = 0;
    for (size_t i = 0; i < pieces.size(); ++i) {
        Piece p = pieces[i];
        if (pos <= cur + p.length) {
            size_t offset = pos - cur;

            // typing at the end of the last added piece just grows it
            if (offset == p.length && p.buffer == Piece::BufferKind::Add &&
                p.start + p.length == addStart) {
                pieces[i].length += text.size();
                return;
            }

            Piece before   = {p.buffer, p.start, offset};
            Piece inserted = {Piece::BufferKind::Add, addStart, text.size()};
            Piece after    = {p.buffer, p.start + offset, p.length - offset};

            std::vector<Piece> newPieces;
            if (before.length) newPieces.push_back(before);
            newPieces.push_back(inserted);
            if (after.length) newPieces.push_back(after);

            pieces.erase(pieces.begin() + i);
            pieces.insert(pieces.begin() + i, newPieces.begin(), newPieces.end());
            return;
        }
        cur += p.length;
    }
    // append at end
    pieces.push_back({Piece::BufferKind::Add, addStart, text.size()});
}

void PieceTable::erase(size_t pos, size_t len) {
    if (len == 0 || pos >= size_) return;
    len = std::min(len, size_ - pos);
    size_ -= len;

    size_t cur = 0;
    for (size_t i = 0; i < pieces.size() && len > 0;) {
        Piece p = pieces[i];
        if (pos >= cur + p.length) {
            cur += p.length;
            i++;
            continue;
        }

        size_t offset   = pos - cur;
        size_t eraseLen = std::min(len, p.length - offset);

        Piece before = {p.buffer, p.start, offset};
        Piece after  = {p.buffer, p.start + offset + eraseLen, p.length - offset - eraseLen};

        std::vector<Piece> newPieces;
        if (before.length) newPieces.push_back(before);
        if (after.length)  newPieces.push_back(after);

        pieces.erase(pieces.begin() + i);
        pieces.insert(pieces.begin() + i, newPieces.begin(), newPieces.end());

        // the erased range always continues right after "before"
        len -= eraseLen;
        if (before.length) {
            cur += before.length;
            i++;
        }
    }
}

std::string PieceTable::getText() const {
    std::string result;
    result.reserve(size_);
    for (auto& p : pieces) {
        result.append(bufferOf(p), p.start, p.length);
    }
    return result;
}

std::string PieceTable::getText(size_t pos, size_t len) const {
    std::string result;
    if (pos >= size_) return result;
    len = std::min(len, size_ - pos);
    result.reserve(len);

    size_t cur = 0;
    for (auto& p : pieces) {
        if (len == 0) break;
        if (pos < cur + p.length) {
            size_t offset = pos - cur;
            size_t take = std::min(len, p.length - offset);
            result.append(bufferOf(p), p.start + offset, take);
            pos += take;
            len -= take;
        }
        cur += p.length;
    }
    return result;
}

void PieceTable::clear() {
    originalBuffer.clear();
    addBuffer.clear();
    pieces.clear();
    size_ = 0;
}
