// PieceTable.hpp
#pragma once
#include <string>
#include <vector>

struct Piece {
    enum class BufferKind { Original, Add };

    BufferKind buffer;  // which buffer this piece belongs to
    size_t start;       // starting index in that buffer
    size_t length;      // length of text in that buffer
};

class PieceTable {
public:
    PieceTable();
    explicit PieceTable(const std::string& original);

    void insert(size_t pos, const std::string& text);
    void erase(size_t pos, size_t len);

    std::string getText() const;
    std::string getText(size_t pos, size_t len) const;
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    size_t pieceCount() const { return pieces.size(); }

    void clear();

private:
    std::string originalBuffer;
    std::string addBuffer;
    std::vector<Piece> pieces;
    size_t size_ = 0;

    const std::string& bufferOf(const Piece& p) const;
};
