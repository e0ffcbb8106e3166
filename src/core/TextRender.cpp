#include "TextRender.hpp"

namespace mazegen {

const char* glyph_for(Cell c) {
    switch (c) {
        case Cell::Wall:    return kGlyphWall;
        case Cell::Passage: return kGlyphPassage;
        default:            return kGlyphOther;
    }
}

std::string render(const MazeGrid& grid) {
    std::string s;
    // até 3 bytes por glifo + quebra de linha
    s.reserve(static_cast<size_t>(grid.width() * 3 + 1) * static_cast<size_t>(grid.height()));
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            s += glyph_for(grid.at(x, y));
        }
        s += '\n';
    }
    return s;
}

} // namespace mazegen
