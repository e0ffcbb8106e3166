#pragma once
#include <cstddef>
#include <vector>
#include "MazeGrid.hpp"

/**
 * @file Thicken.hpp
 * @brief Engrossamento da grade para corredores e paredes de largura variável.
 */

namespace mazegen {

/**
 * @brief Replica linhas/colunas de célula `hall_width` vezes e as de parede `wall_width` vezes.
 *
 * Assume a convenção do gerador (paredes em linhas/colunas pares). A saída
 * preserva os códigos mas perde essa convenção de paridade.
 *
 * @param grid grade de origem
 * @param hall_width largura dos corredores (mínimo 1)
 * @param wall_width largura das paredes (mínimo 1)
 * @return nova grade engrossada (mesma topologia)
 */
inline MazeGrid thicken(const MazeGrid& grid, int hall_width, int wall_width) {
    if (hall_width < 1) hall_width = 1;
    if (wall_width < 1) wall_width = 1;
    auto span = [&](int i) { return (i & 1) ? hall_width : wall_width; };

    // Mapa de índice de saída -> índice de origem, por eixo
    std::vector<int> src_x, src_y;
    for (int x = 0; x < grid.width(); ++x) src_x.insert(src_x.end(), static_cast<size_t>(span(x)), x);
    for (int y = 0; y < grid.height(); ++y) src_y.insert(src_y.end(), static_cast<size_t>(span(y)), y);

    MazeGrid out(static_cast<int>(src_x.size()), static_cast<int>(src_y.size()), grid.wraps());
    for (int y = 0; y < out.height(); ++y) {
        for (int x = 0; x < out.width(); ++x) {
            out.at(x, y) = grid.at(src_x[x], src_y[y]);
        }
    }
    return out;
}

} // namespace mazegen
