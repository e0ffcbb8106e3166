#pragma once
#include <vector>
#include <cstdint>
#include <algorithm>

/**
 * @file MazeGrid.hpp
 * @brief Grade de estados de célula usada pelo gerador de labirintos.
 */

namespace mazegen {

/**
 * @brief Códigos de estado de uma posição da grade.
 *
 * `Wall` e `Passage` são os estados terminais. `Reserved` só existe durante a
 * geração. `Marker` é uma anotação de uso externo (ex.: caminho desenhado pela CLI).
 */
enum class Cell : uint8_t {
    Passage  = 0,   ///< Passagem aberta
    Marker   = 64,  ///< Anotação (não escrita pelo gerador)
    Reserved = 127, ///< Reserva temporária (resistente ao entalhe)
    Wall     = 255  ///< Parede sólida
};

/**
 * @brief Ponto (coordenadas inteiras) na grade.
 */
struct Point {
    int x{0}; ///< Coordenada x (coluna)
    int y{0}; ///< Coordenada y (linha)
};

/** @brief Igualdade de pontos (útil em testes e na reconstrução de caminhos). */
inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

/**
 * @brief Grade largura x altura de `Cell`, retangular ou toroidal.
 *
 * Posições com x e y ímpares são "células" (centros de passagem); as demais são
 * paredes até serem entalhadas.
 */
class MazeGrid {
public:
    /**
     * @brief Constrói uma grade com todas as posições em `Cell::Wall`.
     * @param w largura (número de colunas)
     * @param h altura (número de linhas)
     * @param wrap true para topologia toroidal (bordas opostas adjacentes)
     */
    MazeGrid(int w, int h, bool wrap = false)
        : w_(std::max(0, w)), h_(std::max(0, h)), wrap_(wrap),
          grid_(static_cast<size_t>(w_) * static_cast<size_t>(h_), Cell::Wall) {}

    /** @brief Retorna a largura da grade. */
    int width() const { return w_; }
    /** @brief Retorna a altura da grade. */
    int height() const { return h_; }
    /** @brief Indica se a grade é toroidal. */
    bool wraps() const { return wrap_; }
    /** @brief Verifica se (x,y) está dentro dos limites. */
    bool in_bounds(int x, int y) const { return x>=0 && y>=0 && x<w_ && y<h_; }
    /** @brief Verifica se (x,y) é uma posição de célula (ambos ímpares). */
    static bool is_cell_position(int x, int y) { return (x & 1) && (y & 1); }

    /** @brief Coordenada x reduzida módulo largura (sempre não negativa). */
    int wrap_x(int x) const { return ((x % w_) + w_) % w_; }
    /** @brief Coordenada y reduzida módulo altura (sempre não negativa). */
    int wrap_y(int y) const { return ((y % h_) + h_) % h_; }

    /** @brief Acesso mutável à posição (x,y). */
    Cell& at(int x, int y) { return grid_[static_cast<size_t>(y) * w_ + x]; }
    /** @brief Acesso somente-leitura à posição (x,y). */
    const Cell& at(int x, int y) const { return grid_[static_cast<size_t>(y) * w_ + x]; }

    /**
     * @brief Acesso com aritmética modular nas duas coordenadas.
     *
     * Usado para vizinhanças de distância 1 nas varreduras de imperfeição e de
     * ilhas, que sempre tratam a grade como toroidal.
     */
    Cell& at_wrapped(int x, int y) { return at(wrap_x(x), wrap_y(y)); }
    /** @brief Versão somente-leitura de `at_wrapped()`. */
    const Cell& at_wrapped(int x, int y) const { return at(wrap_x(x), wrap_y(y)); }

    /** @brief Conta as posições com o código informado. */
    int count(Cell c) const { return static_cast<int>(std::count(grid_.begin(), grid_.end(), c)); }

private:
    int w_;                  ///< Largura em posições
    int h_;                  ///< Altura em posições
    bool wrap_;              ///< Topologia toroidal
    std::vector<Cell> grid_; ///< Armazenamento linear (linha-major)
};

} // namespace mazegen
