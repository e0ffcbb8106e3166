/**
 * @file TextRender.hpp
 * @brief Conversão de uma grade em texto imprimível (UTF-8).
 */
#pragma once
#include <string>
#include "MazeGrid.hpp"

namespace mazegen {

/** @brief Glifo de parede (U+2588, bloco cheio). */
constexpr const char* kGlyphWall = "\xE2\x96\x88";
/** @brief Glifo de passagem. */
constexpr const char* kGlyphPassage = " ";
/** @brief Glifo para qualquer outro código (U+2591, sombreado leve). */
constexpr const char* kGlyphOther = "\xE2\x96\x91";

/**
 * @brief Glifo correspondente a um código de célula.
 */
const char* glyph_for(Cell c);

/**
 * @brief Desenha a grade: uma linha por linha da grade, um glifo por posição.
 *
 * Cada linha termina em '\n'. Paredes viram bloco cheio, passagens viram
 * espaço e demais códigos (reserva, marcadores) viram sombreado.
 *
 * @param grid grade a desenhar (engrossada ou não)
 * @return texto UTF-8
 */
std::string render(const MazeGrid& grid);

} // namespace mazegen
