/**
 * @file cli/CliOptions.hpp
 * @brief Opções da CLI: interpretação de argumentos, semente do ambiente e
 *        marcação do caminho de solução.
 */
#pragma once
#include <cstdint>
#include "core/MazeGenerator.hpp"
#include "core/MazeGrid.hpp"

// -----------------------------
/**
 * @name Parâmetros de configuração (MAZEGEN_DEFAULT_*)
 * @brief Defaults ajustáveis em tempo de compilação.
 *
 * Podem ser sobrepostos via `-D` no CMake, ex.:
 * `-DMAZEGEN_DEFAULT_WIDTH=21 -DMAZEGEN_DEFAULT_HALL=2`.
 */
#ifndef MAZEGEN_DEFAULT_WIDTH
#define MAZEGEN_DEFAULT_WIDTH 32
#endif
#ifndef MAZEGEN_DEFAULT_HALL
#define MAZEGEN_DEFAULT_HALL 1
#endif
#ifndef MAZEGEN_DEFAULT_WALL
#define MAZEGEN_DEFAULT_WALL 1
#endif
#ifndef MAZEGEN_DEFAULT_SEED
#define MAZEGEN_DEFAULT_SEED 5489u
#endif

namespace mazegen {

/** @brief Maior largura de corredor/parede aceita por `--hall`/`--wall`. */
constexpr int kMaxThickness = 64;

/**
 * @brief Opções completas da CLI (geração + apresentação).
 */
struct CliOptions {
    GenParams gen{};
    uint32_t seed{MAZEGEN_DEFAULT_SEED};
    int hall{MAZEGEN_DEFAULT_HALL};
    int wall{MAZEGEN_DEFAULT_WALL};
    bool solve{false};
    bool verbose{false};
    bool help{false};
};

/** @brief Imprime a ajuda em stdout. */
void print_usage(const char* argv0);

/**
 * @brief Lê a semente de `MAZEGEN_SEED`, se definida e válida.
 * @param out semente de saída
 * @return true se a variável existia e foi aceita
 */
bool seed_from_env(uint32_t* out);

/**
 * @brief Interpreta os argumentos de linha de comando.
 *
 * Aplica primeiro os defaults e `MAZEGEN_SEED`; `--seed` tem precedência.
 * Largura/altura aceitam [0, kMaxDimension] (0 = default), `--hall`/`--wall`
 * aceitam [1, kMaxThickness] e a semente cabe em 32 bits.
 *
 * @param argc quantidade de argumentos
 * @param argv vetor de argumentos
 * @param opt opções de saída
 * @return false em argumento desconhecido, sem valor ou com valor inválido
 */
bool parse_args(int argc, char** argv, CliOptions& opt);

/**
 * @brief Marca com `Cell::Marker` o caminho entre a primeira e a última célula aberta.
 * @return quantidade de posições marcadas (0 se não houver caminho)
 */
int mark_solution(MazeGrid& grid);

} // namespace mazegen
