/**
 * @file cli/main.cpp
 * @brief Front-end de linha de comando: gera um labirinto e o imprime como texto.
 *
 * - Lê parâmetros de geração de argumentos `--flag valor`.
 * - Semente: `--seed`, senão variável de ambiente `MAZEGEN_SEED`, senão
 *   `MAZEGEN_DEFAULT_SEED`.
 * - Opcionalmente marca o caminho entre a primeira e a última célula aberta (`--solve`).
 * - Imprime a grade engrossada em stdout; com `-v`, estatísticas em stderr.
 *
 * Exemplo: `./mazegen_cli -w 41 -H 21 -i 0.1 --hall 2 --solve`
 */
#include <cstdio>
#include <string>
#include "CliOptions.hpp"
#include "core/MazeGenerator.hpp"
#include "core/Thicken.hpp"
#include "core/TextRender.hpp"

using namespace mazegen;

/**
 * @brief Ponto de entrada da CLI.
 *
 * @param argc Quantidade de argumentos.
 * @param argv Vetor de argumentos.
 * @return 0 em sucesso; 1 em argumento inválido ou configuração degenerada.
 */
int main(int argc, char** argv) {
    CliOptions opt{};
    if (!parse_args(argc, argv, opt)) {
        print_usage(argv[0]);
        return 1;
    }
    if (opt.help) {
        print_usage(argv[0]);
        return 0;
    }

    Mt19937Random rng(opt.seed);
    GenStats st{};
    auto maze = MazeGenerator::generate(opt.gen, rng, &st);
    if (!maze) {
        std::fprintf(stderr, "ERRO: nao foi possivel gerar o labirinto (seed=%u)\n", opt.seed);
        return 1;
    }

    int marked = 0;
    if (opt.solve) marked = mark_solution(*maze);

    if (opt.verbose) {
        std::fprintf(stderr, "MAZEGEN: stats seed=%u size=%dx%d wrap=%d start=(%d,%d) reserved=%d carved=%d removed=%d islands=%d cleared=%d marked=%d\n",
                     opt.seed, st.width, st.height, opt.gen.wrap ? 1 : 0, st.start.x, st.start.y,
                     st.reserved, st.carved, st.walls_removed, st.islands_repaired, st.reserves_cleared, marked);
    }

    const std::string text = render(thicken(*maze, opt.hall, opt.wall));
    std::fwrite(text.data(), 1, text.size(), stdout);
    return 0;
}
