#include "MazeGenerator.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <utility>
#include <vector>

namespace mazegen {

/**
 * @brief Normaliza os parâmetros pedidos.
 *
 * Nenhuma entrada é rejeitada: valores fora de faixa são limitados e valores
 * ausentes (<= 0) recebem o default. Dimensões acima de `kMaxDimension` são
 * limitadas antes da paridade, que então é corrigida somando o mínimo
 * necessário (par com `wrap`, ímpar sem).
 *
 * @param p parâmetros pedidos
 * @return parâmetros normalizados
 */
NormalizedParams MazeGenerator::normalize(const GenParams& p) {
    NormalizedParams np{};
    int w = (p.width > 0) ? p.width : 32;
    int h = (p.height > 0) ? p.height : w;
    w = std::min(w, kMaxDimension);
    h = std::min(h, kMaxDimension);

    double imperfect = p.imperfect;
    if (!(imperfect > 0.0)) imperfect = 0.0; // também cobre NaN
    if (imperfect > 1.0) imperfect = 1.0;

    double fill = std::isnan(p.fill) ? 1.0 : p.fill;
    double density = fill * 0.9 + 0.1;
    if (density < 0.0) density = 0.0;
    if (density > 1.0) density = 1.0;

    if (p.wrap) {
        w += w & 1;
        h += h & 1;
    } else {
        w += (w & 1) ? 0 : 1;
        h += (h & 1) ? 0 : 1;
    }

    np.width = w;
    np.height = h;
    np.wrap = p.wrap;
    np.imperfect = imperfect;
    np.reserve = 1.0 - density;
    return np;
}

MazeGrid MazeGenerator::allocate(const NormalizedParams& np) {
    return MazeGrid(np.width, np.height, np.wrap);
}

/**
 * @brief Reserva células ímpares/ímpares com probabilidade `reserve`.
 *
 * Um sorteio por célula, varrendo coluna a coluna. Com `reserve <= 0` nenhum
 * sorteio é consumido.
 *
 * @param grid grade recém-alocada
 * @param reserve probabilidade por célula
 * @param rng fonte de aleatoriedade
 * @return quantidade de células reservadas
 */
int MazeGenerator::reserve_regions(MazeGrid& grid, double reserve, RandomSource& rng) {
    if (!(reserve > 0.0)) return 0;
    int reserved = 0;
    for (int x = 1; x < grid.width(); x += 2) {
        for (int y = 1; y < grid.height(); y += 2) {
            if (rng.chance(reserve)) {
                grid.at(x, y) = Cell::Reserved;
                ++reserved;
            }
        }
    }
    return reserved;
}

/**
 * @brief Seleciona a célula inicial do entalhe.
 *
 * Ordem de tentativa:
 * 1) célula próxima ao centro;
 * 2) sorteio uniforme entre as células, limitado a `64 + 8 * células` tentativas;
 * 3) varredura linha-major pela primeira célula em parede.
 *
 * Sem célula disponível a configuração é degenerada (grade sem células ou
 * totalmente reservada): registra erro fatal e retorna false.
 *
 * @param grid grade após a reserva
 * @param rng fonte de aleatoriedade
 * @param out ponteiro de saída
 * @return true se uma célula inicial foi escolhida
 */
bool MazeGenerator::choose_start(const MazeGrid& grid, RandomSource& rng, Point* out) {
    if (!out) {
        std::fprintf(stderr, "MAZEGEN: fatal: choose_start sem ponteiro de saida\n");
        return false;
    }
    const int w = grid.width();
    const int h = grid.height();
    const int cols = w / 2; // células por linha
    const int rows = h / 2; // células por coluna
    if (cols <= 0 || rows <= 0) {
        std::fprintf(stderr, "MAZEGEN: fatal: grade %dx%d sem posicoes de celula\n", w, h);
        return false;
    }

    auto center = [](int size, int count) {
        return std::clamp((size / 4) * 2 + 1, 1, count * 2 - 1);
    };
    Point cur{center(w, cols), center(h, rows)};
    if (grid.at(cur.x, cur.y) == Cell::Wall) { *out = cur; return true; }

    const long max_attempts = 64L + 8L * cols * rows;
    for (long i = 0; i < max_attempts; ++i) {
        cur.x = rng.next_below(cols) * 2 + 1;
        cur.y = rng.next_below(rows) * 2 + 1;
        if (grid.at(cur.x, cur.y) == Cell::Wall) { *out = cur; return true; }
    }

    for (int y = 1; y < h; y += 2) {
        for (int x = 1; x < w; x += 2) {
            if (grid.at(x, y) == Cell::Wall) { *out = Point{x, y}; return true; }
        }
    }

    std::fprintf(stderr, "MAZEGEN: fatal: nenhuma celula inexplorada para iniciar (%dx%d, todas reservadas)\n", w, h);
    return false;
}

/**
 * @brief DFS aleatório com pilha explícita de `FrontierEntry`.
 *
 * Cada entrada retirada ainda inexplorada vira passagem e abre a parede entre
 * ela e a célula de origem (`cell - step`). Entradas já exploradas são
 * descartadas, o que equivale ao backtracking da versão recursiva.
 *
 * Enquanto `ignore_reserved > 0`, células reservadas contam como inexploradas,
 * garantindo um corredor inicial mínimo antes de a reserva surtir efeito.
 *
 * @param grid grade com reservas aplicadas
 * @param start célula inicial (x,y ímpares)
 * @param rng fonte de aleatoriedade
 * @return quantidade de células abertas
 */
int MazeGenerator::carve(MazeGrid& grid, Point start, RandomSource& rng) {
    const int w = grid.width();
    const int h = grid.height();
    const bool wrap = grid.wraps();
    int ignore_reserved = std::max(w, h);

    auto unexplored = [&](int x, int y) {
        const Cell c = grid.at(x, y);
        return c == Cell::Wall || (c == Cell::Reserved && ignore_reserved > 0);
    };

    // Tabela persistente: cada embaralhamento parte da ordem anterior
    std::array<Point, 4> dirs{{ {-1, 0}, {1, 0}, {0, 1}, {0, -1} }};

    std::vector<FrontierEntry> stack;
    stack.push_back(FrontierEntry{start, Point{0, 0}});
    int carved = 0;

    while (!stack.empty()) {
        const FrontierEntry cur = stack.back();
        stack.pop_back();
        if (!unexplored(cur.cell.x, cur.cell.y)) continue;

        grid.at(cur.cell.x, cur.cell.y) = Cell::Passage;
        --ignore_reserved;
        ++carved;

        // Abre a parede de volta para a origem
        grid.at(grid.wrap_x(cur.cell.x - cur.step.x), grid.wrap_y(cur.cell.y - cur.step.y)) = Cell::Passage;

        // Fisher-Yates
        for (int i = 3; i > 0; --i) {
            const int j = rng.next_below(i + 1);
            std::swap(dirs[i], dirs[j]);
        }

        for (const Point& step : dirs) {
            int x = cur.cell.x + step.x * 2;
            int y = cur.cell.y + step.y * 2;
            if (wrap) {
                x = grid.wrap_x(x);
                y = grid.wrap_y(y);
            }
            if (grid.in_bounds(x, y) && unexplored(x, y)) {
                stack.push_back(FrontierEntry{Point{x, y}, step});
            }
        }
    }
    return carved;
}

/**
 * @brief Remove paredes aleatórias para introduzir laços.
 *
 * São `ceil(imperfect * w * h / 3)` iterações, cada uma tentando uma parede
 * entre células verticalmente adjacentes (x ímpar, y par) e depois uma entre
 * células horizontalmente adjacentes (x par, y ímpar). Sem `wrap`, o anel
 * externo nunca é sorteado. A parede só cai se algum vizinho direto já for
 * passagem, para não criar aberturas isoladas.
 *
 * @param grid grade entalhada
 * @param imperfect fração em [0,1]
 * @param rng fonte de aleatoriedade
 * @return quantidade de paredes efetivamente removidas
 */
int MazeGenerator::inject_imperfections(MazeGrid& grid, double imperfect, RandomSource& rng) {
    if (!(imperfect > 0.0)) return 0;
    const int w = grid.width();
    const int h = grid.height();
    const int bdry = grid.wraps() ? 0 : 1;
    const int cols = w / 2;
    const int rows = h / 2;
    const int wall_cols = w / 2 - bdry;
    const int wall_rows = h / 2 - bdry;

    int removed = 0;
    auto remove = [&](int x, int y) {
        if (grid.at(x, y) != Cell::Wall) return;
        if (grid.at_wrapped(x, y + 1) == Cell::Passage || grid.at_wrapped(x, y - 1) == Cell::Passage ||
            grid.at_wrapped(x + 1, y) == Cell::Passage || grid.at_wrapped(x - 1, y) == Cell::Passage) {
            grid.at(x, y) = Cell::Passage;
            ++removed;
        }
    };

    const int count = static_cast<int>(std::ceil(imperfect * w * h / 3.0));
    for (int i = count; i > 0; --i) {
        if (cols > 0 && wall_rows > 0) {
            const int x = rng.next_below(cols) * 2 + 1;
            const int y = rng.next_below(wall_rows) * 2 + bdry * 2;
            remove(x, y);
        }
        if (wall_cols > 0 && rows > 0) {
            const int x = rng.next_below(wall_cols) * 2 + bdry * 2;
            const int y = rng.next_below(rows) * 2 + 1;
            remove(x, y);
        }
    }
    return removed;
}

/**
 * @brief Desfaz blocos 2x2 totalmente abertos.
 *
 * Varre as junções (x,y pares) uma única vez; quando os quatro vizinhos diretos
 * são passagem, um deles, sorteado, volta a ser parede. Um reparo pode criar
 * nova ilha adiante, que não é revisitada.
 *
 * @return quantidade de ilhas reparadas
 */
int MazeGenerator::reconnect_islands(MazeGrid& grid, RandomSource& rng) {
    static const Point kDirs[4] = { {-1, 0}, {1, 0}, {0, 1}, {0, -1} };
    int repaired = 0;
    for (int y = 0; y < grid.height(); y += 2) {
        for (int x = 0; x < grid.width(); x += 2) {
            if (grid.at_wrapped(x, y + 1) == Cell::Passage && grid.at_wrapped(x, y - 1) == Cell::Passage &&
                grid.at_wrapped(x + 1, y) == Cell::Passage && grid.at_wrapped(x - 1, y) == Cell::Passage) {
                const Point d = kDirs[rng.next_below(4)];
                grid.at_wrapped(x + d.x, y + d.y) = Cell::Wall;
                ++repaired;
            }
        }
    }
    return repaired;
}

int MazeGenerator::clear_reservations(MazeGrid& grid) {
    int cleared = 0;
    for (int x = 1; x < grid.width(); x += 2) {
        for (int y = 1; y < grid.height(); y += 2) {
            if (grid.at(x, y) == Cell::Reserved) {
                grid.at(x, y) = Cell::Wall;
                ++cleared;
            }
        }
    }
    return cleared;
}

/**
 * @brief Pipeline completo: normaliza, aloca, reserva, entalha, imperfeita,
 *        repara ilhas e limpa reservas.
 *
 * A grade pertence a esta chamada durante toda a geração e é devolvida por valor.
 *
 * @param p parâmetros pedidos
 * @param rng fonte de aleatoriedade injetada
 * @param stats saída opcional de estatísticas
 * @return grade final, ou std::nullopt se a configuração não tiver célula inicial
 */
std::optional<MazeGrid> MazeGenerator::generate(const GenParams& p, RandomSource& rng, GenStats* stats) {
    const NormalizedParams np = normalize(p);
    MazeGrid grid = allocate(np);

    GenStats st{};
    st.width = np.width;
    st.height = np.height;
    st.reserved = reserve_regions(grid, np.reserve, rng);

    Point start{};
    if (!choose_start(grid, rng, &start)) return std::nullopt;
    st.start = start;
    st.carved = carve(grid, start, rng);

    if (np.imperfect > 0.0) {
        st.walls_removed = inject_imperfections(grid, np.imperfect, rng);
        st.islands_repaired = reconnect_islands(grid, rng);
    }

    if (np.reserve > 0.0) {
        st.reserves_cleared = clear_reservations(grid);
    }

    if (stats) *stats = st;
    return grid;
}

} // namespace mazegen
