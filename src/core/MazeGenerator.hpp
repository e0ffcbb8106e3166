/**
 * @file MazeGenerator.hpp
 * @brief Gerador de labirintos por entalhe em profundidade com pilha explícita.
 *
 * Etapas, na ordem executada por `generate()`:
 * 1. normalização de dimensões;
 * 2. alocação da grade (tudo parede);
 * 3. reserva de regiões (esparsidade);
 * 4. entalhe DFS aleatório;
 * 5. injeção de imperfeições (laços);
 * 6. reconexão de ilhas 2x2;
 * 7. limpeza das reservas.
 *
 * Cada etapa recebe a grade por referência e não guarda acesso após retornar.
 */
#pragma once
#include <cstdint>
#include <optional>
#include "MazeGrid.hpp"
#include "RandomSource.hpp"

namespace mazegen {

/**
 * @brief Maior largura/altura aceita antes da correção de paridade.
 *
 * Pedidos acima são limitados a este valor; com a paridade a grade final tem
 * no máximo `kMaxDimension + 1` posições por eixo, e `w*h` ainda cabe em `int`.
 */
constexpr int kMaxDimension = 1 << 15;

/**
 * @brief Parâmetros de geração como pedidos pelo chamador.
 */
struct GenParams {
    int width{32};        ///< Largura pedida (<= 0 usa 32)
    int height{0};        ///< Altura pedida (<= 0 usa a largura)
    bool wrap{false};     ///< Topologia toroidal
    double imperfect{0.0};///< Fração de laços adicionais [0..1]
    double fill{1.0};     ///< Quanto do espaço o labirinto ocupa (1 = tudo)
};

/**
 * @brief Parâmetros após normalização (paridade e faixas garantidas).
 */
struct NormalizedParams {
    int width{33};
    int height{33};
    bool wrap{false};
    double imperfect{0.0}; ///< Em [0,1]
    double reserve{0.0};   ///< Probabilidade de reserva por célula
};

/**
 * @brief Entrada da pilha de fronteira: célula candidata e passo de chegada.
 */
struct FrontierEntry {
    Point cell{};
    Point step{};
};

/**
 * @brief Estatísticas de uma geração (opcional, para log e testes).
 */
struct GenStats {
    int width{0};
    int height{0};
    Point start{};
    int reserved{0};        ///< Células marcadas como reservadas
    int carved{0};          ///< Células abertas pelo entalhe
    int walls_removed{0};   ///< Paredes removidas pela imperfeição
    int islands_repaired{0};///< Ilhas desfeitas
    int reserves_cleared{0};///< Reservas nunca alcançadas, devolvidas a parede
};

/**
 * @brief Fachada estática com as etapas do gerador.
 */
class MazeGenerator {
public:
    /**
     * @brief Aplica defaults, faixas e paridade aos parâmetros pedidos.
     *
     * Largura/altura são limitadas a `kMaxDimension` e depois viram pares quando
     * `wrap`, ímpares caso contrário, sempre arredondando para cima. Reserva = 1 - clamp(fill*0.9 + 0.1, 0, 1).
     */
    static NormalizedParams normalize(const GenParams& p);

    /** @brief Aloca a grade normalizada com todas as posições em parede. */
    static MazeGrid allocate(const NormalizedParams& np);

    /**
     * @brief Marca cada célula (x,y ímpares) como reservada com probabilidade `reserve`.
     * @return quantidade de células reservadas
     */
    static int reserve_regions(MazeGrid& grid, double reserve, RandomSource& rng);

    /**
     * @brief Escolhe a célula inicial do entalhe.
     *
     * Tenta a célula central; se ocupada, sorteia com limite de tentativas e por
     * fim varre a grade. Sem nenhuma célula em parede, registra erro fatal.
     *
     * @param grid grade após a reserva
     * @param rng fonte de aleatoriedade
     * @param out ponteiro de saída para a célula escolhida
     * @return false se não houver célula inexplorada (configuração degenerada)
     */
    static bool choose_start(const MazeGrid& grid, RandomSource& rng, Point* out);

    /**
     * @brief Entalha a partir de `start` com DFS aleatório sobre pilha explícita.
     * @return quantidade de células abertas
     */
    static int carve(MazeGrid& grid, Point start, RandomSource& rng);

    /**
     * @brief Remove paredes aleatórias adjacentes a passagens, criando laços.
     * @param imperfect fração em [0,1]; nada é feito para valores <= 0
     * @return quantidade de paredes removidas
     */
    static int inject_imperfections(MazeGrid& grid, double imperfect, RandomSource& rng);

    /**
     * @brief Restaura uma parede ao redor de cada junção totalmente aberta.
     * @return quantidade de ilhas reparadas
     */
    static int reconnect_islands(MazeGrid& grid, RandomSource& rng);

    /** @brief Converte reservas remanescentes em parede. @return quantidade convertida */
    static int clear_reservations(MazeGrid& grid);

    /**
     * @brief Executa todas as etapas e devolve a grade final.
     *
     * @param p parâmetros pedidos
     * @param rng fonte de aleatoriedade injetada
     * @param stats saída opcional de estatísticas
     * @return grade só com `Wall`/`Passage`, ou std::nullopt se não houver célula inicial
     */
    static std::optional<MazeGrid> generate(const GenParams& p, RandomSource& rng, GenStats* stats = nullptr);
};

} // namespace mazegen
