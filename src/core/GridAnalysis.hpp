#pragma once
#include <array>
#include <vector>
#include <algorithm>
#include <queue>
#include <optional>
#include <cstdint>
#include "MazeGrid.hpp"

/**
 * @file GridAnalysis.hpp
 * @brief Análise estrutural da grade gerada: caminhos BFS, componentes e laços.
 */

namespace mazegen {

/**
 * @brief Consultas sobre as passagens de uma `MazeGrid` (vizinhança 4, ciente de `wrap`).
 */
class GridAnalysis {
public:
    /**
     * @brief Encontra um caminho de passagens do início ao objetivo usando BFS.
     *
     * @param grid grade do labirinto
     * @param start posição inicial
     * @param goal  posição objetivo
     * @return sequência de pontos incluindo início e objetivo, ou std::nullopt se inalcançável
     */
    static std::optional<std::vector<Point>> bfs_path(const MazeGrid& grid, Point start, Point goal) {
        const int w = grid.width();
        if (!grid.in_bounds(start.x, start.y) || !grid.in_bounds(goal.x, goal.y)) return std::nullopt;
        if (grid.at(start.x, start.y) != Cell::Passage || grid.at(goal.x, goal.y) != Cell::Passage) return std::nullopt;
        std::vector<int> prev(static_cast<size_t>(w) * grid.height(), -1);
        std::vector<uint8_t> visited(prev.size(), 0);
        auto idx = [&](int x,int y){ return y*w + x; };
        std::queue<Point> q;
        q.push(start);
        visited[idx(start.x,start.y)] = 1;

        while(!q.empty()){
            Point p = q.front(); q.pop();
            if (p == goal) break;
            for (const Point& n : neighbors(grid, p)) {
                int j = idx(n.x, n.y);
                if (!visited[j] && grid.at(n.x, n.y) == Cell::Passage) { visited[j]=1; prev[j]=idx(p.x,p.y); q.push(n); }
            }
        }
        if (!visited[idx(goal.x,goal.y)]) return std::nullopt;
        std::vector<Point> path;
        for (int cur = idx(goal.x,goal.y); cur!=-1; cur = prev[cur]) {
            int x = cur % w; int y = cur / w; path.push_back({x,y});
            if (cur == idx(start.x,start.y)) break;
        }
        std::reverse(path.begin(), path.end()); // reconstrói do goal ao start
        return path;
    }

    /** @brief Número de componentes conexas de passagens. */
    static int count_components(const MazeGrid& grid) {
        const int w = grid.width();
        std::vector<uint8_t> visited(static_cast<size_t>(w) * grid.height(), 0);
        int components = 0;
        for (int y = 0; y < grid.height(); ++y) {
            for (int x = 0; x < w; ++x) {
                if (visited[y*w + x] || grid.at(x,y) != Cell::Passage) continue;
                ++components;
                // flood fill da componente
                std::queue<Point> q;
                q.push({x,y});
                visited[y*w + x] = 1;
                while (!q.empty()) {
                    Point p = q.front(); q.pop();
                    for (const Point& n : neighbors(grid, p)) {
                        int j = n.y*w + n.x;
                        if (!visited[j] && grid.at(n.x, n.y) == Cell::Passage) { visited[j] = 1; q.push(n); }
                    }
                }
            }
        }
        return components;
    }

    /** @brief Posições de célula (x,y ímpares) abertas. */
    static int count_open_cells(const MazeGrid& grid) {
        int n = 0;
        for (int y = 1; y < grid.height(); y += 2)
            for (int x = 1; x < grid.width(); x += 2)
                if (grid.at(x,y) == Cell::Passage) ++n;
        return n;
    }

    /** @brief Paredes entalhadas: posições abertas com exatamente uma coordenada ímpar. */
    static int count_connections(const MazeGrid& grid) {
        int n = 0;
        for (int y = 0; y < grid.height(); ++y)
            for (int x = 0; x < grid.width(); ++x)
                if (((x ^ y) & 1) && grid.at(x,y) == Cell::Passage) ++n;
        return n;
    }

    /** @brief Junções (x,y pares) com os quatro vizinhos diretos abertos. */
    static int count_islands(const MazeGrid& grid) {
        int n = 0;
        for (int y = 0; y < grid.height(); y += 2) {
            for (int x = 0; x < grid.width(); x += 2) {
                if (grid.at_wrapped(x, y+1) == Cell::Passage && grid.at_wrapped(x, y-1) == Cell::Passage &&
                    grid.at_wrapped(x+1, y) == Cell::Passage && grid.at_wrapped(x-1, y) == Cell::Passage) ++n;
            }
        }
        return n;
    }

    /**
     * @brief Verifica se as passagens formam uma árvore geradora (labirinto perfeito).
     *
     * Exige uma única componente e exatamente `células abertas - 1` conexões.
     */
    static bool is_perfect(const MazeGrid& grid) {
        const int cells = count_open_cells(grid);
        if (cells == 0) return false;
        return count_components(grid) == 1 && count_connections(grid) == cells - 1;
    }

private:
    /** @brief Vizinhos diretos de p: até quatro pontos válidos e sua quantidade. */
    struct Neighbors {
        std::array<Point, 4> pts{};
        int count{0};
        const Point* begin() const { return pts.data(); }
        const Point* end() const { return pts.data() + count; }
    };

    /** @brief Vizinhos diretos de p (com wrap quando a grade é toroidal). */
    static Neighbors neighbors(const MazeGrid& grid, Point p) {
        static const Point kDirs[4] = { {0,-1}, {1,0}, {0,1}, {-1,0} }; // N E S W
        Neighbors out;
        for (const Point& d : kDirs) {
            int x = p.x + d.x, y = p.y + d.y;
            if (grid.wraps()) { x = grid.wrap_x(x); y = grid.wrap_y(y); }
            if (grid.in_bounds(x, y)) out.pts[out.count++] = Point{x,y};
        }
        return out;
    }
};

} // namespace mazegen
