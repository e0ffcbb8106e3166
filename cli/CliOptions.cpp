#include "CliOptions.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include "core/GridAnalysis.hpp"

namespace mazegen {

void print_usage(const char* argv0) {
    std::printf("uso: %s [opcoes]\n", argv0);
    std::printf("  -w, --width N      largura pedida, 0..%d (default %d)\n", kMaxDimension, MAZEGEN_DEFAULT_WIDTH);
    std::printf("  -H, --height N     altura pedida, 0..%d (default = largura)\n", kMaxDimension);
    std::printf("      --wrap         topologia toroidal\n");
    std::printf("  -i, --imperfect F  fracao de lacos [0..1] (default 0)\n");
    std::printf("  -f, --fill F       preenchimento (default 1)\n");
    std::printf("  -s, --seed N       semente (ou MAZEGEN_SEED)\n");
    std::printf("      --hall N       largura dos corredores, 1..%d (default %d)\n", kMaxThickness, MAZEGEN_DEFAULT_HALL);
    std::printf("      --wall N       largura das paredes, 1..%d (default %d)\n", kMaxThickness, MAZEGEN_DEFAULT_WALL);
    std::printf("      --solve        marca o caminho entre a primeira e a ultima celula\n");
    std::printf("  -v                 estatisticas em stderr\n");
    std::printf("  -h, --help         esta ajuda\n");
}

/** @brief strtol completo com faixa [lo, hi]. */
static bool parse_int(const char* s, long lo, long hi, long* out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (v < lo || v > hi) return false;
    *out = v;
    return true;
}

static bool parse_double(const char* s, double* out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (errno != 0 || *end != '\0') return false;
    *out = v;
    return true;
}

static const long kMaxSeed = 4294967295L;

bool seed_from_env(uint32_t* out) {
    const char* env = std::getenv("MAZEGEN_SEED");
    long v = 0;
    if (!env) return false;
    if (!parse_int(env, 0, kMaxSeed, &v)) {
        std::fprintf(stderr, "MAZEGEN: MAZEGEN_SEED invalida (%s), ignorada\n", env);
        return false;
    }
    *out = static_cast<uint32_t>(v);
    return true;
}

bool parse_args(int argc, char** argv, CliOptions& opt) {
    opt = CliOptions{};
    opt.gen.width = MAZEGEN_DEFAULT_WIDTH;
    (void)seed_from_env(&opt.seed);

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto is = [&](const char* s, const char* l) { return std::strcmp(a, s) == 0 || (l && std::strcmp(a, l) == 0); };
        auto value = [&]() -> const char* { return (i + 1 < argc) ? argv[++i] : nullptr; };
        long n = 0;
        double f = 0.0;

        if (is("-h", "--help")) { opt.help = true; }
        else if (is("-v", nullptr)) { opt.verbose = true; }
        else if (is("--wrap", nullptr)) { opt.gen.wrap = true; }
        else if (is("--solve", nullptr)) { opt.solve = true; }
        else if (is("-w", "--width")) {
            if (!parse_int(value(), 0, kMaxDimension, &n)) { std::fprintf(stderr, "ERRO: %s requer inteiro em 0..%d\n", a, kMaxDimension); return false; }
            opt.gen.width = static_cast<int>(n);
        } else if (is("-H", "--height")) {
            if (!parse_int(value(), 0, kMaxDimension, &n)) { std::fprintf(stderr, "ERRO: %s requer inteiro em 0..%d\n", a, kMaxDimension); return false; }
            opt.gen.height = static_cast<int>(n);
        } else if (is("-i", "--imperfect")) {
            if (!parse_double(value(), &f)) { std::fprintf(stderr, "ERRO: %s requer numero\n", a); return false; }
            opt.gen.imperfect = f;
        } else if (is("-f", "--fill")) {
            if (!parse_double(value(), &f)) { std::fprintf(stderr, "ERRO: %s requer numero\n", a); return false; }
            opt.gen.fill = f;
        } else if (is("-s", "--seed")) {
            if (!parse_int(value(), 0, kMaxSeed, &n)) { std::fprintf(stderr, "ERRO: %s requer inteiro em 0..%ld\n", a, kMaxSeed); return false; }
            opt.seed = static_cast<uint32_t>(n);
        } else if (is("--hall", nullptr)) {
            if (!parse_int(value(), 1, kMaxThickness, &n)) { std::fprintf(stderr, "ERRO: %s requer inteiro em 1..%d\n", a, kMaxThickness); return false; }
            opt.hall = static_cast<int>(n);
        } else if (is("--wall", nullptr)) {
            if (!parse_int(value(), 1, kMaxThickness, &n)) { std::fprintf(stderr, "ERRO: %s requer inteiro em 1..%d\n", a, kMaxThickness); return false; }
            opt.wall = static_cast<int>(n);
        } else {
            std::fprintf(stderr, "ERRO: argumento desconhecido: %s\n", a);
            return false;
        }
    }
    return true;
}

int mark_solution(MazeGrid& grid) {
    std::optional<Point> first, last;
    for (int y = 1; y < grid.height(); y += 2) {
        for (int x = 1; x < grid.width(); x += 2) {
            if (grid.at(x, y) != Cell::Passage) continue;
            if (!first) first = Point{x, y};
            last = Point{x, y};
        }
    }
    if (!first || !last) return 0;
    auto path = GridAnalysis::bfs_path(grid, *first, *last);
    if (!path) return 0;
    for (const Point& p : *path) grid.at(p.x, p.y) = Cell::Marker;
    return static_cast<int>(path->size());
}

} // namespace mazegen
