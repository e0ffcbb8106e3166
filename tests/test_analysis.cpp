#include "unity.h"
#include "core/GridAnalysis.hpp"

using namespace mazegen;

void setUp() {}
void tearDown() {}

static MazeGrid small_open_grid() {
    MazeGrid m(7,5); // interior 5x3 todo aberto, anel externo em parede
    for (int y=1;y<4;++y) for (int x=1;x<6;++x) m.at(x,y) = Cell::Passage;
    return m;
}

void test_bfs_finds_path_in_open_grid() {
    MazeGrid m = small_open_grid();
    auto path = GridAnalysis::bfs_path(m, {1,1}, {5,3});
    TEST_ASSERT_TRUE(path.has_value());
    TEST_ASSERT_EQUAL_INT(7, (int)path->size());
    // Start and goal endpoints
    TEST_ASSERT_EQUAL_INT(1, path->front().x);
    TEST_ASSERT_EQUAL_INT(1, path->front().y);
    TEST_ASSERT_EQUAL_INT(5, path->back().x);
    TEST_ASSERT_EQUAL_INT(3, path->back().y);
}

void test_bfs_respects_walls() {
    MazeGrid m = small_open_grid();
    // Parede vertical em x=3 deixando só a passagem de baixo
    m.at(3,1) = Cell::Wall;
    m.at(3,2) = Cell::Wall;
    auto path = GridAnalysis::bfs_path(m, {2,1}, {4,1});
    TEST_ASSERT_TRUE(path.has_value());
    // desvio por y=3: 2,1 -> 2,2 -> 2,3 -> 3,3 -> 4,3 -> 4,2 -> 4,1
    TEST_ASSERT_EQUAL_INT(7, (int)path->size());
    for (const Point& p : *path) TEST_ASSERT_TRUE(m.at(p.x,p.y) == Cell::Passage);
}

void test_bfs_unreachable_and_invalid() {
    MazeGrid m = small_open_grid();
    for (int y=1;y<4;++y) m.at(3,y) = Cell::Wall;
    TEST_ASSERT_FALSE(GridAnalysis::bfs_path(m, {1,1}, {5,1}).has_value());
    TEST_ASSERT_FALSE(GridAnalysis::bfs_path(m, {0,0}, {1,1}).has_value()); // início em parede
    TEST_ASSERT_FALSE(GridAnalysis::bfs_path(m, {-1,2}, {1,1}).has_value());
    TEST_ASSERT_EQUAL_INT(2, GridAnalysis::count_components(m));
}

void test_bfs_uses_wrap_edges() {
    MazeGrid m(6,2,true);
    for (int x=0;x<6;++x) m.at(x,1) = Cell::Passage;
    auto path = GridAnalysis::bfs_path(m, {5,1}, {0,1});
    TEST_ASSERT_TRUE(path.has_value());
    TEST_ASSERT_EQUAL_INT(2, (int)path->size());

    MazeGrid bounded(6,2,false);
    for (int x=0;x<6;++x) bounded.at(x,1) = Cell::Passage;
    auto longer = GridAnalysis::bfs_path(bounded, {5,1}, {0,1});
    TEST_ASSERT_TRUE(longer.has_value());
    TEST_ASSERT_EQUAL_INT(6, (int)longer->size());
}

void test_neighbors_at_corners_and_seams() {
    MazeGrid plain(3,3);
    for (int y=0;y<3;++y) for (int x=0;x<3;++x) plain.at(x,y) = Cell::Passage;
    auto corner = GridAnalysis::bfs_path(plain, {0,0}, {2,2});
    TEST_ASSERT_TRUE(corner.has_value());
    TEST_ASSERT_EQUAL_INT(5, (int)corner->size());
    TEST_ASSERT_EQUAL_INT(1, GridAnalysis::count_components(plain));

    MazeGrid torus(4,4,true);
    for (int y=0;y<4;++y) for (int x=0;x<4;++x) torus.at(x,y) = Cell::Passage;
    auto seam = GridAnalysis::bfs_path(torus, {0,0}, {3,3});
    TEST_ASSERT_TRUE(seam.has_value());
    TEST_ASSERT_EQUAL_INT(3, (int)seam->size()); // atravessa as duas bordas
}

void test_counts_on_handmade_tree() {
    MazeGrid m(7,5);
    // três células em L ligadas por duas paredes abertas
    const Point open[] = { {1,1},{2,1},{3,1},{3,2},{3,3} };
    for (const Point& p : open) m.at(p.x,p.y) = Cell::Passage;
    TEST_ASSERT_EQUAL_INT(3, GridAnalysis::count_open_cells(m));
    TEST_ASSERT_EQUAL_INT(2, GridAnalysis::count_connections(m));
    TEST_ASSERT_EQUAL_INT(1, GridAnalysis::count_components(m));
    TEST_ASSERT_EQUAL_INT(0, GridAnalysis::count_islands(m));
    TEST_ASSERT_TRUE(GridAnalysis::is_perfect(m));

    m.at(5,3) = Cell::Passage; // célula solta
    TEST_ASSERT_FALSE(GridAnalysis::is_perfect(m));
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_bfs_finds_path_in_open_grid);
    RUN_TEST(test_bfs_respects_walls);
    RUN_TEST(test_bfs_unreachable_and_invalid);
    RUN_TEST(test_bfs_uses_wrap_edges);
    RUN_TEST(test_neighbors_at_corners_and_seams);
    RUN_TEST(test_counts_on_handmade_tree);
    return UNITY_END();
}
