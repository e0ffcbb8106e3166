/**
 * @file tests/test_normalize.cpp
 * @brief Testes da normalização de parâmetros (defaults, faixas e paridade).
 *
 * Como executar:
 * - Via CTest: `ctest -R test_normalize`
 * - Ou executando diretamente o binário deste teste.
 */
#include "unity.h"
#include "core/MazeGenerator.hpp"
#include <cmath>
#include <limits>

using namespace mazegen;

void setUp() {}
void tearDown() {}

static GenParams params(int w, int h, bool wrap, double imperfect = 0.0, double fill = 1.0) {
    GenParams p; p.width = w; p.height = h; p.wrap = wrap; p.imperfect = imperfect; p.fill = fill; return p;
}

void test_defaults_give_odd_33_square() {
    NormalizedParams np = MazeGenerator::normalize(GenParams{});
    TEST_ASSERT_EQUAL_INT(33, np.width);
    TEST_ASSERT_EQUAL_INT(33, np.height);
    TEST_ASSERT_FALSE(np.wrap);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, (float)np.imperfect);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, (float)np.reserve);
}

void test_missing_dimensions_use_defaults() {
    // largura <= 0 vira 32; altura <= 0 copia a largura
    NormalizedParams a = MazeGenerator::normalize(params(0, 0, true));
    TEST_ASSERT_EQUAL_INT(32, a.width);
    TEST_ASSERT_EQUAL_INT(32, a.height);
    NormalizedParams b = MazeGenerator::normalize(params(-7, 0, false));
    TEST_ASSERT_EQUAL_INT(33, b.width);
    TEST_ASSERT_EQUAL_INT(33, b.height);
    NormalizedParams c = MazeGenerator::normalize(params(10, 0, true));
    TEST_ASSERT_EQUAL_INT(10, c.height);
}

void test_parity_rounds_up() {
    NormalizedParams odd = MazeGenerator::normalize(params(5, 5, false));
    TEST_ASSERT_EQUAL_INT(5, odd.width);
    TEST_ASSERT_EQUAL_INT(5, odd.height);

    NormalizedParams bumped = MazeGenerator::normalize(params(6, 8, false));
    TEST_ASSERT_EQUAL_INT(7, bumped.width);
    TEST_ASSERT_EQUAL_INT(9, bumped.height);

    NormalizedParams wrap_odd = MazeGenerator::normalize(params(5, 7, true));
    TEST_ASSERT_EQUAL_INT(6, wrap_odd.width);
    TEST_ASSERT_EQUAL_INT(8, wrap_odd.height);

    NormalizedParams wrap_even = MazeGenerator::normalize(params(6, 4, true));
    TEST_ASSERT_EQUAL_INT(6, wrap_even.width);
    TEST_ASSERT_EQUAL_INT(4, wrap_even.height);
}

void test_imperfect_is_clamped() {
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, (float)MazeGenerator::normalize(params(9, 9, false, -0.5)).imperfect);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, (float)MazeGenerator::normalize(params(9, 9, false, 2.0)).imperfect);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.25f, (float)MazeGenerator::normalize(params(9, 9, false, 0.25)).imperfect);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, (float)MazeGenerator::normalize(params(9, 9, false, nan)).imperfect);
}

void test_reserve_derived_from_fill() {
    // reserve = 1 - clamp(fill*0.9 + 0.1, 0, 1)
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.9f,  (float)MazeGenerator::normalize(params(9, 9, false, 0.0, 0.0)).reserve);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.45f, (float)MazeGenerator::normalize(params(9, 9, false, 0.0, 0.5)).reserve);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f,  (float)MazeGenerator::normalize(params(9, 9, false, 0.0, 3.0)).reserve);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f,  (float)MazeGenerator::normalize(params(9, 9, false, 0.0, -1.0)).reserve);
}

void test_oversized_dimensions_are_clamped() {
    const int big = std::numeric_limits<int>::max();
    NormalizedParams wrap = MazeGenerator::normalize(params(big, big, true));
    TEST_ASSERT_EQUAL_INT(kMaxDimension, wrap.width);
    TEST_ASSERT_EQUAL_INT(kMaxDimension, wrap.height);
    TEST_ASSERT_EQUAL_INT(0, wrap.width & 1);

    NormalizedParams bounded = MazeGenerator::normalize(params(big, kMaxDimension + 10, false));
    TEST_ASSERT_EQUAL_INT(kMaxDimension + 1, bounded.width);
    TEST_ASSERT_EQUAL_INT(kMaxDimension + 1, bounded.height);
    TEST_ASSERT_EQUAL_INT(1, bounded.width & 1);

    // altura ausente copia a largura já limitada
    NormalizedParams copied = MazeGenerator::normalize(params(big - 1, 0, true));
    TEST_ASSERT_EQUAL_INT(kMaxDimension, copied.height);
}

void test_allocate_fills_with_walls() {
    NormalizedParams np = MazeGenerator::normalize(params(7, 5, false));
    MazeGrid g = MazeGenerator::allocate(np);
    TEST_ASSERT_EQUAL_INT(7, g.width());
    TEST_ASSERT_EQUAL_INT(5, g.height());
    TEST_ASSERT_EQUAL_INT(7 * 5, g.count(Cell::Wall));
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_defaults_give_odd_33_square);
    RUN_TEST(test_missing_dimensions_use_defaults);
    RUN_TEST(test_parity_rounds_up);
    RUN_TEST(test_imperfect_is_clamped);
    RUN_TEST(test_reserve_derived_from_fill);
    RUN_TEST(test_oversized_dimensions_are_clamped);
    RUN_TEST(test_allocate_fills_with_walls);
    return UNITY_END();
}
