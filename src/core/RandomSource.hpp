/**
 * @file RandomSource.hpp
 * @brief Interface da fonte de aleatoriedade injetada no gerador.
 *
 * O gerador nunca lê uma fonte global: todo sorteio passa por uma
 * `RandomSource` recebida por referência, o que torna a geração
 * reprodutível para uma mesma semente.
 *
 * Troque a implementação derivando outra classe (ex.: sequência fixa nos testes).
 *
 * @since 0.1
 */
#pragma once
#include <cstdint>
#include <random>

namespace mazegen {

/**
 * @brief Fonte de números uniformes em [0,1).
 *
 * Thread-safety: não é thread-safe; cada geração usa a sua própria instância.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** @brief Próximo valor uniforme em [0,1). */
    virtual double next_unit() = 0;

    /**
     * @brief Inteiro uniforme em [0, n).
     * @param n limite superior exclusivo; para n <= 1 retorna 0 (ainda consome um sorteio)
     */
    int next_below(int n) {
        int k = static_cast<int>(next_unit() * n);
        if (k >= n) k = n - 1;
        if (k < 0) k = 0;
        return k;
    }

    /** @brief true com probabilidade p. */
    bool chance(double p) { return next_unit() < p; }
};

/**
 * @brief Implementação padrão sobre `std::mt19937`.
 */
class Mt19937Random : public RandomSource {
public:
    /** @param seed semente do gerador */
    explicit Mt19937Random(uint32_t seed) : rng_(seed) {}

    double next_unit() override {
        // 32 bits por sorteio, escala exata para [0,1)
        return static_cast<double>(rng_()) / 4294967296.0;
    }

    /** @brief Reinicia a sequência com uma nova semente. */
    void reseed(uint32_t seed) { rng_.seed(seed); }

private:
    std::mt19937 rng_; ///< Gerador Mersenne Twister
};

} // namespace mazegen
