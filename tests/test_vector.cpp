#include <catch2/catch_test_macros.hpp>
#include "memory/vector.hpp"
#include <cmath>

using namespace hybridmem;

static double norm_of(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * static_cast<double>(x);
    return std::sqrt(sum);
}

// ── l2_normalize ─────────────────────────────────────────────

TEST_CASE("l2_normalize: result has unit norm", "[vector]") {
    auto v = l2_normalize({3.0f, 4.0f});
    REQUIRE(std::abs(v[0] - 0.6f) < 1e-6f);
    REQUIRE(std::abs(v[1] - 0.8f) < 1e-6f);
    REQUIRE(std::abs(norm_of(v) - 1.0) < 1e-6);
}

TEST_CASE("l2_normalize: zero vector comes back unchanged", "[vector]") {
    auto v = l2_normalize({0.0f, 0.0f, 0.0f});
    REQUIRE(v == Embedding{0.0f, 0.0f, 0.0f});
}

TEST_CASE("l2_normalize: empty vector stays empty", "[vector]") {
    REQUIRE(l2_normalize({}).empty());
}

// ── dot_product ──────────────────────────────────────────────

TEST_CASE("dot_product: missing components count as zero", "[vector]") {
    Embedding a = {1.0f, 2.0f};
    Embedding b = {3.0f, 4.0f, 5.0f};
    REQUIRE(dot_product(a.data(), a.size(), b.data(), b.size()) == 11.0);
    REQUIRE(dot_product(b.data(), b.size(), a.data(), a.size()) == 11.0);
}

// ── EmbeddingMatrix ──────────────────────────────────────────

TEST_CASE("EmbeddingMatrix: first row defines width", "[vector]") {
    EmbeddingMatrix m;
    REQUIRE(m.empty());
    REQUIRE(m.append_row({1.0f, 2.0f, 3.0f}) == 0);
    REQUIRE(m.rows() == 1);
    REQUIRE(m.cols() == 3);
    REQUIRE(m.row(0) == Embedding{1.0f, 2.0f, 3.0f});
}

TEST_CASE("EmbeddingMatrix: narrower row is zero-padded", "[vector]") {
    EmbeddingMatrix m;
    m.append_row({1.0f, 2.0f, 3.0f});
    m.append_row({4.0f});
    REQUIRE(m.cols() == 3);
    REQUIRE(m.row(1) == Embedding{4.0f, 0.0f, 0.0f});
}

TEST_CASE("EmbeddingMatrix: wider row widens every stored row", "[vector]") {
    EmbeddingMatrix m;
    m.append_row({1.0f, 2.0f});
    m.append_row({3.0f, 4.0f});
    m.append_row({5.0f, 6.0f, 7.0f, 8.0f});
    REQUIRE(m.cols() == 4);
    REQUIRE(m.row(0) == Embedding{1.0f, 2.0f, 0.0f, 0.0f});
    REQUIRE(m.row(1) == Embedding{3.0f, 4.0f, 0.0f, 0.0f});
    REQUIRE(m.row(2) == Embedding{5.0f, 6.0f, 7.0f, 8.0f});
}

TEST_CASE("EmbeddingMatrix: set_row overwrites and clears stale columns", "[vector]") {
    EmbeddingMatrix m;
    m.append_row({1.0f, 2.0f, 3.0f});
    m.set_row(0, {9.0f});
    REQUIRE(m.row(0) == Embedding{9.0f, 0.0f, 0.0f});
}

TEST_CASE("EmbeddingMatrix: set_row with a wider row widens the matrix", "[vector]") {
    EmbeddingMatrix m;
    m.append_row({1.0f});
    m.append_row({2.0f});
    m.set_row(1, {7.0f, 8.0f});
    REQUIRE(m.cols() == 2);
    REQUIRE(m.row(0) == Embedding{1.0f, 0.0f});
    REQUIRE(m.row(1) == Embedding{7.0f, 8.0f});
}

TEST_CASE("EmbeddingMatrix: out of range row is empty", "[vector]") {
    EmbeddingMatrix m;
    m.append_row({1.0f});
    REQUIRE(m.row(5).empty());
}
