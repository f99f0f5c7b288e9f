#include "vector.hpp"
#include <algorithm>
#include <cmath>

namespace hybridmem {

Embedding l2_normalize(const Embedding& v) {
    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * static_cast<double>(x);
    }
    norm = std::sqrt(norm);
    if (norm == 0.0) norm = 1.0;

    Embedding out;
    out.reserve(v.size());
    for (float x : v) {
        out.push_back(static_cast<float>(static_cast<double>(x) / norm));
    }
    return out;
}

double dot_product(const float* a, size_t a_len, const float* b, size_t b_len) {
    size_t n = std::min(a_len, b_len);
    double dot = 0.0;
    for (size_t i = 0; i < n; i++) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return dot;
}

void EmbeddingMatrix::resize_cols(size_t width) {
    if (width <= cols_) return;

    std::vector<float> widened(rows_ * width, 0.0f);
    for (size_t r = 0; r < rows_; r++) {
        std::copy(data_.begin() + static_cast<ptrdiff_t>(r * cols_),
                  data_.begin() + static_cast<ptrdiff_t>((r + 1) * cols_),
                  widened.begin() + static_cast<ptrdiff_t>(r * width));
    }
    data_ = std::move(widened);
    cols_ = width;
}

void EmbeddingMatrix::write_row(size_t index, const Embedding& row) {
    if (row.size() > cols_) resize_cols(row.size());

    auto dst = data_.begin() + static_cast<ptrdiff_t>(index * cols_);
    std::copy(row.begin(), row.end(), dst);
    std::fill(dst + static_cast<ptrdiff_t>(row.size()),
              dst + static_cast<ptrdiff_t>(cols_), 0.0f);
}

size_t EmbeddingMatrix::append_row(const Embedding& row) {
    // A first row defines the width
    if (rows_ == 0) cols_ = row.size();

    data_.resize((rows_ + 1) * cols_, 0.0f);
    rows_++;
    write_row(rows_ - 1, row);
    return rows_ - 1;
}

void EmbeddingMatrix::set_row(size_t index, const Embedding& row) {
    if (index >= rows_) return;
    write_row(index, row);
}

Embedding EmbeddingMatrix::row(size_t index) const {
    if (index >= rows_) return {};
    const float* p = row_data(index);
    return Embedding(p, p + cols_);
}

} // namespace hybridmem
