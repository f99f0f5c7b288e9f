#pragma once
#include "../embedder.hpp"
#include <cstddef>
#include <vector>

namespace hybridmem {

// Scale to unit L2 norm. A zero vector is treated as having norm 1 and
// comes back unchanged.
Embedding l2_normalize(const Embedding& v);

// Dot product over the common prefix; missing trailing components count as zero.
double dot_product(const float* a, size_t a_len, const float* b, size_t b_len);

// Row-major, growable matrix of embeddings. All rows share one width.
//
// Width drift is reconciled instead of rejected: a wider incoming row widens
// every stored row with zeros, a narrower one is zero-padded to the current
// width. This is a compatibility shim for encoders whose output width changes,
// not a correctness guarantee.
class EmbeddingMatrix {
public:
    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return rows_ == 0; }

    // Append a row, reconciling widths. Returns the new row index.
    size_t append_row(const Embedding& row);

    // Overwrite an existing row, reconciling widths.
    void set_row(size_t index, const Embedding& row);

    const float* row_data(size_t index) const { return data_.data() + index * cols_; }
    Embedding row(size_t index) const;

    // Widen every row to `width` columns, zero-filling the new columns.
    // No-op if `width` is not larger than the current width.
    void resize_cols(size_t width);

private:
    void write_row(size_t index, const Embedding& row);

    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<float> data_;
};

} // namespace hybridmem
