#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace wordspace {

// Row-major dense matrix. Rows are vocabulary positions; columns are
// document or context positions depending on the matrix family.
template <typename T>
class DenseMatrix {
public:
    DenseMatrix() = default;
    DenseMatrix(size_t rows, size_t cols, T fill = T{})
        : m_rows(rows), m_cols(cols), m_data(rows * cols, fill) {}

    size_t rows() const { return m_rows; }
    size_t cols() const { return m_cols; }
    bool empty() const { return m_data.empty(); }

    T& operator()(size_t r, size_t c) { return m_data[r * m_cols + c]; }
    const T& operator()(size_t r, size_t c) const { return m_data[r * m_cols + c]; }

    const T& at(size_t r, size_t c) const {
        check(r, c);
        return m_data[r * m_cols + c];
    }

    T& at(size_t r, size_t c) {
        check(r, c);
        return m_data[r * m_cols + c];
    }

    std::vector<double> row(size_t r) const {
        if (r >= m_rows) throw std::out_of_range("row out of range: " + std::to_string(r));
        std::vector<double> v(m_cols);
        const T* p = m_data.data() + r * m_cols;
        for (size_t c = 0; c < m_cols; ++c) v[c] = static_cast<double>(p[c]);
        return v;
    }

    std::vector<double> col(size_t c) const {
        if (c >= m_cols) throw std::out_of_range("column out of range: " + std::to_string(c));
        std::vector<double> v(m_rows);
        for (size_t r = 0; r < m_rows; ++r) v[r] = static_cast<double>(m_data[r * m_cols + c]);
        return v;
    }

    // sums are accumulated in double so large count matrices never overflow
    double sum() const {
        double s = 0.0;
        for (const T& x : m_data) s += static_cast<double>(x);
        return s;
    }

    std::vector<double> row_sums() const {
        std::vector<double> out(m_rows, 0.0);
        for (size_t r = 0; r < m_rows; ++r) {
            const T* p = m_data.data() + r * m_cols;
            for (size_t c = 0; c < m_cols; ++c) out[r] += static_cast<double>(p[c]);
        }
        return out;
    }

    std::vector<double> col_sums() const {
        std::vector<double> out(m_cols, 0.0);
        for (size_t r = 0; r < m_rows; ++r) {
            const T* p = m_data.data() + r * m_cols;
            for (size_t c = 0; c < m_cols; ++c) out[c] += static_cast<double>(p[c]);
        }
        return out;
    }

    size_t count_nonzero() const {
        size_t n = 0;
        for (const T& x : m_data) if (x != T{}) ++n;
        return n;
    }

    const std::vector<T>& data() const { return m_data; }

private:
    size_t m_rows = 0;
    size_t m_cols = 0;
    std::vector<T> m_data;

    void check(size_t r, size_t c) const {
        if (r >= m_rows || c >= m_cols) {
            throw std::out_of_range("matrix index out of range: (" + std::to_string(r) + ", " +
                                    std::to_string(c) + ")");
        }
    }
};

using CountMatrix = DenseMatrix<uint32_t>;
using WeightMatrix = DenseMatrix<double>;

}  // namespace wordspace
