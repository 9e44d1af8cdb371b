#pragma once

#include "dense_matrix.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tactile::fem::detail
{
    struct Triplet
    {
        int row{0};
        int col{0};
        double value{0.0};
    };

    // Stores explicit triplets produced during assembly. Repeated (row, col)
    // pairs are allowed and accumulate when compressed.
    struct CooMatrix
    {
        std::size_t dimension{0};
        std::vector<Triplet> entries{};

        void add(std::size_t row, std::size_t col, double value)
        {
            entries.push_back(Triplet{static_cast<int>(row), static_cast<int>(col), value});
        }
    };

    // Canonical sparse matrix for CPU solves. Column indices are unique and
    // ascending inside every row.
    class CsrMatrix
    {
    public:
        CsrMatrix() = default;

        CsrMatrix(std::size_t dimension, std::vector<int> row_ptr, std::vector<int> col_idx, std::vector<double> values)
            : m_dimension(dimension)
            , m_row_ptr(std::move(row_ptr))
            , m_col_idx(std::move(col_idx))
            , m_values(std::move(values))
        {
            validate();
        }

        // Duplicates are summed after sorting by (row, col, value), so the
        // result is bit-identical for any permutation of the same triplets.
        [[nodiscard]] static CsrMatrix build(CooMatrix coo)
        {
            const auto n = coo.dimension;
            if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
            {
                throw std::invalid_argument("CSR dimension exceeds index range");
            }

            for (const auto& entry : coo.entries)
            {
                if (entry.row < 0 || entry.col < 0 || static_cast<std::size_t>(entry.row) >= n || static_cast<std::size_t>(entry.col) >= n)
                {
                    throw std::out_of_range("Triplet references an entry outside the matrix");
                }
                if (!std::isfinite(entry.value))
                {
                    throw std::invalid_argument("Triplet value must be finite");
                }
            }

            std::sort(coo.entries.begin(), coo.entries.end(), [](const Triplet& lhs, const Triplet& rhs) {
                if (lhs.row != rhs.row)
                {
                    return lhs.row < rhs.row;
                }
                if (lhs.col != rhs.col)
                {
                    return lhs.col < rhs.col;
                }
                if (lhs.value != rhs.value)
                {
                    return lhs.value < rhs.value;
                }
                return std::signbit(lhs.value) && !std::signbit(rhs.value);
            });

            std::vector<int> row_ptr(n + 1, 0);
            std::vector<int> col_idx;
            std::vector<double> values;
            col_idx.reserve(coo.entries.size() / 2 + 1);
            values.reserve(coo.entries.size() / 2 + 1);

            std::size_t idx = 0;
            while (idx < coo.entries.size())
            {
                const auto& first = coo.entries[idx];
                double sum = first.value;
                std::size_t next = idx + 1;
                while (next < coo.entries.size() && coo.entries[next].row == first.row && coo.entries[next].col == first.col)
                {
                    sum += coo.entries[next].value;
                    ++next;
                }
                col_idx.push_back(first.col);
                values.push_back(sum);
                ++row_ptr[static_cast<std::size_t>(first.row) + 1];
                idx = next;
            }

            for (std::size_t row = 0; row < n; ++row)
            {
                row_ptr[row + 1] += row_ptr[row];
            }

            return CsrMatrix(n, std::move(row_ptr), std::move(col_idx), std::move(values));
        }

        [[nodiscard]] std::size_t dimension() const noexcept { return m_dimension; }
        [[nodiscard]] std::size_t non_zeros() const noexcept { return m_values.size(); }
        [[nodiscard]] const std::vector<int>& row_ptr() const noexcept { return m_row_ptr; }
        [[nodiscard]] const std::vector<int>& col_idx() const noexcept { return m_col_idx; }
        [[nodiscard]] const std::vector<double>& values() const noexcept { return m_values; }

        // Binary search inside the row's column slice; absent entries read as 0.
        [[nodiscard]] double get(std::size_t row, std::size_t column) const
        {
            if (row >= m_dimension || column >= m_dimension)
            {
                throw std::out_of_range("CSR lookup outside the matrix");
            }
            const auto begin = m_col_idx.begin() + m_row_ptr[row];
            const auto end = m_col_idx.begin() + m_row_ptr[row + 1];
            const auto it = std::lower_bound(begin, end, static_cast<int>(column));
            if (it == end || *it != static_cast<int>(column))
            {
                return 0.0;
            }
            return m_values[static_cast<std::size_t>(it - m_col_idx.begin())];
        }

        [[nodiscard]] DenseMatrix to_dense() const
        {
            DenseMatrix dense(m_dimension);
            for (std::size_t row = 0; row < m_dimension; ++row)
            {
                const auto row_begin = static_cast<std::size_t>(m_row_ptr[row]);
                const auto row_end = static_cast<std::size_t>(m_row_ptr[row + 1]);
                for (std::size_t idx = row_begin; idx < row_end; ++idx)
                {
                    const auto column = static_cast<std::size_t>(m_col_idx[idx]);
                    dense(row, column) = m_values[idx];
                }
            }
            return dense;
        }

    private:
        void validate() const
        {
            if (m_row_ptr.size() != m_dimension + 1)
            {
                throw std::invalid_argument("CSR row pointer length must equal dimension + 1");
            }
            if (m_col_idx.size() != m_values.size())
            {
                throw std::invalid_argument("CSR column and value arrays must have identical sizes");
            }
            if (m_row_ptr.front() != 0 || static_cast<std::size_t>(m_row_ptr.back()) != m_values.size())
            {
                throw std::invalid_argument("CSR row pointers must span the value array");
            }
            for (std::size_t row = 0; row < m_dimension; ++row)
            {
                if (m_row_ptr[row + 1] < m_row_ptr[row])
                {
                    throw std::invalid_argument("CSR row pointers must be non-decreasing");
                }
                for (int idx = m_row_ptr[row]; idx < m_row_ptr[row + 1]; ++idx)
                {
                    const int column = m_col_idx[static_cast<std::size_t>(idx)];
                    if (column < 0 || static_cast<std::size_t>(column) >= m_dimension)
                    {
                        throw std::out_of_range("CSR column index outside the matrix");
                    }
                    if (idx > m_row_ptr[row] && m_col_idx[static_cast<std::size_t>(idx) - 1] >= column)
                    {
                        throw std::invalid_argument("CSR column indices must be strictly ascending within a row");
                    }
                }
            }
        }

        std::size_t m_dimension{0};
        std::vector<int> m_row_ptr{0};
        std::vector<int> m_col_idx{};
        std::vector<double> m_values{};
    };

    inline void multiply(const CsrMatrix& csr, const std::vector<double>& x, std::vector<double>& result)
    {
        const auto n = csr.dimension();
        if (x.size() != n)
        {
            throw std::invalid_argument("CSR multiply: vector length does not match the matrix");
        }
        result.assign(n, 0.0);

        const auto& row_ptr = csr.row_ptr();
        const auto& col_idx = csr.col_idx();
        const auto& values = csr.values();

        for (std::size_t row = 0; row < n; ++row)
        {
            const auto begin = static_cast<std::size_t>(row_ptr[row]);
            const auto end = static_cast<std::size_t>(row_ptr[row + 1]);
            double sum = 0.0;
            for (std::size_t idx = begin; idx < end; ++idx)
            {
                const auto column = static_cast<std::size_t>(col_idx[idx]);
                sum += values[idx] * x[column];
            }
            result[row] = sum;
        }
    }

    [[nodiscard]] inline std::vector<double> multiply(const CsrMatrix& csr, const std::vector<double>& x)
    {
        std::vector<double> result;
        multiply(csr, x, result);
        return result;
    }

    inline std::vector<double> diagonal(const CsrMatrix& csr)
    {
        const auto n = csr.dimension();
        std::vector<double> diag(n, 0.0);
        for (std::size_t row = 0; row < n; ++row)
        {
            diag[row] = csr.get(row, row);
        }
        return diag;
    }

    // Keeps the rows and columns whose `reduced_index` is non-negative and
    // renumbers them. The mapping is monotone, so column order is preserved.
    inline CsrMatrix extract_block(const CsrMatrix& csr, const std::vector<int>& reduced_index, std::size_t reduced_dimension)
    {
        if (reduced_index.size() != csr.dimension())
        {
            throw std::invalid_argument("Reduction map length does not match the matrix");
        }

        const auto& row_ptr = csr.row_ptr();
        const auto& col_idx = csr.col_idx();
        const auto& values = csr.values();

        std::vector<int> block_row_ptr(reduced_dimension + 1, 0);
        std::vector<int> block_col_idx;
        std::vector<double> block_values;
        block_col_idx.reserve(csr.non_zeros());
        block_values.reserve(csr.non_zeros());

        for (std::size_t row = 0; row < csr.dimension(); ++row)
        {
            const int reduced_row = reduced_index[row];
            if (reduced_row < 0)
            {
                continue;
            }
            for (auto idx = static_cast<std::size_t>(row_ptr[row]); idx < static_cast<std::size_t>(row_ptr[row + 1]); ++idx)
            {
                const int reduced_column = reduced_index[static_cast<std::size_t>(col_idx[idx])];
                if (reduced_column >= 0)
                {
                    block_col_idx.push_back(reduced_column);
                    block_values.push_back(values[idx]);
                }
            }
            block_row_ptr[static_cast<std::size_t>(reduced_row) + 1] = static_cast<int>(block_values.size());
        }

        return CsrMatrix(reduced_dimension, std::move(block_row_ptr), std::move(block_col_idx), std::move(block_values));
    }
} // namespace tactile::fem::detail
