#pragma once

#include "../errors.hpp"

#include <cassert>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

namespace tactile::fem::detail
{
    class DenseMatrix
    {
    public:
        DenseMatrix() = default;

        explicit DenseMatrix(std::size_t dimension)
            : m_dimension(dimension)
            , m_data(dimension * dimension, 0.0)
        {
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_dimension; }

        [[nodiscard]] double& operator()(std::size_t row, std::size_t column) noexcept
        {
            assert(row < m_dimension && column < m_dimension);
            return m_data[row * m_dimension + column];
        }

        [[nodiscard]] double operator()(std::size_t row, std::size_t column) const noexcept
        {
            assert(row < m_dimension && column < m_dimension);
            return m_data[row * m_dimension + column];
        }

        [[nodiscard]] const std::vector<double>& data() const noexcept { return m_data; }

    private:
        std::size_t m_dimension{0};
        std::vector<double> m_data{};
    };

    // In-place Cholesky factorisation (lower triangle) followed by forward and
    // backward substitution. A pivot at or below `pivot_tolerance` means the
    // matrix is not positive definite.
    inline std::vector<double> cholesky_solve(DenseMatrix matrix, std::vector<double> rhs, double pivot_tolerance)
    {
        const auto n = matrix.size();
        if (rhs.size() != n)
        {
            throw std::invalid_argument("Right-hand side length does not match the matrix");
        }

        for (std::size_t k = 0; k < n; ++k)
        {
            double pivot = matrix(k, k);
            for (std::size_t j = 0; j < k; ++j)
            {
                pivot -= matrix(k, j) * matrix(k, j);
            }

            if (!(pivot > pivot_tolerance))
            {
                throw IllConditionedError(fmt::format("Cholesky pivot {:.3e} at row {} is not positive", pivot, k));
            }

            const double root = std::sqrt(pivot);
            matrix(k, k) = root;
            for (std::size_t i = k + 1; i < n; ++i)
            {
                double sum = matrix(i, k);
                for (std::size_t j = 0; j < k; ++j)
                {
                    sum -= matrix(i, j) * matrix(k, j);
                }
                matrix(i, k) = sum / root;
            }
        }

        for (std::size_t i = 0; i < n; ++i)
        {
            double sum = rhs[i];
            for (std::size_t j = 0; j < i; ++j)
            {
                sum -= matrix(i, j) * rhs[j];
            }
            rhs[i] = sum / matrix(i, i);
        }

        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(n) - 1; i >= 0; --i)
        {
            const auto row = static_cast<std::size_t>(i);
            double sum = rhs[row];
            for (std::size_t j = row + 1; j < n; ++j)
            {
                sum -= matrix(j, row) * rhs[j];
            }
            rhs[row] = sum / matrix(row, row);
        }

        return rhs;
    }
} // namespace tactile::fem::detail
