#pragma once

#include "detail/dense_matrix.hpp"
#include "detail/sparse_matrix.hpp"
#include "errors.hpp"
#include "problem.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    using detail::CsrMatrix;

    enum class SolverType
    {
        Direct,
        ConjugateGradient,
    };

    enum class PreconditionerType
    {
        None,
        Jacobi,
        IncompleteCholesky0,
    };

    struct SolverOptions
    {
        SolverType solver{SolverType::ConjugateGradient};
        PreconditionerType preconditioner{PreconditionerType::Jacobi};
        // Relative residual ||b - Ax|| / ||b|| at which CG stops.
        double tolerance{1e-8};
        std::size_t max_iterations{10000};
        bool verbose{false};
        double pivot_tolerance{1e-12};
        std::size_t max_direct_dimension{3000};
    };

    inline std::string_view to_string(SolverType type) noexcept
    {
        switch (type)
        {
        case SolverType::Direct:
            return "Direct";
        case SolverType::ConjugateGradient:
            return "ConjugateGradient";
        }
        return "Unknown";
    }

    inline std::string_view to_string(PreconditionerType type) noexcept
    {
        switch (type)
        {
        case PreconditionerType::None:
            return "None";
        case PreconditionerType::Jacobi:
            return "Jacobi";
        case PreconditionerType::IncompleteCholesky0:
            return "IC0";
        }
        return "Unknown";
    }

    namespace detail
    {
        struct LinearSolveSummary
        {
            std::vector<double> solution{};
            std::size_t iterations{0};
            double achieved_residual{0.0};
            double relative_residual{0.0};
        };

        [[nodiscard]] inline double norm(const std::vector<double>& v)
        {
            return std::sqrt(std::inner_product(v.begin(), v.end(), v.begin(), 0.0));
        }

        class Preconditioner
        {
        public:
            virtual ~Preconditioner() = default;
            virtual void apply(const std::vector<double>& r, std::vector<double>& z) const = 0;
        };

        class IdentityPreconditioner final : public Preconditioner
        {
        public:
            void apply(const std::vector<double>& r, std::vector<double>& z) const override
            {
                z = r;
            }
        };

        class JacobiPreconditioner final : public Preconditioner
        {
        public:
            explicit JacobiPreconditioner(const CsrMatrix& csr)
                : m_inverse_diagonal(diagonal(csr))
            {
                for (std::size_t i = 0; i < m_inverse_diagonal.size(); ++i)
                {
                    auto& value = m_inverse_diagonal[i];
                    if (!(value > std::numeric_limits<double>::epsilon()) || !std::isfinite(value))
                    {
                        throw IllConditionedError(fmt::format("Non-positive diagonal {:.3e} at reduced dof {}", value, i));
                    }
                    value = 1.0 / value;
                }
            }

            void apply(const std::vector<double>& r, std::vector<double>& z) const override
            {
                const auto n = m_inverse_diagonal.size();
                z.resize(n);
                for (std::size_t i = 0; i < n; ++i)
                {
                    z[i] = r[i] * m_inverse_diagonal[i];
                }
            }

        private:
            std::vector<double> m_inverse_diagonal{};
        };

        // Zero fill-in incomplete Cholesky on the lower-triangular pattern of the matrix.
        class Ic0Preconditioner final : public Preconditioner
        {
        public:
            explicit Ic0Preconditioner(const CsrMatrix& csr)
            {
                build(csr);
            }

            void apply(const std::vector<double>& r, std::vector<double>& z) const override
            {
                const auto n = m_lower.size();
                std::vector<double> y(n, 0.0);
                for (std::size_t row = 0; row < n; ++row)
                {
                    double sum = r[row];
                    for (const auto& [column, value] : m_lower[row])
                    {
                        sum -= value * y[static_cast<std::size_t>(column)];
                    }
                    y[row] = sum / m_diag[row];
                }

                z.assign(n, 0.0);
                for (std::ptrdiff_t row = static_cast<std::ptrdiff_t>(n) - 1; row >= 0; --row)
                {
                    const auto i = static_cast<std::size_t>(row);
                    double sum = y[i];
                    for (const auto& [below, value] : m_upper[i])
                    {
                        sum -= value * z[static_cast<std::size_t>(below)];
                    }
                    z[i] = sum / m_diag[i];
                }
            }

        private:
            void build(const CsrMatrix& csr)
            {
                const auto n = csr.dimension();
                m_lower.assign(n, {});
                m_upper.assign(n, {});
                m_diag.assign(n, 0.0);

                const auto& row_ptr = csr.row_ptr();
                const auto& col_idx = csr.col_idx();
                const auto& values = csr.values();

                for (std::size_t row = 0; row < n; ++row)
                {
                    double diag_value = 0.0;
                    bool has_diagonal = false;
                    auto& entries = m_lower[row];

                    // Columns arrive ascending, so factors for k < column are final
                    // by the time entry (row, column) is computed.
                    for (auto idx = static_cast<std::size_t>(row_ptr[row]); idx < static_cast<std::size_t>(row_ptr[row + 1]); ++idx)
                    {
                        const auto column = static_cast<std::size_t>(col_idx[idx]);
                        if (column > row)
                        {
                            break;
                        }
                        if (column == row)
                        {
                            diag_value = values[idx];
                            has_diagonal = true;
                            break;
                        }

                        const double factor = (values[idx] - sparse_dot(entries, m_lower[column], column)) / m_diag[column];
                        entries.emplace_back(static_cast<int>(column), factor);
                    }

                    if (!has_diagonal)
                    {
                        throw IllConditionedError(fmt::format("IC(0) needs an explicit diagonal entry in row {}", row));
                    }

                    for (const auto& entry : entries)
                    {
                        diag_value -= entry.second * entry.second;
                    }
                    if (!(diag_value > 0.0))
                    {
                        throw IllConditionedError(fmt::format("IC(0) factorisation failed at row {}: matrix is not SPD", row));
                    }
                    m_diag[row] = std::sqrt(diag_value);
                }

                for (std::size_t row = 0; row < n; ++row)
                {
                    for (const auto& [column, value] : m_lower[row])
                    {
                        m_upper[static_cast<std::size_t>(column)].emplace_back(static_cast<int>(row), value);
                    }
                }
            }

            // Sum of l_ik * l_jk over shared columns k < limit.
            static double sparse_dot(const std::vector<std::pair<int, double>>& lhs, const std::vector<std::pair<int, double>>& rhs, std::size_t limit)
            {
                double sum = 0.0;
                std::size_t i = 0;
                std::size_t j = 0;
                while (i < lhs.size() && j < rhs.size())
                {
                    const auto left = static_cast<std::size_t>(lhs[i].first);
                    const auto right = static_cast<std::size_t>(rhs[j].first);
                    if (left >= limit || right >= limit)
                    {
                        break;
                    }
                    if (left == right)
                    {
                        sum += lhs[i].second * rhs[j].second;
                        ++i;
                        ++j;
                    }
                    else if (left < right)
                    {
                        ++i;
                    }
                    else
                    {
                        ++j;
                    }
                }
                return sum;
            }

            std::vector<std::vector<std::pair<int, double>>> m_lower{};
            std::vector<std::vector<std::pair<int, double>>> m_upper{};
            std::vector<double> m_diag{};
        };

        inline std::unique_ptr<Preconditioner> make_preconditioner(const CsrMatrix& csr, PreconditionerType type)
        {
            switch (type)
            {
            case PreconditionerType::None:
                return std::make_unique<IdentityPreconditioner>();
            case PreconditionerType::Jacobi:
                return std::make_unique<JacobiPreconditioner>(csr);
            case PreconditionerType::IncompleteCholesky0:
                return std::make_unique<Ic0Preconditioner>(csr);
            }

            throw std::invalid_argument("Unsupported preconditioner type");
        }

        inline LinearSolveSummary direct_solve(const CsrMatrix& csr, const std::vector<double>& rhs, const SolverOptions& options)
        {
            if (csr.dimension() > options.max_direct_dimension)
            {
                throw std::invalid_argument(fmt::format("Direct solver is limited to {} unknowns, system has {}", options.max_direct_dimension, csr.dimension()));
            }
            LinearSolveSummary summary{};
            summary.solution = cholesky_solve(csr.to_dense(), rhs, options.pivot_tolerance);
            summary.iterations = 1;
            return summary;
        }

        inline LinearSolveSummary conjugate_gradient(const CsrMatrix& csr, const std::vector<double>& rhs, const SolverOptions& options, const Preconditioner& preconditioner)
        {
            const auto n = csr.dimension();
            LinearSolveSummary summary{};
            summary.solution.assign(n, 0.0);

            // A zero load has the zero displacement as its exact solution.
            const double rhs_norm = norm(rhs);
            if (rhs_norm == 0.0)
            {
                return summary;
            }

            const double tolerance = options.tolerance > 0.0 ? options.tolerance : 1e-12;
            const std::size_t max_iterations = options.max_iterations != 0 ? options.max_iterations : n * 10;

            std::vector<double> r = rhs;
            std::vector<double> z(n, 0.0);
            preconditioner.apply(r, z);
            std::vector<double> p = z;
            std::vector<double> Ap(n, 0.0);

            double rho = std::inner_product(r.begin(), r.end(), z.begin(), 0.0);
            double residual_norm = rhs_norm;

            for (std::size_t iteration = 0; iteration < max_iterations; ++iteration)
            {
                multiply(csr, p, Ap);
                const double denom = std::inner_product(p.begin(), p.end(), Ap.begin(), 0.0);
                if (!(denom > 0.0) || !std::isfinite(denom))
                {
                    throw IllConditionedError(fmt::format("CG found a non-positive curvature p'Ap = {:.3e} at iteration {}", denom, iteration));
                }

                const double alpha = rho / denom;
                for (std::size_t i = 0; i < n; ++i)
                {
                    summary.solution[i] += alpha * p[i];
                    r[i] -= alpha * Ap[i];
                }

                residual_norm = norm(r);
                summary.iterations = iteration + 1;
                if (residual_norm <= tolerance * rhs_norm)
                {
                    summary.achieved_residual = residual_norm;
                    summary.relative_residual = residual_norm / rhs_norm;
                    return summary;
                }

                preconditioner.apply(r, z);
                const double rho_new = std::inner_product(r.begin(), r.end(), z.begin(), 0.0);
                if (!(rho_new > 0.0) || !std::isfinite(rho_new))
                {
                    throw IllConditionedError(fmt::format("CG breakdown: preconditioned residual product {:.3e}", rho_new));
                }
                const double beta = rho_new / rho;
                rho = rho_new;
                for (std::size_t i = 0; i < n; ++i)
                {
                    p[i] = z[i] + beta * p[i];
                }
            }

            throw ConvergenceError(fmt::format("CG did not reach relative residual {:.1e} within {} iterations (reached {:.3e})",
                                               tolerance,
                                               max_iterations,
                                               residual_norm / rhs_norm),
                                   max_iterations,
                                   residual_norm / rhs_norm);
        }

        inline LinearSolveSummary solve_linear_system(const CsrMatrix& csr, const std::vector<double>& rhs, const SolverOptions& options)
        {
            LinearSolveSummary summary{};

            switch (options.solver)
            {
            case SolverType::Direct:
                summary = direct_solve(csr, rhs, options);
                break;
            case SolverType::ConjugateGradient:
            {
                auto preconditioner = make_preconditioner(csr, options.preconditioner);
                summary = conjugate_gradient(csr, rhs, options, *preconditioner);
                break;
            }
            default:
                throw std::invalid_argument("Unsupported solver type");
            }

            std::vector<double> residual(rhs.size(), 0.0);
            multiply(csr, summary.solution, residual);
            for (std::size_t i = 0; i < residual.size(); ++i)
            {
                residual[i] -= rhs[i];
            }
            summary.achieved_residual = norm(residual);
            const double rhs_norm = norm(rhs);
            summary.relative_residual = rhs_norm > 0.0 ? summary.achieved_residual / rhs_norm : 0.0;

            return summary;
        }
    } // namespace detail

    // Static condensation of the prescribed dofs followed by a solve of
    // K_ff u_f = f_f - K_fc u_c.
    inline SolveResult solve(const CsrMatrix& stiffness, const ProblemDefinition& problem, const SolverOptions& options = {})
    {
        const std::size_t dof_count = stiffness.dimension();

        std::vector<double> displacements(dof_count, 0.0);
        std::vector<int> reduced_index(dof_count, 0);
        for (const auto& [dof, value] : problem.boundary_conditions.values())
        {
            if (dof >= dof_count)
            {
                throw std::out_of_range("Boundary condition references an invalid degree of freedom");
            }
            if (!std::isfinite(value))
            {
                throw std::invalid_argument(fmt::format("Prescribed displacement for dof {} is not finite", dof));
            }
            displacements[dof] = value;
            reduced_index[dof] = -1;
        }

        std::size_t free_count = 0;
        for (auto& index : reduced_index)
        {
            if (index == 0)
            {
                index = static_cast<int>(free_count++);
            }
        }

        std::vector<double> forces(dof_count, 0.0);
        for (const auto& load : problem.point_loads)
        {
            for (std::size_t axis = 0; axis < dofs_per_node; ++axis)
            {
                const auto dof = load.node * dofs_per_node + axis;
                if (dof >= dof_count)
                {
                    throw std::out_of_range("Point load references an invalid node");
                }
                forces[dof] += load.force[axis];
            }
        }

        SolveResult result{};
        if (free_count == 0)
        {
            result.displacements = std::move(displacements);
            return result;
        }

        const auto coupling = detail::multiply(stiffness, displacements);
        std::vector<double> rhs(free_count, 0.0);
        for (std::size_t dof = 0; dof < dof_count; ++dof)
        {
            if (reduced_index[dof] >= 0)
            {
                rhs[static_cast<std::size_t>(reduced_index[dof])] = forces[dof] - coupling[dof];
            }
        }

        const auto reduced = detail::extract_block(stiffness, reduced_index, free_count);

        if (options.verbose)
        {
            safe_io::print("Reduced system: {} free of {} dofs, {} non-zeros", free_count, dof_count, reduced.non_zeros());
            if (free_count <= 12)
            {
                const auto dense_view = reduced.to_dense();
                for (std::size_t row = 0; row < free_count; ++row)
                {
                    std::string row_values;
                    row_values.reserve(free_count * 10);
                    for (std::size_t column = 0; column < free_count; ++column)
                    {
                        row_values += fmt::format("{:>10.4f}", dense_view(row, column));
                    }
                    safe_io::print("{}", row_values);
                }
                safe_io::print("RHS vector: {}", fmt::join(rhs, ", "));
            }
            safe_io::print("Invoking {} solver with {} preconditioner", to_string(options.solver), to_string(options.preconditioner));
        }

        auto summary = detail::solve_linear_system(reduced, rhs, options);

        if (options.verbose)
        {
            safe_io::print("Solver completed in {} iteration(s). Residual L2 norm: {:.6e} (relative {:.3e})",
                           summary.iterations,
                           summary.achieved_residual,
                           summary.relative_residual);
        }

        for (std::size_t dof = 0; dof < dof_count; ++dof)
        {
            if (reduced_index[dof] >= 0)
            {
                displacements[dof] = summary.solution[static_cast<std::size_t>(reduced_index[dof])];
            }
        }

        result.displacements = std::move(displacements);
        result.iterations = summary.iterations;
        result.residual_norm = summary.achieved_residual;
        result.relative_residual = summary.relative_residual;
        return result;
    }
} // namespace tactile::fem
