#include <tactile_fem/footprint.hpp>
#include <tactile_fem/primitives.hpp>
#include <tactile_fem/sensor.hpp>
#include <tactile_fem/solver.hpp>
#include <tactile_fem/stiffness.hpp>

#include <safe_io/utils.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <limits>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
    using tactile::fem::ContactObject;
    using tactile::fem::CsrMatrix;
    using tactile::fem::PreconditionerType;
    using tactile::fem::ProblemDefinition;
    using tactile::fem::SensorConfig;
    using tactile::fem::SensorModel;
    using tactile::fem::SolveResult;
    using tactile::fem::SolverOptions;
    using tactile::fem::SolverType;

    std::shared_ptr<const SensorModel> build_sensor()
    {
        SensorConfig config{};
        config.pad_width = 8.0;
        config.pad_length = 8.0;
        config.pad_thickness = 2.0;
        config.cells_x = 10;
        config.cells_y = 10;
        config.cells_z = 3;
        config.depth_shape = {80, 80};
        config.marker_shape = {8, 8};
        return SensorModel::create(config);
    }

    struct TimingSummary
    {
        SolveResult result{};
        double average_ms{0.0};
    };

    TimingSummary run_solver(const CsrMatrix& stiffness, const ProblemDefinition& problem, SolverType solver, PreconditionerType preconditioner, std::size_t repetitions)
    {
        SolverOptions options{};
        options.solver = solver;
        options.preconditioner = preconditioner;
        options.tolerance = 1e-10;
        options.max_iterations = 4000;

        SolveResult last_result{};
        double total_ms = 0.0;

        for (std::size_t iteration = 0; iteration < repetitions; ++iteration)
        {
            const auto start = std::chrono::steady_clock::now();
            last_result = tactile::fem::solve(stiffness, problem, options);
            const auto end = std::chrono::steady_clock::now();
            total_ms += std::chrono::duration<double, std::milli>(end - start).count();
        }

        TimingSummary summary{};
        summary.result = std::move(last_result);
        summary.average_ms = repetitions > 0 ? total_ms / static_cast<double>(repetitions) : 0.0;
        return summary;
    }

    double max_difference(const std::vector<double>& lhs, const std::vector<double>& rhs)
    {
        if (lhs.size() != rhs.size())
        {
            return std::numeric_limits<double>::infinity();
        }

        double diff = 0.0;
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            diff = std::max(diff, std::abs(lhs[i] - rhs[i]));
        }
        return diff;
    }

    void report(std::string_view label, const TimingSummary& run)
    {
        safe_io::print(" {:<14} average {:8.3f} ms | iterations {:>4} | relative residual {:.3e}",
                       label,
                       run.average_ms,
                       run.result.iterations,
                       run.result.relative_residual);
    }
}

int main()
{
    constexpr std::size_t repetitions = 3;
    constexpr double depth = 0.3;

    try
    {
        const auto sensor = build_sensor();
        const ContactObject indenter("cylinder_r2", tactile::fem::make_cylinder_surface(2.0, 4.0));
        const auto footprint = tactile::fem::derive_footprint(*sensor, indenter);
        const auto problem = tactile::fem::make_contact_conditions(*sensor, footprint, depth);
        const auto stiffness = tactile::fem::assemble_stiffness(sensor->pad(), 0.2, 0.45);

        safe_io::print("Contact benchmark on a {}-node pad ({} tetrahedra, {} prescribed dofs, depth {} mm)",
                       sensor->pad().node_count(),
                       sensor->pad().element_count(),
                       problem.boundary_conditions.size(),
                       depth);

        const auto jacobi = run_solver(stiffness, problem, SolverType::ConjugateGradient, PreconditionerType::Jacobi, repetitions);
        const auto ic0 = run_solver(stiffness, problem, SolverType::ConjugateGradient, PreconditionerType::IncompleteCholesky0, repetitions);
        const auto direct = run_solver(stiffness, problem, SolverType::Direct, PreconditionerType::None, 1);

        report("CG + Jacobi", jacobi);
        report("CG + IC(0)", ic0);
        report("Cholesky", direct);

        const double jacobi_diff = max_difference(jacobi.result.displacements, direct.result.displacements);
        const double ic0_diff = max_difference(ic0.result.displacements, direct.result.displacements);
        if (jacobi_diff > 1e-7 || ic0_diff > 1e-7)
        {
            safe_io::eprint("Numerical mismatch against the direct solve (Jacobi {:.3e}, IC(0) {:.3e}).", jacobi_diff, ic0_diff);
            return 1;
        }

        safe_io::print("Results match within tolerance. IC(0) speedup over Jacobi {:.2f}x",
                       (ic0.average_ms > 0.0) ? (jacobi.average_ms / ic0.average_ms) : 0.0);
    }
    catch (const std::exception& e)
    {
        safe_io::eprint("Benchmark failed: {}", e.what());
        return 1;
    }

    return 0;
}
