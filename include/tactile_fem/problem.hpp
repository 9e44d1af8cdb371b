#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <vector>

namespace tactile::fem
{
    inline constexpr std::size_t dofs_per_node = 3;

    enum class Axis : std::size_t
    {
        X = 0,
        Y = 1,
        Z = 2,
    };

    [[nodiscard]] constexpr std::size_t dof_index(std::size_t node, Axis axis) noexcept
    {
        return node * dofs_per_node + static_cast<std::size_t>(axis);
    }

    struct PointLoad
    {
        std::size_t node{};
        std::array<double, 3> force{0.0, 0.0, 0.0};
    };

    // Prescribed displacements keyed by degree of freedom. Every dof not listed
    // is free. Ordered storage keeps condensation deterministic.
    class BoundaryConditionSet
    {
    public:
        void prescribe(std::size_t node, Axis axis, double value)
        {
            m_values[dof_index(node, axis)] = value;
        }

        void fix(std::size_t node)
        {
            prescribe(node, Axis::X, 0.0);
            prescribe(node, Axis::Y, 0.0);
            prescribe(node, Axis::Z, 0.0);
        }

        [[nodiscard]] bool is_constrained(std::size_t dof) const { return m_values.count(dof) != 0; }
        [[nodiscard]] const std::map<std::size_t, double>& values() const noexcept { return m_values; }
        [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_values.empty(); }

    private:
        std::map<std::size_t, double> m_values{};
    };

    struct ProblemDefinition
    {
        BoundaryConditionSet boundary_conditions{};
        std::vector<PointLoad> point_loads{};
    };

    struct SolveResult
    {
        // Three components per node, laid out by dof_index().
        std::vector<double> displacements{};
        std::size_t iterations{0};
        double residual_norm{0.0};
        double relative_residual{0.0};

        [[nodiscard]] std::array<double, 3> displacement(std::size_t node) const
        {
            const auto base = node * dofs_per_node;
            if (base + 2 >= displacements.size())
            {
                throw std::out_of_range("Displacement requested for an unknown node");
            }
            return {displacements[base], displacements[base + 1], displacements[base + 2]};
        }
    };
} // namespace tactile::fem
