#pragma once

#include "detail/sparse_matrix.hpp"
#include "errors.hpp"
#include "material.hpp"
#include "mesh.hpp"
#include "problem.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    using detail::CsrMatrix;

    namespace detail
    {
        // Elements whose volume falls below this fraction of (longest edge)^3 are degenerate.
        inline constexpr double degenerate_volume_ratio = 1e-10;

        struct TetrahedronGeometry
        {
            std::array<Node, 4> gradients{};
            double volume{0.0};
        };

        // Constant shape-function gradients of a linear tetrahedron.
        inline TetrahedronGeometry tetrahedron_geometry(const Mesh& mesh, std::size_t element_index)
        {
            const auto ids = mesh.element_nodes(element_index);
            const auto& x0 = mesh.node(ids[0]);
            const Node e1 = mesh.node(ids[1]) - x0;
            const Node e2 = mesh.node(ids[2]) - x0;
            const Node e3 = mesh.node(ids[3]) - x0;

            const double det = dot(e1, cross(e2, e3));
            const double scale = characteristic_length(mesh, ids);
            if (!(std::abs(det) > degenerate_volume_ratio * scale * scale * scale))
            {
                throw MeshError(fmt::format("Tetrahedron {} is degenerate (volume {:.3e})", element_index, det / 6.0));
            }

            TetrahedronGeometry geometry{};
            geometry.volume = std::abs(det) / 6.0;
            geometry.gradients[1] = cross(e2, e3) * (1.0 / det);
            geometry.gradients[2] = cross(e3, e1) * (1.0 / det);
            geometry.gradients[3] = cross(e1, e2) * (1.0 / det);
            geometry.gradients[0] = (geometry.gradients[1] + geometry.gradients[2] + geometry.gradients[3]) * -1.0;
            return geometry;
        }

        // Strain-displacement matrix, 6 x 12 row-major.
        inline std::array<double, 72> strain_displacement(const TetrahedronGeometry& geometry)
        {
            std::array<double, 72> b{};
            for (std::size_t a = 0; a < 4; ++a)
            {
                const auto& g = geometry.gradients[a];
                const std::size_t c = 3 * a;
                b[0 * 12 + c + 0] = g.x;
                b[1 * 12 + c + 1] = g.y;
                b[2 * 12 + c + 2] = g.z;
                b[3 * 12 + c + 1] = g.z;
                b[3 * 12 + c + 2] = g.y;
                b[4 * 12 + c + 0] = g.z;
                b[4 * 12 + c + 2] = g.x;
                b[5 * 12 + c + 0] = g.y;
                b[5 * 12 + c + 1] = g.x;
            }
            return b;
        }

        // K_e = |V| B^T D B, 12 x 12 row-major.
        inline std::array<double, 144> local_stiffness(const TetrahedronGeometry& geometry, const ElasticityMatrix& d)
        {
            const auto b = strain_displacement(geometry);

            std::array<double, 72> db{};
            for (std::size_t i = 0; i < 6; ++i)
            {
                for (std::size_t j = 0; j < 12; ++j)
                {
                    double sum = 0.0;
                    for (std::size_t k = 0; k < 6; ++k)
                    {
                        sum += d[i * 6 + k] * b[k * 12 + j];
                    }
                    db[i * 12 + j] = sum;
                }
            }

            std::array<double, 144> k{};
            for (std::size_t i = 0; i < 12; ++i)
            {
                for (std::size_t j = 0; j < 12; ++j)
                {
                    double sum = 0.0;
                    for (std::size_t m = 0; m < 6; ++m)
                    {
                        sum += b[m * 12 + i] * db[m * 12 + j];
                    }
                    k[i * 12 + j] = geometry.volume * sum;
                }
            }
            return k;
        }
    } // namespace detail

    inline CsrMatrix assemble_stiffness(const Mesh& mesh, const ConstitutiveModel& model)
    {
        if (mesh.kind() != ElementKind::Tetrahedron)
        {
            throw MeshError(fmt::format("Stiffness assembly needs a volumetric mesh, got {} elements", to_string(mesh.kind())));
        }
        if (mesh.element_count() == 0)
        {
            throw MeshError("Stiffness assembly needs at least one element");
        }

        const auto d = model.elasticity_matrix();

        detail::CooMatrix coo{};
        coo.dimension = mesh.node_count() * dofs_per_node;
        coo.entries.reserve(mesh.element_count() * 144);

        for (std::size_t e = 0; e < mesh.element_count(); ++e)
        {
            const auto local = detail::local_stiffness(detail::tetrahedron_geometry(mesh, e), d);
            const auto ids = mesh.element_nodes(e);

            for (std::size_t i = 0; i < 12; ++i)
            {
                const auto row = ids[i / 3] * dofs_per_node + i % 3;
                for (std::size_t j = 0; j < 12; ++j)
                {
                    const auto column = ids[j / 3] * dofs_per_node + j % 3;
                    coo.add(row, column, local[i * 12 + j]);
                }
            }
        }

        auto stiffness = CsrMatrix::build(std::move(coo));
        safe_io::debug("Assembled {} stiffness: {} dofs, {} non-zeros", model.name(), stiffness.dimension(), stiffness.non_zeros());
        return stiffness;
    }

    inline CsrMatrix assemble_stiffness(const Mesh& mesh, double youngs_modulus, double poisson_ratio)
    {
        const IsotropicElasticity model(MaterialParameters{youngs_modulus, poisson_ratio});
        return assemble_stiffness(mesh, model);
    }

    // Row-stochastic blend of each node with the mean of its neighbours:
    // S = (1 - w) I + w D^-1 A. Depends on topology only.
    inline CsrMatrix assemble_smoothing_operator(const Mesh& mesh, double weight)
    {
        if (!(weight >= 0.0 && weight <= 1.0))
        {
            throw std::invalid_argument(fmt::format("Smoothing weight must lie in [0, 1], got {}", weight));
        }

        detail::CooMatrix coo{};
        coo.dimension = mesh.node_count();
        for (std::size_t i = 0; i < mesh.node_count(); ++i)
        {
            const auto neighbors = mesh.neighbors(i);
            if (neighbors.empty())
            {
                coo.add(i, i, 1.0);
                continue;
            }

            coo.add(i, i, 1.0 - weight);
            const double share = weight / static_cast<double>(neighbors.size());
            for (const auto j : neighbors)
            {
                coo.add(i, j, share);
            }
        }
        return CsrMatrix::build(std::move(coo));
    }
} // namespace tactile::fem
