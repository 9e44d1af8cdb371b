#pragma once

#include "errors.hpp"
#include "mesh.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace tactile::fem
{
    // Boundary triangles of a volume mesh, plus the map back to volume node ids.
    struct BoundarySurface
    {
        Mesh mesh{};
        std::vector<std::size_t> volume_nodes{};
    };

    namespace detail
    {
        // Faces owned by exactly one tetrahedron, each with ascending node ids.
        inline std::vector<std::array<std::size_t, 3>> boundary_faces(const Mesh& volume)
        {
            if (volume.kind() != ElementKind::Tetrahedron)
            {
                throw MeshError("Boundary extraction needs a tetrahedral mesh");
            }

            static constexpr std::array<std::array<std::size_t, 3>, 4> faces{{{0, 1, 2}, {0, 1, 3}, {0, 2, 3}, {1, 2, 3}}};

            std::vector<std::array<std::size_t, 3>> keys;
            keys.reserve(volume.element_count() * faces.size());
            for (const auto& element : volume.elements())
            {
                for (const auto& face : faces)
                {
                    std::array<std::size_t, 3> key{element.node_ids[face[0]], element.node_ids[face[1]], element.node_ids[face[2]]};
                    std::sort(key.begin(), key.end());
                    keys.push_back(key);
                }
            }
            std::sort(keys.begin(), keys.end());

            std::vector<std::array<std::size_t, 3>> boundary;
            for (std::size_t i = 0; i < keys.size();)
            {
                std::size_t j = i + 1;
                while (j < keys.size() && keys[j] == keys[i])
                {
                    ++j;
                }
                if (j - i == 1)
                {
                    boundary.push_back(keys[i]);
                }
                i = j;
            }
            return boundary;
        }

        inline BoundarySurface make_surface(const Mesh& volume, const std::vector<std::array<std::size_t, 3>>& faces)
        {
            std::vector<std::size_t> volume_nodes;
            for (const auto& face : faces)
            {
                volume_nodes.insert(volume_nodes.end(), face.begin(), face.end());
            }
            std::sort(volume_nodes.begin(), volume_nodes.end());
            volume_nodes.erase(std::unique(volume_nodes.begin(), volume_nodes.end()), volume_nodes.end());

            const auto local_id = [&](std::size_t id) {
                return static_cast<std::size_t>(std::lower_bound(volume_nodes.begin(), volume_nodes.end(), id) - volume_nodes.begin());
            };

            std::vector<Node> nodes;
            nodes.reserve(volume_nodes.size());
            for (const auto id : volume_nodes)
            {
                nodes.push_back(volume.node(id));
            }

            std::vector<Element> elements;
            elements.reserve(faces.size());
            for (const auto& face : faces)
            {
                Element element{{local_id(face[0]), local_id(face[1]), local_id(face[2]), 0}};
                // Counter-clockwise seen from +z.
                if (projected_area(nodes[element.node_ids[0]], nodes[element.node_ids[1]], nodes[element.node_ids[2]]) < 0.0)
                {
                    std::swap(element.node_ids[1], element.node_ids[2]);
                }
                elements.push_back(element);
            }

            return BoundarySurface{Mesh(ElementKind::Triangle, std::move(nodes), std::move(elements)), std::move(volume_nodes)};
        }
    } // namespace detail

    inline BoundarySurface extract_boundary(const Mesh& volume)
    {
        return detail::make_surface(volume, detail::boundary_faces(volume));
    }

    // Boundary faces lying on the top plane (max z) within `tolerance`.
    inline BoundarySurface extract_top_surface(const Mesh& volume, double tolerance)
    {
        const double top = volume.bounds().max.z;
        const auto on_top = [&](std::size_t id) { return volume.node(id).z >= top - tolerance; };

        auto faces = detail::boundary_faces(volume);
        faces.erase(std::remove_if(faces.begin(), faces.end(), [&](const auto& face) {
                        return !(on_top(face[0]) && on_top(face[1]) && on_top(face[2]));
                    }),
                    faces.end());

        if (faces.empty())
        {
            throw MeshError("Volume mesh has no boundary faces on its top plane");
        }
        return detail::make_surface(volume, faces);
    }

    inline std::vector<std::size_t> bottom_nodes(const Mesh& volume, double tolerance)
    {
        const double bottom = volume.bounds().min.z;
        std::vector<std::size_t> result;
        for (std::size_t i = 0; i < volume.node_count(); ++i)
        {
            if (volume.node(i).z <= bottom + tolerance)
            {
                result.push_back(i);
            }
        }
        return result;
    }

    namespace detail
    {
        // Uniform xy bucket grid over the triangles of a surface mesh.
        class TriangleBuckets
        {
        public:
            TriangleBuckets() = default;

            explicit TriangleBuckets(const Mesh& surface)
            {
                if (surface.kind() != ElementKind::Triangle)
                {
                    throw std::invalid_argument("Triangle buckets need a triangle mesh");
                }

                const auto& bounds = surface.bounds();
                m_origin_x = bounds.min.x;
                m_origin_y = bounds.min.y;
                const double width = std::max(bounds.max.x - bounds.min.x, 1e-12);
                const double height = std::max(bounds.max.y - bounds.min.y, 1e-12);

                const auto per_axis = std::max<std::size_t>(1, static_cast<std::size_t>(std::sqrt(static_cast<double>(surface.element_count()))));
                m_columns = per_axis;
                m_rows = per_axis;
                m_cell_x = width / static_cast<double>(m_columns);
                m_cell_y = height / static_cast<double>(m_rows);
                m_buckets.assign(m_columns * m_rows, {});

                for (std::size_t t = 0; t < surface.element_count(); ++t)
                {
                    const auto ids = surface.element_nodes(t);
                    double min_x = surface.node(ids[0]).x;
                    double max_x = min_x;
                    double min_y = surface.node(ids[0]).y;
                    double max_y = min_y;
                    for (const auto id : ids)
                    {
                        min_x = std::min(min_x, surface.node(id).x);
                        max_x = std::max(max_x, surface.node(id).x);
                        min_y = std::min(min_y, surface.node(id).y);
                        max_y = std::max(max_y, surface.node(id).y);
                    }

                    const auto [c0, r0] = cell(min_x, min_y);
                    const auto [c1, r1] = cell(max_x, max_y);
                    for (std::size_t r = r0; r <= r1; ++r)
                    {
                        for (std::size_t c = c0; c <= c1; ++c)
                        {
                            m_buckets[r * m_columns + c].push_back(t);
                        }
                    }
                }
            }

            // Triangles whose bounding box may contain (x, y), ascending by index.
            [[nodiscard]] std::span<const std::size_t> candidates(double x, double y) const noexcept
            {
                if (m_buckets.empty())
                {
                    return {};
                }
                const auto [c, r] = cell(x, y);
                return m_buckets[r * m_columns + c];
            }

        private:
            [[nodiscard]] std::pair<std::size_t, std::size_t> cell(double x, double y) const noexcept
            {
                const auto clamp_index = [](double value, std::size_t count) {
                    if (!(value > 0.0))
                    {
                        return std::size_t{0};
                    }
                    return std::min(count - 1, static_cast<std::size_t>(value));
                };
                return {clamp_index((x - m_origin_x) / m_cell_x, m_columns), clamp_index((y - m_origin_y) / m_cell_y, m_rows)};
            }

            double m_origin_x{0.0};
            double m_origin_y{0.0};
            double m_cell_x{1.0};
            double m_cell_y{1.0};
            std::size_t m_columns{0};
            std::size_t m_rows{0};
            std::vector<std::vector<std::size_t>> m_buckets{};
        };
    } // namespace detail

    struct SurfaceLocation
    {
        std::size_t triangle{0};
        std::array<double, 3> weights{};
    };

    // Point location on the xy projection of a triangle surface.
    class SurfaceLocator
    {
    public:
        SurfaceLocator() = default;

        explicit SurfaceLocator(const Mesh& surface)
            : m_surface(&surface)
            , m_buckets(surface)
        {
        }

        [[nodiscard]] std::optional<SurfaceLocation> locate(double x, double y) const
        {
            if (m_surface == nullptr)
            {
                throw std::logic_error("SurfaceLocator used before construction");
            }
            constexpr double slack = 1e-9;
            SurfaceLocation location{};
            for (const auto t : m_buckets.candidates(x, y))
            {
                const auto ids = m_surface->element_nodes(t);
                if (detail::projected_barycentric(m_surface->node(ids[0]), m_surface->node(ids[1]), m_surface->node(ids[2]), x, y, slack, location.weights))
                {
                    location.triangle = t;
                    return location;
                }
            }
            return std::nullopt;
        }

    private:
        const Mesh* m_surface{nullptr};
        detail::TriangleBuckets m_buckets{};
    };
} // namespace tactile::fem
