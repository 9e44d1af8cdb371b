#pragma once

#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace tactile::fem
{
    struct Node
    {
        double x{0.0};
        double y{0.0};
        double z{0.0};
    };

    [[nodiscard]] inline Node operator+(const Node& a, const Node& b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    [[nodiscard]] inline Node operator-(const Node& a, const Node& b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    [[nodiscard]] inline Node operator*(const Node& a, double s) noexcept { return {a.x * s, a.y * s, a.z * s}; }

    [[nodiscard]] inline double dot(const Node& a, const Node& b) noexcept { return a.x * b.x + a.y * b.y + a.z * b.z; }
    [[nodiscard]] inline Node cross(const Node& a, const Node& b) noexcept
    {
        return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
    }
    [[nodiscard]] inline double length(const Node& v) noexcept { return std::sqrt(dot(v, v)); }

    enum class ElementKind
    {
        Triangle,
        Tetrahedron,
    };

    [[nodiscard]] constexpr std::size_t nodes_per_element(ElementKind kind) noexcept
    {
        return kind == ElementKind::Triangle ? 3 : 4;
    }

    inline std::string_view to_string(ElementKind kind) noexcept
    {
        switch (kind)
        {
        case ElementKind::Triangle:
            return "Triangle";
        case ElementKind::Tetrahedron:
            return "Tetrahedron";
        }
        return "Unknown";
    }

    // Triangles use the first three ids; the fourth slot is ignored.
    struct Element
    {
        std::array<std::size_t, 4> node_ids{};
    };

    struct Bounds
    {
        Node min{};
        Node max{};

        [[nodiscard]] Node extent() const noexcept { return max - min; }
        [[nodiscard]] Node center() const noexcept { return (min + max) * 0.5; }
    };

    // Immutable node/element container. Adjacency is derived once on
    // construction so a mesh can be shared read-only between solver threads.
    class Mesh
    {
    public:
        Mesh() = default;

        Mesh(ElementKind kind, std::vector<Node> nodes, std::vector<Element> elements)
            : m_kind(kind)
            , m_nodes(std::move(nodes))
            , m_elements(std::move(elements))
        {
            validate();
            build_adjacency();
            compute_bounds();
        }

        [[nodiscard]] ElementKind kind() const noexcept { return m_kind; }
        [[nodiscard]] std::size_t arity() const noexcept { return nodes_per_element(m_kind); }

        [[nodiscard]] std::span<const Node> nodes() const noexcept { return m_nodes; }
        [[nodiscard]] std::span<const Element> elements() const noexcept { return m_elements; }

        [[nodiscard]] const Node& node(std::size_t index) const
        {
            if (index >= m_nodes.size())
            {
                throw std::out_of_range("Node index out of range");
            }
            return m_nodes[index];
        }

        [[nodiscard]] const Element& element(std::size_t index) const
        {
            if (index >= m_elements.size())
            {
                throw std::out_of_range("Element index out of range");
            }
            return m_elements[index];
        }

        [[nodiscard]] std::span<const std::size_t> element_nodes(std::size_t index) const
        {
            return std::span<const std::size_t>(element(index).node_ids.data(), arity());
        }

        [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
        [[nodiscard]] std::size_t element_count() const noexcept { return m_elements.size(); }

        // Sorted, duplicate-free list of nodes sharing an element with `index`.
        [[nodiscard]] std::span<const std::size_t> neighbors(std::size_t index) const
        {
            if (index >= m_adjacency.size())
            {
                throw std::out_of_range("Node index out of range");
            }
            return m_adjacency[index];
        }

        [[nodiscard]] const Bounds& bounds() const noexcept { return m_bounds; }

    private:
        void validate() const
        {
            const auto count = arity();
            for (std::size_t e = 0; e < m_elements.size(); ++e)
            {
                const auto& ids = m_elements[e].node_ids;
                for (std::size_t i = 0; i < count; ++i)
                {
                    if (ids[i] >= m_nodes.size())
                    {
                        throw MeshError(fmt::format("Element {} references invalid node {} (mesh has {} nodes)", e, ids[i], m_nodes.size()));
                    }
                    for (std::size_t j = 0; j < i; ++j)
                    {
                        if (ids[i] == ids[j])
                        {
                            throw MeshError(fmt::format("Element {} repeats node {}", e, ids[i]));
                        }
                    }
                }
            }
        }

        void build_adjacency()
        {
            const auto count = arity();
            m_adjacency.assign(m_nodes.size(), {});
            for (const auto& element : m_elements)
            {
                for (std::size_t i = 0; i < count; ++i)
                {
                    for (std::size_t j = 0; j < count; ++j)
                    {
                        if (i != j)
                        {
                            m_adjacency[element.node_ids[i]].push_back(element.node_ids[j]);
                        }
                    }
                }
            }

            for (auto& row : m_adjacency)
            {
                std::sort(row.begin(), row.end());
                row.erase(std::unique(row.begin(), row.end()), row.end());
            }
        }

        void compute_bounds()
        {
            if (m_nodes.empty())
            {
                return;
            }
            constexpr double inf = std::numeric_limits<double>::infinity();
            m_bounds = Bounds{{inf, inf, inf}, {-inf, -inf, -inf}};
            for (const auto& node : m_nodes)
            {
                m_bounds.min = {std::min(m_bounds.min.x, node.x), std::min(m_bounds.min.y, node.y), std::min(m_bounds.min.z, node.z)};
                m_bounds.max = {std::max(m_bounds.max.x, node.x), std::max(m_bounds.max.y, node.y), std::max(m_bounds.max.z, node.z)};
            }
        }

        ElementKind m_kind{ElementKind::Tetrahedron};
        std::vector<Node> m_nodes{};
        std::vector<Element> m_elements{};
        std::vector<std::vector<std::size_t>> m_adjacency{};
        Bounds m_bounds{};
    };

    namespace detail
    {
        [[nodiscard]] inline double triangle_area(const Node& a, const Node& b, const Node& c) noexcept
        {
            return 0.5 * length(cross(b - a, c - a));
        }

        // Signed area of the xy projection.
        [[nodiscard]] inline double projected_area(const Node& a, const Node& b, const Node& c) noexcept
        {
            return 0.5 * ((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y));
        }

        [[nodiscard]] inline double tetrahedron_volume(const Node& a, const Node& b, const Node& c, const Node& d) noexcept
        {
            return dot(b - a, cross(c - a, d - a)) / 6.0;
        }

        // Barycentric weights of (x, y) in the xy projection of a triangle.
        // Returns false for a degenerate projection or a point outside by more than `slack`.
        [[nodiscard]] inline bool projected_barycentric(const Node& a, const Node& b, const Node& c, double x, double y,
                                                        double slack, std::array<double, 3>& weights) noexcept
        {
            const double area = projected_area(a, b, c);
            if (std::abs(area) <= std::numeric_limits<double>::epsilon())
            {
                return false;
            }
            const Node p{x, y, 0.0};
            weights[0] = projected_area(p, b, c) / area;
            weights[1] = projected_area(a, p, c) / area;
            weights[2] = 1.0 - weights[0] - weights[1];
            return weights[0] >= -slack && weights[1] >= -slack && weights[2] >= -slack;
        }

        [[nodiscard]] inline double characteristic_length(const Mesh& mesh, std::span<const std::size_t> ids)
        {
            double longest = 0.0;
            for (std::size_t i = 0; i < ids.size(); ++i)
            {
                for (std::size_t j = i + 1; j < ids.size(); ++j)
                {
                    longest = std::max(longest, length(mesh.node(ids[i]) - mesh.node(ids[j])));
                }
            }
            return longest;
        }
    } // namespace detail
} // namespace tactile::fem
