#pragma once

#include "mesh.hpp"

#include <cmath>
#include <cstddef>
#include <numbers>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace tactile::fem
{
    // Closed triangulated cylinder along z, flat face at z = 0, axis through the origin.
    inline Mesh make_cylinder_surface(double radius, double height, std::size_t segments = 64)
    {
        if (!(radius > 0.0) || !(height > 0.0) || segments < 3)
        {
            throw std::invalid_argument(fmt::format("Invalid cylinder: radius {}, height {}, {} segments", radius, height, segments));
        }

        std::vector<Node> nodes{{0.0, 0.0, 0.0}, {0.0, 0.0, height}};
        for (const double z : {0.0, height})
        {
            for (std::size_t s = 0; s < segments; ++s)
            {
                const double angle = 2.0 * std::numbers::pi * static_cast<double>(s) / static_cast<double>(segments);
                nodes.push_back(Node{radius * std::cos(angle), radius * std::sin(angle), z});
            }
        }

        const auto bottom = [&](std::size_t s) { return 2 + s % segments; };
        const auto top = [&](std::size_t s) { return 2 + segments + s % segments; };

        std::vector<Element> elements;
        elements.reserve(4 * segments);
        for (std::size_t s = 0; s < segments; ++s)
        {
            elements.push_back(Element{{0, bottom(s + 1), bottom(s), 0}});
            elements.push_back(Element{{1, top(s), top(s + 1), 0}});
            elements.push_back(Element{{bottom(s), bottom(s + 1), top(s + 1), 0}});
            elements.push_back(Element{{bottom(s), top(s + 1), top(s), 0}});
        }
        return Mesh(ElementKind::Triangle, std::move(nodes), std::move(elements));
    }

    // UV sphere centred on the origin.
    inline Mesh make_sphere_surface(double radius, std::size_t rings = 24, std::size_t segments = 48)
    {
        if (!(radius > 0.0) || rings < 2 || segments < 3)
        {
            throw std::invalid_argument(fmt::format("Invalid sphere: radius {}, {} rings, {} segments", radius, rings, segments));
        }

        std::vector<Node> nodes{{0.0, 0.0, -radius}, {0.0, 0.0, radius}};
        for (std::size_t k = 1; k < rings; ++k)
        {
            const double polar = std::numbers::pi * static_cast<double>(k) / static_cast<double>(rings);
            for (std::size_t s = 0; s < segments; ++s)
            {
                const double azimuth = 2.0 * std::numbers::pi * static_cast<double>(s) / static_cast<double>(segments);
                nodes.push_back(Node{radius * std::sin(polar) * std::cos(azimuth),
                                     radius * std::sin(polar) * std::sin(azimuth),
                                     -radius * std::cos(polar)});
            }
        }

        const auto ring = [&](std::size_t k, std::size_t s) { return 2 + (k - 1) * segments + s % segments; };

        std::vector<Element> elements;
        elements.reserve(2 * rings * segments);
        for (std::size_t s = 0; s < segments; ++s)
        {
            elements.push_back(Element{{0, ring(1, s + 1), ring(1, s), 0}});
            elements.push_back(Element{{1, ring(rings - 1, s), ring(rings - 1, s + 1), 0}});
            for (std::size_t k = 1; k + 1 < rings; ++k)
            {
                elements.push_back(Element{{ring(k, s), ring(k, s + 1), ring(k + 1, s + 1), 0}});
                elements.push_back(Element{{ring(k, s), ring(k + 1, s + 1), ring(k + 1, s), 0}});
            }
        }
        return Mesh(ElementKind::Triangle, std::move(nodes), std::move(elements));
    }
} // namespace tactile::fem
