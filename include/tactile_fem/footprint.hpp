#pragma once

#include "detail/hashing.hpp"
#include "errors.hpp"
#include "mesh.hpp"
#include "mesh_io.hpp"
#include "problem.hpp"
#include "sensor.hpp"
#include "surface.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    // Rigid indenter: an identity plus the triangulated surface that touches the pad.
    // The surface is placed so its lowest point rests on the pad's top plane and
    // its xy bounding-box centre sits at the pad centre plus (offset_x, offset_y).
    class ContactObject
    {
    public:
        ContactObject(std::string id, Mesh surface, double offset_x = 0.0, double offset_y = 0.0)
            : m_id(std::move(id))
            , m_offset_x(offset_x)
            , m_offset_y(offset_y)
        {
            if (m_id.empty())
            {
                throw std::invalid_argument("A contact object needs a non-empty id");
            }
            if (!std::isfinite(offset_x) || !std::isfinite(offset_y))
            {
                throw std::invalid_argument(fmt::format("Offset of object '{}' is not finite", m_id));
            }
            if (surface.element_count() == 0)
            {
                throw MeshError(fmt::format("Object '{}' has an empty surface", m_id));
            }
            // Volumetric assets contribute their boundary.
            m_surface = surface.kind() == ElementKind::Tetrahedron ? extract_boundary(surface).mesh : std::move(surface);
            m_geometry_digest = digest_geometry();
        }

        [[nodiscard]] static ContactObject from_descriptor(const ObjectDescriptor& descriptor, double tolerance = 1e-6)
        {
            return ContactObject(descriptor.id, load(descriptor, tolerance), descriptor.offset_x, descriptor.offset_y);
        }

        [[nodiscard]] const std::string& id() const noexcept { return m_id; }
        [[nodiscard]] const Mesh& surface() const noexcept { return m_surface; }
        [[nodiscard]] double offset_x() const noexcept { return m_offset_x; }
        [[nodiscard]] double offset_y() const noexcept { return m_offset_y; }

        // Digest of the surface and its placement. Objects sharing an id but
        // differing in shape or offset never share cached results.
        [[nodiscard]] const std::string& geometry_digest() const noexcept { return m_geometry_digest; }

    private:
        std::string digest_geometry() const
        {
            detail::Fnv1a128 hash{};
            const auto add = [&hash](const auto& value) { hash.update(&value, sizeof(value)); };
            add(m_offset_x);
            add(m_offset_y);
            add(m_surface.node_count());
            for (const auto& node : m_surface.nodes())
            {
                add(node.x);
                add(node.y);
                add(node.z);
            }
            add(m_surface.element_count());
            for (std::size_t e = 0; e < m_surface.element_count(); ++e)
            {
                for (const auto id : m_surface.element_nodes(e))
                {
                    add(id);
                }
            }
            return hash.hex();
        }

        std::string m_id{};
        Mesh m_surface{};
        double m_offset_x{0.0};
        double m_offset_y{0.0};
        std::string m_geometry_digest{};
    };

    // Per top-surface node, the height of the indenter's lower surface above
    // its lowest point. Nodes the indenter does not cover hold infinity.
    struct Footprint
    {
        std::vector<double> offsets{};

        [[nodiscard]] std::size_t covered_count() const noexcept
        {
            return static_cast<std::size_t>(std::count_if(offsets.begin(), offsets.end(), [](double offset) { return std::isfinite(offset); }));
        }

        // Nodes pressed at nominal `depth`.
        [[nodiscard]] std::size_t contact_count(double depth) const noexcept
        {
            return static_cast<std::size_t>(std::count_if(offsets.begin(), offsets.end(), [depth](double offset) { return offset < depth; }));
        }
    };

    // Vertical ray cast from every top-surface node against the placed indenter.
    // Depends on geometry only, so it is derived once per (sensor, object).
    inline Footprint derive_footprint(const SensorModel& sensor, const ContactObject& object)
    {
        const auto& surface = object.surface();
        const auto& object_bounds = surface.bounds();
        const auto pad_center = sensor.sensing_area().center();
        const auto object_center = object_bounds.center();

        const double shift_x = pad_center.x + object.offset_x() - object_center.x;
        const double shift_y = pad_center.y + object.offset_y() - object_center.y;
        const double lowest_point = object_bounds.min.z;

        const detail::TriangleBuckets buckets(surface);
        const auto& top = sensor.top_surface().mesh;

        Footprint footprint{};
        footprint.offsets.assign(top.node_count(), std::numeric_limits<double>::infinity());

        constexpr double slack = 1e-9;
        std::array<double, 3> weights{};
        for (std::size_t s = 0; s < top.node_count(); ++s)
        {
            const double x = top.node(s).x - shift_x;
            const double y = top.node(s).y - shift_y;

            double lowest = std::numeric_limits<double>::infinity();
            for (const auto t : buckets.candidates(x, y))
            {
                const auto ids = surface.element_nodes(t);
                const auto& a = surface.node(ids[0]);
                const auto& b = surface.node(ids[1]);
                const auto& c = surface.node(ids[2]);
                if (detail::projected_barycentric(a, b, c, x, y, slack, weights))
                {
                    lowest = std::min(lowest, weights[0] * a.z + weights[1] * b.z + weights[2] * c.z);
                }
            }

            if (std::isfinite(lowest))
            {
                footprint.offsets[s] = std::max(0.0, lowest - lowest_point);
            }
        }

        safe_io::debug("Footprint of '{}': {} of {} surface nodes covered", object.id(), footprint.covered_count(), top.node_count());
        return footprint;
    }

    // Dirichlet set for one nominal depth: bottom clamped, every node with
    // offset < depth pushed down by (depth - offset).
    inline ProblemDefinition make_contact_conditions(const SensorModel& sensor, const Footprint& footprint, double depth)
    {
        const auto& top = sensor.top_surface();
        if (footprint.offsets.size() != top.volume_nodes.size())
        {
            throw std::invalid_argument(fmt::format("Footprint covers {} nodes, sensor surface has {}", footprint.offsets.size(), top.volume_nodes.size()));
        }
        if (!std::isfinite(depth) || depth < 0.0)
        {
            throw std::invalid_argument(fmt::format("Indentation depth must be finite and non-negative, got {}", depth));
        }
        const double thickness = sensor.pad().bounds().extent().z;
        if (depth >= thickness)
        {
            throw std::invalid_argument(fmt::format("Indentation depth {} reaches through the {} mm pad", depth, thickness));
        }

        ProblemDefinition problem{};
        for (const auto node : sensor.bottom_nodes())
        {
            problem.boundary_conditions.fix(node);
        }

        const bool sticking = sensor.config().contact == ContactCondition::Sticking;
        for (std::size_t s = 0; s < footprint.offsets.size(); ++s)
        {
            const double offset = footprint.offsets[s];
            if (!(offset < depth))
            {
                continue;
            }
            const auto node = top.volume_nodes[s];
            problem.boundary_conditions.prescribe(node, Axis::Z, -(depth - offset));
            if (sticking)
            {
                problem.boundary_conditions.prescribe(node, Axis::X, 0.0);
                problem.boundary_conditions.prescribe(node, Axis::Y, 0.0);
            }
        }
        return problem;
    }
} // namespace tactile::fem
