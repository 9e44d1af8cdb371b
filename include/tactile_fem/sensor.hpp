#pragma once

#include "grid.hpp"
#include "mesh.hpp"
#include "stiffness.hpp"
#include "surface.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    enum class ContactCondition
    {
        // Contact nodes follow the indenter and cannot slide.
        Sticking,
        // Only the normal displacement is prescribed.
        Frictionless,
    };

    inline std::string_view to_string(ContactCondition condition) noexcept
    {
        switch (condition)
        {
        case ContactCondition::Sticking:
            return "Sticking";
        case ContactCondition::Frictionless:
            return "Frictionless";
        }
        return "Unknown";
    }

    // Pad geometry and readout resolution. Lengths are millimetres; the pad
    // spans [0, pad_width] x [0, pad_length] x [0, pad_thickness].
    struct SensorConfig
    {
        double pad_width{17.2};
        double pad_length{28.5};
        double pad_thickness{3.0};

        std::size_t cells_x{18};
        std::size_t cells_y{30};
        std::size_t cells_z{4};

        // Rows run along y, columns along x.
        GridShape depth_shape{700, 400};
        GridShape marker_shape{20, 11};

        double smoothing_weight{0.3};
        // Gaussian sigma in depth-field pixels; 0 disables the blur.
        double blur_sigma{1.5};

        ContactCondition contact{ContactCondition::Sticking};
        double tolerance{1e-6};

        void validate() const
        {
            const auto positive = [](double value) { return std::isfinite(value) && value > 0.0; };
            if (!positive(pad_width) || !positive(pad_length) || !positive(pad_thickness))
            {
                throw std::invalid_argument(fmt::format("Pad dimensions must be positive, got {} x {} x {}", pad_width, pad_length, pad_thickness));
            }
            if (cells_x == 0 || cells_y == 0 || cells_z == 0)
            {
                throw std::invalid_argument("Pad resolution needs at least one cell per axis");
            }
            if (depth_shape.cells() == 0 || marker_shape.cells() == 0)
            {
                throw std::invalid_argument("Depth and marker grids must not be empty");
            }
            if (!(smoothing_weight >= 0.0 && smoothing_weight <= 1.0))
            {
                throw std::invalid_argument(fmt::format("Smoothing weight must lie in [0, 1], got {}", smoothing_weight));
            }
            if (!(std::isfinite(blur_sigma) && blur_sigma >= 0.0))
            {
                throw std::invalid_argument(fmt::format("Blur sigma must be non-negative, got {}", blur_sigma));
            }
            if (!positive(tolerance))
            {
                throw std::invalid_argument("Geometric tolerance must be positive");
            }
        }
    };

    // Structured tetrahedral pad: every hexahedral cell is split into six
    // tetrahedra sharing the cell diagonal, which keeps neighbouring cells conforming.
    inline Mesh make_pad_mesh(const SensorConfig& config)
    {
        config.validate();

        const std::size_t nx = config.cells_x + 1;
        const std::size_t ny = config.cells_y + 1;
        const std::size_t nz = config.cells_z + 1;
        const auto index = [&](std::size_t i, std::size_t j, std::size_t k) { return i + nx * (j + ny * k); };

        std::vector<Node> nodes;
        nodes.reserve(nx * ny * nz);
        for (std::size_t k = 0; k < nz; ++k)
        {
            for (std::size_t j = 0; j < ny; ++j)
            {
                for (std::size_t i = 0; i < nx; ++i)
                {
                    nodes.push_back(Node{config.pad_width * static_cast<double>(i) / static_cast<double>(config.cells_x),
                                         config.pad_length * static_cast<double>(j) / static_cast<double>(config.cells_y),
                                         config.pad_thickness * static_cast<double>(k) / static_cast<double>(config.cells_z)});
                }
            }
        }

        // Paths from corner (0,0,0) to (1,1,1) through each axis permutation.
        static constexpr std::array<std::array<std::size_t, 3>, 6> permutations{{{0, 1, 2}, {0, 2, 1}, {1, 0, 2}, {1, 2, 0}, {2, 0, 1}, {2, 1, 0}}};

        std::vector<Element> elements;
        elements.reserve(config.cells_x * config.cells_y * config.cells_z * permutations.size());
        for (std::size_t k = 0; k < config.cells_z; ++k)
        {
            for (std::size_t j = 0; j < config.cells_y; ++j)
            {
                for (std::size_t i = 0; i < config.cells_x; ++i)
                {
                    for (const auto& axes : permutations)
                    {
                        std::array<std::size_t, 3> corner{i, j, k};
                        Element element{};
                        element.node_ids[0] = index(corner[0], corner[1], corner[2]);
                        for (std::size_t step = 0; step < 3; ++step)
                        {
                            ++corner[axes[step]];
                            element.node_ids[step + 1] = index(corner[0], corner[1], corner[2]);
                        }
                        elements.push_back(element);
                    }
                }
            }
        }

        return Mesh(ElementKind::Tetrahedron, std::move(nodes), std::move(elements));
    }

    // Immutable per-pad state shared read-only by every solve: the volume mesh,
    // its top surface, the clamped bottom nodes, the smoothing operator and the
    // surface point locator. Held through shared_ptr<const SensorModel>; the
    // locator points into the owned surface, so instances never move.
    class SensorModel
    {
    public:
        SensorModel(const SensorModel&) = delete;
        SensorModel& operator=(const SensorModel&) = delete;
        SensorModel(SensorModel&&) = delete;
        SensorModel& operator=(SensorModel&&) = delete;

        // Generates the structured pad from the configuration.
        [[nodiscard]] static std::shared_ptr<const SensorModel> create(const SensorConfig& config)
        {
            return create(config, make_pad_mesh(config));
        }

        // Uses a precomputed tetrahedral pad; the cell counts of `config` are ignored.
        [[nodiscard]] static std::shared_ptr<const SensorModel> create(const SensorConfig& config, Mesh pad)
        {
            return std::shared_ptr<const SensorModel>(new SensorModel(config, std::move(pad)));
        }

        [[nodiscard]] const SensorConfig& config() const noexcept { return m_config; }
        [[nodiscard]] const Mesh& pad() const noexcept { return m_pad; }
        [[nodiscard]] const BoundarySurface& top_surface() const noexcept { return m_top; }
        [[nodiscard]] const std::vector<std::size_t>& bottom_nodes() const noexcept { return m_bottom; }
        [[nodiscard]] const CsrMatrix& smoothing_operator() const noexcept { return m_smoothing; }
        [[nodiscard]] const SurfaceLocator& locator() const noexcept { return m_locator; }

        // xy rectangle the depth and marker grids cover.
        [[nodiscard]] const Bounds& sensing_area() const noexcept { return m_top.mesh.bounds(); }

        // Identifies everything that changes the fields for a given solve, so
        // differently configured sensors never share cache entries.
        [[nodiscard]] const std::string& fingerprint() const noexcept { return m_fingerprint; }

    private:
        SensorModel(const SensorConfig& config, Mesh pad)
            : m_config(config)
            , m_pad(std::move(pad))
        {
            m_config.validate();
            if (m_pad.kind() != ElementKind::Tetrahedron)
            {
                throw MeshError("The sensor pad must be a tetrahedral mesh");
            }

            m_top = extract_top_surface(m_pad, m_config.tolerance);
            m_bottom = fem::bottom_nodes(m_pad, m_config.tolerance);
            m_smoothing = assemble_smoothing_operator(m_top.mesh, m_config.smoothing_weight);
            m_locator = SurfaceLocator(m_top.mesh);

            const auto& extent = m_pad.bounds();
            m_fingerprint = fmt::format("pad[{:.6f},{:.6f},{:.6f}]-[{:.6f},{:.6f},{:.6f}]/n{}/e{}/d{}x{}/m{}x{}/w{:.6f}/s{:.6f}/{}",
                                        extent.min.x, extent.min.y, extent.min.z,
                                        extent.max.x, extent.max.y, extent.max.z,
                                        m_pad.node_count(), m_pad.element_count(),
                                        m_config.depth_shape.rows, m_config.depth_shape.cols,
                                        m_config.marker_shape.rows, m_config.marker_shape.cols,
                                        m_config.smoothing_weight, m_config.blur_sigma,
                                        to_string(m_config.contact));

            safe_io::debug("Sensor pad: {} nodes, {} tetrahedra, {} top-surface nodes, {} clamped nodes",
                           m_pad.node_count(), m_pad.element_count(), m_top.volume_nodes.size(), m_bottom.size());
        }

        SensorConfig m_config{};
        Mesh m_pad{};
        BoundarySurface m_top{};
        std::vector<std::size_t> m_bottom{};
        CsrMatrix m_smoothing{};
        SurfaceLocator m_locator{};
        std::string m_fingerprint{};
    };
} // namespace tactile::fem
