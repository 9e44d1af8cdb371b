#pragma once

#include "detail/sparse_matrix.hpp"
#include "grid.hpp"
#include "problem.hpp"
#include "sensor.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

namespace tactile::fem
{
    namespace detail
    {
        inline void check_displacements(const SensorModel& sensor, const std::vector<double>& displacements)
        {
            if (displacements.size() != sensor.pad().node_count() * dofs_per_node)
            {
                throw std::invalid_argument(fmt::format("Expected {} displacement components, got {}",
                                                        sensor.pad().node_count() * dofs_per_node, displacements.size()));
            }
        }

        inline void check_shape(const GridShape& shape)
        {
            if (shape.cells() == 0)
            {
                throw std::invalid_argument(fmt::format("Grid shape {}x{} is empty", shape.rows, shape.cols));
            }
        }

        // Pixel index range whose centres fall inside [low, high].
        inline bool covered_pixels(double low, double high, double origin, double pitch, std::size_t count, std::size_t& first, std::size_t& last)
        {
            const double lo = std::ceil((low - origin) / pitch - 0.5);
            const double hi = std::floor((high - origin) / pitch - 0.5);
            if (hi < 0.0 || lo > static_cast<double>(count - 1) || lo > hi)
            {
                return false;
            }
            first = static_cast<std::size_t>(std::max(lo, 0.0));
            last = static_cast<std::size_t>(std::min(hi, static_cast<double>(count - 1)));
            return true;
        }

        inline std::vector<double> gaussian_kernel(double sigma)
        {
            const auto radius = static_cast<std::size_t>(std::ceil(3.0 * sigma));
            std::vector<double> kernel(2 * radius + 1);
            for (std::size_t i = 0; i < kernel.size(); ++i)
            {
                const double d = static_cast<double>(i) - static_cast<double>(radius);
                kernel[i] = std::exp(-0.5 * d * d / (sigma * sigma));
            }
            return kernel;
        }
    } // namespace detail

    // Separable Gaussian blur with `sigma` in pixels, applied per channel.
    // Taps falling outside the grid are dropped and the rest renormalised,
    // so a uniform field stays uniform up to the border.
    inline FieldGrid gaussian_blur(const FieldGrid& field, double sigma)
    {
        if (!std::isfinite(sigma) || sigma < 0.0)
        {
            throw std::invalid_argument(fmt::format("Blur sigma must be non-negative, got {}", sigma));
        }
        if (sigma == 0.0 || field.empty())
        {
            return field;
        }

        const auto kernel = detail::gaussian_kernel(sigma);
        const auto radius = static_cast<long long>(kernel.size() / 2);
        const auto rows = static_cast<long long>(field.rows());
        const auto cols = static_cast<long long>(field.cols());

        FieldGrid horizontal(field.shape(), field.channels());
        FieldGrid result(field.shape(), field.channels());
        for (std::size_t ch = 0; ch < field.channels(); ++ch)
        {
            for (long long r = 0; r < rows; ++r)
            {
                for (long long c = 0; c < cols; ++c)
                {
                    double sum = 0.0;
                    double weight = 0.0;
                    for (long long k = -radius; k <= radius; ++k)
                    {
                        const long long cc = c + k;
                        if (cc < 0 || cc >= cols)
                        {
                            continue;
                        }
                        const double w = kernel[static_cast<std::size_t>(k + radius)];
                        sum += w * field.at(static_cast<std::size_t>(r), static_cast<std::size_t>(cc), ch);
                        weight += w;
                    }
                    horizontal.at(static_cast<std::size_t>(r), static_cast<std::size_t>(c), ch) = static_cast<float>(sum / weight);
                }
            }

            for (long long r = 0; r < rows; ++r)
            {
                for (long long c = 0; c < cols; ++c)
                {
                    double sum = 0.0;
                    double weight = 0.0;
                    for (long long k = -radius; k <= radius; ++k)
                    {
                        const long long rr = r + k;
                        if (rr < 0 || rr >= rows)
                        {
                            continue;
                        }
                        const double w = kernel[static_cast<std::size_t>(k + radius)];
                        sum += w * horizontal.at(static_cast<std::size_t>(rr), static_cast<std::size_t>(c), ch);
                        weight += w;
                    }
                    result.at(static_cast<std::size_t>(r), static_cast<std::size_t>(c), ch) = static_cast<float>(sum / weight);
                }
            }
        }
        return result;
    }

    // Penetration max(0, -u_z) of the top surface, smoothed over the surface
    // graph, interpolated onto pixel centres and blurred. Pixels outside the
    // surface stay zero.
    inline DepthField extract_depth_field(const SensorModel& sensor, const std::vector<double>& displacements, const GridShape& shape)
    {
        detail::check_displacements(sensor, displacements);
        detail::check_shape(shape);

        const auto& top = sensor.top_surface();
        std::vector<double> penetration(top.volume_nodes.size(), 0.0);
        for (std::size_t s = 0; s < penetration.size(); ++s)
        {
            penetration[s] = std::max(0.0, -displacements[dof_index(top.volume_nodes[s], Axis::Z)]);
        }
        const auto smoothed = detail::multiply(sensor.smoothing_operator(), penetration);

        const auto& area = sensor.sensing_area();
        const double pitch_x = (area.max.x - area.min.x) / static_cast<double>(shape.cols);
        const double pitch_y = (area.max.y - area.min.y) / static_cast<double>(shape.rows);

        DepthField field(shape, 1);
        std::array<double, 3> weights{};
        for (std::size_t t = 0; t < top.mesh.element_count(); ++t)
        {
            const auto ids = top.mesh.element_nodes(t);
            const auto& a = top.mesh.node(ids[0]);
            const auto& b = top.mesh.node(ids[1]);
            const auto& c = top.mesh.node(ids[2]);

            std::size_t c0 = 0, c1 = 0, r0 = 0, r1 = 0;
            if (!detail::covered_pixels(std::min({a.x, b.x, c.x}), std::max({a.x, b.x, c.x}), area.min.x, pitch_x, shape.cols, c0, c1) ||
                !detail::covered_pixels(std::min({a.y, b.y, c.y}), std::max({a.y, b.y, c.y}), area.min.y, pitch_y, shape.rows, r0, r1))
            {
                continue;
            }

            for (std::size_t r = r0; r <= r1; ++r)
            {
                const double y = area.min.y + (static_cast<double>(r) + 0.5) * pitch_y;
                for (std::size_t col = c0; col <= c1; ++col)
                {
                    const double x = area.min.x + (static_cast<double>(col) + 0.5) * pitch_x;
                    if (detail::projected_barycentric(a, b, c, x, y, 1e-9, weights))
                    {
                        const double value = weights[0] * smoothed[ids[0]] + weights[1] * smoothed[ids[1]] + weights[2] * smoothed[ids[2]];
                        field.at(r, col) = static_cast<float>(std::max(0.0, value));
                    }
                }
            }
        }

        return gaussian_blur(field, sensor.config().blur_sigma);
    }

    inline DepthField extract_depth_field(const SensorModel& sensor, const std::vector<double>& displacements)
    {
        return extract_depth_field(sensor, displacements, sensor.config().depth_shape);
    }

    // In-plane displacement (u_x, u_y) at a regular grid of marker positions,
    // one marker at the centre of each cell of `shape` laid over the sensing area.
    inline MarkerDisplacementField extract_marker_displacement(const SensorModel& sensor, const std::vector<double>& displacements, const GridShape& shape)
    {
        detail::check_displacements(sensor, displacements);
        detail::check_shape(shape);

        const auto& top = sensor.top_surface();
        const auto& area = sensor.sensing_area();
        const double pitch_x = (area.max.x - area.min.x) / static_cast<double>(shape.cols);
        const double pitch_y = (area.max.y - area.min.y) / static_cast<double>(shape.rows);

        MarkerDisplacementField field(shape, 2);
        for (std::size_t r = 0; r < shape.rows; ++r)
        {
            const double y = area.min.y + (static_cast<double>(r) + 0.5) * pitch_y;
            for (std::size_t c = 0; c < shape.cols; ++c)
            {
                const double x = area.min.x + (static_cast<double>(c) + 0.5) * pitch_x;
                const auto location = sensor.locator().locate(x, y);
                if (!location)
                {
                    continue;
                }

                const auto ids = top.mesh.element_nodes(location->triangle);
                double ux = 0.0;
                double uy = 0.0;
                for (std::size_t k = 0; k < 3; ++k)
                {
                    const auto node = top.volume_nodes[ids[k]];
                    ux += location->weights[k] * displacements[dof_index(node, Axis::X)];
                    uy += location->weights[k] * displacements[dof_index(node, Axis::Y)];
                }
                field.at(r, c, 0) = static_cast<float>(ux);
                field.at(r, c, 1) = static_cast<float>(uy);
            }
        }
        return field;
    }

    inline MarkerDisplacementField extract_marker_displacement(const SensorModel& sensor, const std::vector<double>& displacements)
    {
        return extract_marker_displacement(sensor, displacements, sensor.config().marker_shape);
    }

    // Mean of squared element-wise differences; shapes and channels must agree.
    inline double mean_squared_error(const FieldGrid& a, const FieldGrid& b)
    {
        if (a.shape() != b.shape() || a.channels() != b.channels())
        {
            throw std::invalid_argument(fmt::format("Cannot compare a {}x{}x{} grid with a {}x{}x{} grid",
                                                    a.rows(), a.cols(), a.channels(), b.rows(), b.cols(), b.channels()));
        }
        if (a.empty())
        {
            return 0.0;
        }

        const auto lhs = a.values();
        const auto rhs = b.values();
        double sum = 0.0;
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            const double d = static_cast<double>(lhs[i]) - static_cast<double>(rhs[i]);
            sum += d * d;
        }
        return sum / static_cast<double>(lhs.size());
    }
} // namespace tactile::fem
