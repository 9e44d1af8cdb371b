#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace tactile::fem
{
    struct GridShape
    {
        std::size_t rows{0};
        std::size_t cols{0};

        [[nodiscard]] std::size_t cells() const noexcept { return rows * cols; }

        friend bool operator==(const GridShape&, const GridShape&) = default;
    };

    // Row-major rows x cols x channels block of float samples.
    class FieldGrid
    {
    public:
        FieldGrid() = default;

        FieldGrid(GridShape shape, std::size_t channels, float fill = 0.0f)
            : m_shape(shape)
            , m_channels(channels)
            , m_values(shape.cells() * channels, fill)
        {
            if (channels == 0)
            {
                throw std::invalid_argument("A field grid needs at least one channel");
            }
        }

        FieldGrid(GridShape shape, std::size_t channels, std::vector<float> values)
            : m_shape(shape)
            , m_channels(channels)
            , m_values(std::move(values))
        {
            if (channels == 0 || m_values.size() != shape.cells() * channels)
            {
                throw std::invalid_argument(fmt::format("Field grid {}x{}x{} cannot hold {} values",
                                                        shape.rows, shape.cols, channels, m_values.size()));
            }
        }

        [[nodiscard]] const GridShape& shape() const noexcept { return m_shape; }
        [[nodiscard]] std::size_t rows() const noexcept { return m_shape.rows; }
        [[nodiscard]] std::size_t cols() const noexcept { return m_shape.cols; }
        [[nodiscard]] std::size_t channels() const noexcept { return m_channels; }
        [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_values.empty(); }

        [[nodiscard]] std::span<const float> values() const noexcept { return m_values; }
        [[nodiscard]] std::span<float> values() noexcept { return m_values; }

        [[nodiscard]] float& at(std::size_t row, std::size_t col, std::size_t channel = 0)
        {
            return m_values[offset(row, col, channel)];
        }

        [[nodiscard]] float at(std::size_t row, std::size_t col, std::size_t channel = 0) const
        {
            return m_values[offset(row, col, channel)];
        }

        [[nodiscard]] float max_value() const noexcept
        {
            return m_values.empty() ? 0.0f : *std::max_element(m_values.begin(), m_values.end());
        }

        [[nodiscard]] float min_value() const noexcept
        {
            return m_values.empty() ? 0.0f : *std::min_element(m_values.begin(), m_values.end());
        }

        friend bool operator==(const FieldGrid&, const FieldGrid&) = default;

    private:
        [[nodiscard]] std::size_t offset(std::size_t row, std::size_t col, std::size_t channel) const
        {
            if (row >= m_shape.rows || col >= m_shape.cols || channel >= m_channels)
            {
                throw std::out_of_range(fmt::format("Grid index ({}, {}, {}) outside {}x{}x{}",
                                                    row, col, channel, m_shape.rows, m_shape.cols, m_channels));
            }
            return (row * m_shape.cols + col) * m_channels + channel;
        }

        GridShape m_shape{};
        std::size_t m_channels{1};
        std::vector<float> m_values{};
    };

    // Dense penetration map, one channel, millimetres, non-negative.
    using DepthField = FieldGrid;
    // Tangential marker displacement, channel 0 = x, channel 1 = y, millimetres.
    using MarkerDisplacementField = FieldGrid;

    // The two readouts of one solve.
    struct SimulationOutput
    {
        DepthField depth_field{};
        MarkerDisplacementField marker_displacement{};

        friend bool operator==(const SimulationOutput&, const SimulationOutput&) = default;
    };
} // namespace tactile::fem
