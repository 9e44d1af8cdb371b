#include <gtest/gtest.h>

#include "test_support.hpp"

#include <tactile_fem/fields.hpp>
#include <tactile_fem/sensor.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using tactile::fem::Axis;
using tactile::fem::FieldGrid;
using tactile::fem::GridShape;
using tactile::fem::SensorModel;

class TestFields : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_sensor = SensorModel::create(tactile::fem::test_support::small_sensor_config());
        m_displacements.assign(m_sensor->pad().node_count() * tactile::fem::dofs_per_node, 0.0);
    }

    void set_top(Axis axis, double value)
    {
        for (const auto node : m_sensor->top_surface().volume_nodes)
        {
            m_displacements[tactile::fem::dof_index(node, axis)] = value;
        }
    }

    std::shared_ptr<const SensorModel> m_sensor{};
    std::vector<double> m_displacements{};
};

TEST(GaussianBlur, UniformFieldStaysUniform)
{
    const FieldGrid field(GridShape{12, 9}, 2, 0.25f);
    const auto blurred = tactile::fem::gaussian_blur(field, 1.5);
    for (const float value : blurred.values())
    {
        EXPECT_NEAR(value, 0.25f, 1e-6f);
    }
}

TEST(GaussianBlur, ZeroSigmaIsIdentity)
{
    FieldGrid field(GridShape{4, 4}, 1);
    field.at(1, 2) = 3.0f;
    EXPECT_EQ(tactile::fem::gaussian_blur(field, 0.0), field);
    EXPECT_THROW((void)tactile::fem::gaussian_blur(field, -1.0), std::invalid_argument);
}

TEST(GaussianBlur, SpreadsAnImpulseSymmetrically)
{
    FieldGrid field(GridShape{15, 15}, 1);
    field.at(7, 7) = 1.0f;
    const auto blurred = tactile::fem::gaussian_blur(field, 1.0);

    EXPECT_LT(blurred.at(7, 7), 1.0f);
    EXPECT_GT(blurred.at(7, 8), 0.0f);
    EXPECT_FLOAT_EQ(blurred.at(7, 8), blurred.at(7, 6));
    EXPECT_FLOAT_EQ(blurred.at(6, 7), blurred.at(8, 7));
    EXPECT_FLOAT_EQ(blurred.at(7, 8), blurred.at(8, 7));
    // Radius is ceil(3 sigma) pixels.
    EXPECT_EQ(blurred.at(7, 11), 0.0f);

    double total = 0.0;
    for (const float value : blurred.values())
    {
        total += value;
    }
    EXPECT_NEAR(total, 1.0, 1e-5);
}

TEST(MeanSquaredError, ComparesMatchingGrids)
{
    const FieldGrid a(GridShape{2, 2}, 1, std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f});
    const FieldGrid b(GridShape{2, 2}, 1, std::vector<float>{0.0f, 1.0f, 2.0f, 5.0f});
    EXPECT_DOUBLE_EQ(tactile::fem::mean_squared_error(a, a), 0.0);
    EXPECT_DOUBLE_EQ(tactile::fem::mean_squared_error(a, b), 1.0);
    EXPECT_DOUBLE_EQ(tactile::fem::mean_squared_error(FieldGrid{}, FieldGrid{}), 0.0);

    EXPECT_THROW((void)tactile::fem::mean_squared_error(a, FieldGrid(GridShape{2, 2}, 2)), std::invalid_argument);
    EXPECT_THROW((void)tactile::fem::mean_squared_error(a, FieldGrid(GridShape{1, 4}, 1)), std::invalid_argument);
}

TEST(FieldGrid, RejectsBadSizesAndIndices)
{
    EXPECT_THROW(FieldGrid(GridShape{2, 2}, 0), std::invalid_argument);
    EXPECT_THROW(FieldGrid(GridShape{2, 2}, 1, std::vector<float>(3)), std::invalid_argument);

    const FieldGrid grid(GridShape{2, 3}, 2);
    EXPECT_THROW((void)grid.at(2, 0), std::out_of_range);
    EXPECT_THROW((void)grid.at(0, 0, 2), std::out_of_range);
}

TEST_F(TestFields, UndeformedPadReadsZero)
{
    const auto depth = tactile::fem::extract_depth_field(*m_sensor, m_displacements);
    EXPECT_EQ(depth.shape(), (GridShape{50, 50}));
    EXPECT_EQ(depth.channels(), 1u);
    EXPECT_EQ(depth.max_value(), 0.0f);

    const auto markers = tactile::fem::extract_marker_displacement(*m_sensor, m_displacements);
    EXPECT_EQ(markers.shape(), (GridShape{5, 5}));
    EXPECT_EQ(markers.channels(), 2u);
    EXPECT_EQ(markers.max_value(), 0.0f);
    EXPECT_EQ(markers.min_value(), 0.0f);
}

TEST_F(TestFields, UniformPressReadsItsDepth)
{
    set_top(Axis::Z, -0.1);
    const auto depth = tactile::fem::extract_depth_field(*m_sensor, m_displacements);
    for (const float value : depth.values())
    {
        EXPECT_NEAR(value, 0.1f, 1e-6f);
    }
}

TEST_F(TestFields, UpwardMotionIsNotPenetration)
{
    set_top(Axis::Z, 0.2);
    const auto depth = tactile::fem::extract_depth_field(*m_sensor, m_displacements);
    EXPECT_EQ(depth.max_value(), 0.0f);
    EXPECT_EQ(depth.min_value(), 0.0f);
}

TEST_F(TestFields, CustomDepthShapeIsHonoured)
{
    set_top(Axis::Z, -0.05);
    const auto depth = tactile::fem::extract_depth_field(*m_sensor, m_displacements, GridShape{7, 3});
    EXPECT_EQ(depth.shape(), (GridShape{7, 3}));
    EXPECT_NEAR(depth.at(3, 1), 0.05f, 1e-6f);
    EXPECT_THROW((void)tactile::fem::extract_depth_field(*m_sensor, m_displacements, GridShape{0, 3}), std::invalid_argument);
}

TEST_F(TestFields, MarkersSampleInPlaneDisplacement)
{
    // u_x linear in x is reproduced exactly by the surface interpolation.
    const auto& pad = m_sensor->pad();
    for (const auto node : m_sensor->top_surface().volume_nodes)
    {
        m_displacements[tactile::fem::dof_index(node, Axis::X)] = 0.01 * pad.node(node).x;
        m_displacements[tactile::fem::dof_index(node, Axis::Y)] = -0.02;
    }

    const auto markers = tactile::fem::extract_marker_displacement(*m_sensor, m_displacements);
    for (std::size_t r = 0; r < 5; ++r)
    {
        for (std::size_t c = 0; c < 5; ++c)
        {
            const double x = 1.0 + 2.0 * static_cast<double>(c);
            EXPECT_NEAR(markers.at(r, c, 0), 0.01 * x, 1e-6) << r << "," << c;
            EXPECT_NEAR(markers.at(r, c, 1), -0.02, 1e-6) << r << "," << c;
        }
    }
}

TEST_F(TestFields, WrongDisplacementSizeIsRejected)
{
    m_displacements.pop_back();
    EXPECT_THROW((void)tactile::fem::extract_depth_field(*m_sensor, m_displacements), std::invalid_argument);
    EXPECT_THROW((void)tactile::fem::extract_marker_displacement(*m_sensor, m_displacements), std::invalid_argument);
}
