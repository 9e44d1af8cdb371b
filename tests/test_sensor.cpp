#include <gtest/gtest.h>

#include "test_support.hpp"

#include <tactile_fem/footprint.hpp>
#include <tactile_fem/primitives.hpp>
#include <tactile_fem/sensor.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

using tactile::fem::Axis;
using tactile::fem::ContactCondition;
using tactile::fem::ContactObject;
using tactile::fem::SensorConfig;
using tactile::fem::SensorModel;

class TestSensor : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_config = tactile::fem::test_support::small_sensor_config();
        m_sensor = SensorModel::create(m_config);
    }

    SensorConfig m_config{};
    std::shared_ptr<const SensorModel> m_sensor{};
};

TEST(SensorConfig, ValidationRejectsBadValues)
{
    SensorConfig thin{};
    thin.pad_thickness = 0.0;
    EXPECT_THROW(thin.validate(), std::invalid_argument);

    SensorConfig coarse{};
    coarse.cells_z = 0;
    EXPECT_THROW(coarse.validate(), std::invalid_argument);

    SensorConfig smoothing{};
    smoothing.smoothing_weight = 1.2;
    EXPECT_THROW(smoothing.validate(), std::invalid_argument);

    SensorConfig grid{};
    grid.marker_shape = {0, 11};
    EXPECT_THROW(grid.validate(), std::invalid_argument);

    EXPECT_NO_THROW(SensorConfig{}.validate());
}

TEST_F(TestSensor, ModelExposesPadTopAndBottom)
{
    const auto& pad = m_sensor->pad();
    EXPECT_EQ(pad.node_count(), 21u * 21u * 5u);
    EXPECT_EQ(m_sensor->top_surface().volume_nodes.size(), 21u * 21u);
    EXPECT_EQ(m_sensor->bottom_nodes().size(), 21u * 21u);
    EXPECT_EQ(m_sensor->smoothing_operator().dimension(), 21u * 21u);
    EXPECT_DOUBLE_EQ(m_sensor->sensing_area().max.x, 10.0);
    EXPECT_DOUBLE_EQ(m_sensor->sensing_area().max.y, 10.0);
}

TEST_F(TestSensor, FingerprintTracksConfiguration)
{
    auto other = m_config;
    other.blur_sigma = 2.0;
    EXPECT_NE(SensorModel::create(other)->fingerprint(), m_sensor->fingerprint());
    EXPECT_EQ(SensorModel::create(m_config)->fingerprint(), m_sensor->fingerprint());
}

TEST_F(TestSensor, SuppliedPadMeshIsUsed)
{
    auto coarse = m_config;
    coarse.cells_x = 5;
    coarse.cells_y = 5;
    coarse.cells_z = 2;
    const auto sensor = SensorModel::create(m_config, tactile::fem::make_pad_mesh(coarse));
    EXPECT_EQ(sensor->pad().node_count(), 6u * 6u * 3u);

    EXPECT_THROW((void)SensorModel::create(m_config, tactile::fem::make_cylinder_surface(1.0, 1.0)), tactile::fem::MeshError);
}

TEST_F(TestSensor, FlatCylinderFootprintIsADisc)
{
    const ContactObject cylinder("cylinder", tactile::fem::make_cylinder_surface(2.0, 3.0));
    const auto footprint = tactile::fem::derive_footprint(*m_sensor, cylinder);

    const auto& top = m_sensor->top_surface().mesh;
    ASSERT_EQ(footprint.offsets.size(), top.node_count());
    for (std::size_t s = 0; s < top.node_count(); ++s)
    {
        const double r = std::hypot(top.node(s).x - 5.0, top.node(s).y - 5.0);
        if (r < 1.9)
        {
            EXPECT_NEAR(footprint.offsets[s], 0.0, 1e-9) << "r=" << r;
        }
        else if (r > 2.1)
        {
            EXPECT_TRUE(std::isinf(footprint.offsets[s])) << "r=" << r;
        }
    }
    EXPECT_GT(footprint.covered_count(), 30u);
    EXPECT_EQ(footprint.contact_count(0.0), 0u);
    EXPECT_EQ(footprint.contact_count(0.1), footprint.covered_count());
}

TEST_F(TestSensor, SphereFootprintRisesAwayFromTheCentre)
{
    const ContactObject sphere("sphere", tactile::fem::make_sphere_surface(3.0, 48, 96));
    const auto footprint = tactile::fem::derive_footprint(*m_sensor, sphere);

    const auto& top = m_sensor->top_surface().mesh;
    for (std::size_t s = 0; s < top.node_count(); ++s)
    {
        const double r = std::hypot(top.node(s).x - 5.0, top.node(s).y - 5.0);
        if (r < 2.5)
        {
            const double expected = 3.0 - std::sqrt(9.0 - r * r);
            EXPECT_NEAR(footprint.offsets[s], expected, 0.05) << "r=" << r;
        }
    }
    // Fewer nodes touch at a shallow depth than at a deep one.
    EXPECT_LT(footprint.contact_count(0.05), footprint.contact_count(0.5));
}

TEST_F(TestSensor, ObjectOffsetMovesTheFootprint)
{
    const ContactObject shifted("shifted", tactile::fem::make_cylinder_surface(1.0, 1.0), 3.0, -2.0);
    const auto footprint = tactile::fem::derive_footprint(*m_sensor, shifted);

    const auto& top = m_sensor->top_surface().mesh;
    for (std::size_t s = 0; s < top.node_count(); ++s)
    {
        if (std::isfinite(footprint.offsets[s]))
        {
            EXPECT_LE(std::hypot(top.node(s).x - 8.0, top.node(s).y - 3.0), 1.0 + 1e-9);
        }
    }
    EXPECT_GT(footprint.covered_count(), 0u);
}

TEST_F(TestSensor, ContactConditionsClampBottomAndPressFootprint)
{
    const ContactObject cylinder("cylinder", tactile::fem::make_cylinder_surface(2.0, 3.0));
    const auto footprint = tactile::fem::derive_footprint(*m_sensor, cylinder);

    const auto resting = tactile::fem::make_contact_conditions(*m_sensor, footprint, 0.0);
    EXPECT_EQ(resting.boundary_conditions.size(), 3 * m_sensor->bottom_nodes().size());

    const auto pressed = tactile::fem::make_contact_conditions(*m_sensor, footprint, 0.2);
    EXPECT_EQ(pressed.boundary_conditions.size(), 3 * (m_sensor->bottom_nodes().size() + footprint.covered_count()));

    const auto& top = m_sensor->top_surface();
    for (std::size_t s = 0; s < footprint.offsets.size(); ++s)
    {
        if (std::isfinite(footprint.offsets[s]))
        {
            const auto dof = tactile::fem::dof_index(top.volume_nodes[s], Axis::Z);
            EXPECT_DOUBLE_EQ(pressed.boundary_conditions.values().at(dof), -0.2);
        }
    }

    auto frictionless = m_config;
    frictionless.contact = ContactCondition::Frictionless;
    const auto sliding_sensor = SensorModel::create(frictionless);
    const auto sliding = tactile::fem::make_contact_conditions(*sliding_sensor, tactile::fem::derive_footprint(*sliding_sensor, cylinder), 0.2);
    EXPECT_EQ(sliding.boundary_conditions.size(), 3 * sliding_sensor->bottom_nodes().size() + footprint.covered_count());
    for (std::size_t s = 0; s < footprint.offsets.size(); ++s)
    {
        if (std::isfinite(footprint.offsets[s]))
        {
            const auto node = sliding_sensor->top_surface().volume_nodes[s];
            EXPECT_TRUE(sliding.boundary_conditions.is_constrained(tactile::fem::dof_index(node, Axis::Z)));
            EXPECT_FALSE(sliding.boundary_conditions.is_constrained(tactile::fem::dof_index(node, Axis::X)));
            EXPECT_TRUE(pressed.boundary_conditions.is_constrained(tactile::fem::dof_index(node, Axis::X)));
        }
    }
}

TEST_F(TestSensor, InvalidDepthIsRejected)
{
    const ContactObject cylinder("cylinder", tactile::fem::make_cylinder_surface(2.0, 3.0));
    const auto footprint = tactile::fem::derive_footprint(*m_sensor, cylinder);

    EXPECT_THROW((void)tactile::fem::make_contact_conditions(*m_sensor, footprint, -0.1), std::invalid_argument);
    EXPECT_THROW((void)tactile::fem::make_contact_conditions(*m_sensor, footprint, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW((void)tactile::fem::make_contact_conditions(*m_sensor, footprint, 2.5), std::invalid_argument);
    EXPECT_THROW((void)tactile::fem::make_contact_conditions(*m_sensor, tactile::fem::Footprint{}, 0.1), std::invalid_argument);
}

TEST(ContactObject, RequiresAnId)
{
    EXPECT_THROW(ContactObject("", tactile::fem::make_cylinder_surface(1.0, 1.0)), std::invalid_argument);
}
