#include <gtest/gtest.h>

#include "test_support.hpp"

#include <tactile_fem/errors.hpp>
#include <tactile_fem/footprint.hpp>
#include <tactile_fem/primitives.hpp>
#include <tactile_fem/result_cache.hpp>
#include <tactile_fem/simulator.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using tactile::fem::CalibrationSample;
using tactile::fem::ContactObject;
using tactile::fem::ContactSimulator;
using tactile::fem::MaterialParameters;
using tactile::fem::ResultCache;
using tactile::fem::SensorModel;
using tactile::fem::SimulationOutput;

namespace
{
    double total_depth(const SimulationOutput& output)
    {
        const auto values = output.depth_field.values();
        return std::accumulate(values.begin(), values.end(), 0.0);
    }
} // namespace

class TestSimulator : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_sensor = SensorModel::create(tactile::fem::test_support::small_sensor_config());
    }

    std::shared_ptr<const SensorModel> m_sensor{};
    MaterialParameters m_material{0.2, 0.45};
    ContactObject m_cylinder{"cylinder_r2", tactile::fem::make_cylinder_surface(2.0, 3.0)};
};

TEST_F(TestSimulator, FlatIndenterPressesItsDepth)
{
    const ContactSimulator simulator(m_sensor);
    const auto output = simulator.solve(m_cylinder, m_material, 0.2);

    const auto& depth = output.depth_field;
    ASSERT_EQ(depth.shape(), m_sensor->config().depth_shape);
    EXPECT_NEAR(depth.max_value(), 0.2f, 0.01f);
    EXPECT_GE(depth.min_value(), 0.0f);
    EXPECT_NEAR(depth.at(25, 25), 0.2f, 0.01f);
    EXPECT_LT(depth.at(0, 0), 0.01f);
    EXPECT_LT(depth.at(49, 49), 0.01f);

    // Pixel pitch is 0.2 mm; well outside the contact disc the surface is not pressed.
    for (std::size_t r = 0; r < depth.rows(); ++r)
    {
        for (std::size_t c = 0; c < depth.cols(); ++c)
        {
            const double x = 0.2 * (static_cast<double>(c) + 0.5);
            const double y = 0.2 * (static_cast<double>(r) + 0.5);
            if (std::hypot(x - 5.0, y - 5.0) > 4.0)
            {
                EXPECT_LT(depth.at(r, c), 0.05f) << r << "," << c;
            }
        }
    }

    // Sticking contact holds the pressed area in place.
    const auto& markers = output.marker_displacement;
    EXPECT_NEAR(markers.at(2, 2, 0), 0.0f, 1e-6f);
    EXPECT_NEAR(markers.at(2, 2, 1), 0.0f, 1e-6f);
}

TEST_F(TestSimulator, ZeroDepthReadsNothing)
{
    const ContactSimulator simulator(m_sensor);
    const auto output = simulator.solve(m_cylinder, m_material, 0.0);
    EXPECT_EQ(output.depth_field.max_value(), 0.0f);
    EXPECT_EQ(output.marker_displacement.max_value(), 0.0f);
    EXPECT_EQ(output.marker_displacement.min_value(), 0.0f);
}

TEST_F(TestSimulator, DeeperPressesReadMore)
{
    const ContactObject sphere("sphere_r4", tactile::fem::make_sphere_surface(4.0));
    const ContactSimulator simulator(m_sensor);
    const std::vector<double> depths{0.1, 0.2, 0.3};
    const auto outputs = simulator.solve_depths(sphere, m_material, depths);

    ASSERT_EQ(outputs.size(), depths.size());
    EXPECT_LT(total_depth(outputs[0]), total_depth(outputs[1]));
    EXPECT_LT(total_depth(outputs[1]), total_depth(outputs[2]));
    EXPECT_LT(outputs[0].depth_field.max_value(), outputs[2].depth_field.max_value());
}

TEST_F(TestSimulator, RepeatedSolvesAreIdentical)
{
    const ContactSimulator simulator(m_sensor);
    EXPECT_EQ(simulator.solve(m_cylinder, m_material, 0.15), simulator.solve(m_cylinder, m_material, 0.15));
}

TEST_F(TestSimulator, BatchMatchesSingleSolves)
{
    const ContactSimulator simulator(m_sensor);
    const std::vector<double> depths{0.05, 0.25};
    const auto batch = simulator.solve_depths(m_cylinder, m_material, depths);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0], simulator.solve(m_cylinder, m_material, 0.05));
    EXPECT_EQ(batch[1], simulator.solve(m_cylinder, m_material, 0.25));
}

TEST_F(TestSimulator, ConcurrentCollectionMatchesSequentialSolves)
{
    const std::vector<ContactObject> objects{
        ContactObject("left", tactile::fem::make_cylinder_surface(1.5, 2.0), -2.5, 0.0),
        ContactObject("right", tactile::fem::make_cylinder_surface(1.5, 2.0), 2.5, 0.0),
    };
    const std::vector<double> depths{0.1, 0.2};

    const ContactSimulator simulator(m_sensor);
    const auto samples = simulator.collect_calibration_data(objects, m_material, depths, 2);

    ASSERT_EQ(samples.size(), 4u);
    std::size_t index = 0;
    for (const auto& object : objects)
    {
        for (const double depth : depths)
        {
            const auto& sample = samples[index++];
            EXPECT_EQ(sample.object_id, object.id());
            EXPECT_DOUBLE_EQ(sample.depth, depth);
            EXPECT_EQ(sample.output, simulator.solve(object, m_material, depth)) << object.id() << " at " << depth;
        }
    }

    // The two indenters touch opposite halves of the pad.
    EXPECT_GT(samples[1].output.depth_field.at(25, 12), 0.1f);
    EXPECT_LT(samples[1].output.depth_field.at(25, 37), 0.01f);
    EXPECT_GT(samples[3].output.depth_field.at(25, 37), 0.1f);
    EXPECT_LT(samples[3].output.depth_field.at(25, 12), 0.01f);
}

TEST_F(TestSimulator, CachedResultsMatchFreshSolves)
{
    tactile::fem::test_support::TemporaryDirectory directory;
    const auto cache = std::make_shared<const ResultCache>(directory.path(), m_sensor->fingerprint());
    const ContactSimulator cached(m_sensor, {}, cache);
    const ContactSimulator uncached(m_sensor);

    const auto first = cached.solve(m_cylinder, m_material, 0.2);
    const auto key = cache->key(m_cylinder.id(), m_cylinder.geometry_digest(), m_material.youngs_modulus, m_material.poisson_ratio, 0.2);
    ASSERT_TRUE(std::filesystem::exists(cache->entry_path(key)));

    EXPECT_EQ(cached.solve(m_cylinder, m_material, 0.2), first);
    EXPECT_EQ(uncached.solve(m_cylinder, m_material, 0.2), first);
    EXPECT_EQ(cache->get(key).value(), first);
}

TEST_F(TestSimulator, PlacementIsPartOfTheCacheIdentity)
{
    tactile::fem::test_support::TemporaryDirectory directory;
    const auto cache = std::make_shared<const ResultCache>(directory.path(), m_sensor->fingerprint());
    const ContactSimulator cached(m_sensor, {}, cache);
    const ContactSimulator uncached(m_sensor);

    const ContactObject left("indenter", tactile::fem::make_cylinder_surface(1.5, 2.0), -2.5, 0.0);
    const ContactObject right("indenter", tactile::fem::make_cylinder_surface(1.5, 2.0), 2.5, 0.0);
    const ContactObject left_again("indenter", tactile::fem::make_cylinder_surface(1.5, 2.0), -2.5, 0.0);
    EXPECT_NE(left.geometry_digest(), right.geometry_digest());
    EXPECT_EQ(left.geometry_digest(), left_again.geometry_digest());

    (void)cached.solve(left, m_material, 0.2);
    const auto from_cache = cached.solve(right, m_material, 0.2);
    EXPECT_EQ(from_cache, uncached.solve(right, m_material, 0.2));
    EXPECT_GT(from_cache.depth_field.at(25, 37), 0.1f);
}

TEST_F(TestSimulator, UnwritableCacheStillReturnsResults)
{
    tactile::fem::test_support::TemporaryDirectory directory;
    const auto blocker = directory.write("not_a_directory", "x");
    const auto cache = std::make_shared<const ResultCache>(blocker / "entries", m_sensor->fingerprint());
    const ContactSimulator cached(m_sensor, {}, cache);
    const ContactSimulator uncached(m_sensor);

    EXPECT_EQ(cached.solve(m_cylinder, m_material, 0.2), uncached.solve(m_cylinder, m_material, 0.2));
}

TEST_F(TestSimulator, CorruptCacheEntryFallsBackToSolving)
{
    tactile::fem::test_support::TemporaryDirectory directory;
    const auto cache = std::make_shared<const ResultCache>(directory.path(), m_sensor->fingerprint());
    const auto key = cache->key(m_cylinder.id(), m_cylinder.geometry_digest(), m_material.youngs_modulus, m_material.poisson_ratio, 0.2);
    {
        std::ofstream file(cache->entry_path(key), std::ios::binary);
        file << "definitely not a cache entry";
    }

    const ContactSimulator cached(m_sensor, {}, cache);
    const ContactSimulator uncached(m_sensor);
    EXPECT_EQ(cached.solve(m_cylinder, m_material, 0.2), uncached.solve(m_cylinder, m_material, 0.2));
}

TEST_F(TestSimulator, InvalidMaterialCarriesItsContext)
{
    const ContactSimulator simulator(m_sensor);
    try
    {
        (void)simulator.solve(m_cylinder, MaterialParameters{-1.0, 0.45}, 0.2);
        FAIL() << "expected IllConditionedError";
    }
    catch (const tactile::fem::IllConditionedError& e)
    {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->object_id, "cylinder_r2");
        EXPECT_DOUBLE_EQ(e.context()->youngs_modulus, -1.0);
        EXPECT_DOUBLE_EQ(e.context()->depth, 0.2);
    }

    EXPECT_THROW((void)simulator.solve(m_cylinder, MaterialParameters{0.2, 0.5}, 0.2), tactile::fem::IllConditionedError);
}

TEST_F(TestSimulator, InvalidDepthIsRejected)
{
    const ContactSimulator simulator(m_sensor);
    EXPECT_THROW((void)simulator.solve(m_cylinder, m_material, -0.1), std::invalid_argument);
    EXPECT_THROW((void)simulator.solve(m_cylinder, m_material, std::nan("")), std::invalid_argument);
    EXPECT_THROW((void)simulator.solve(m_cylinder, m_material, 5.0), std::invalid_argument);
}

TEST_F(TestSimulator, ConvergenceFailureNamesTheDepth)
{
    tactile::fem::SolverOptions options{};
    options.max_iterations = 2;
    const ContactSimulator simulator(m_sensor, options);

    const std::vector<double> depths{0.0, 0.3};
    try
    {
        (void)simulator.solve_depths(m_cylinder, m_material, depths);
        FAIL() << "expected ConvergenceError";
    }
    catch (const tactile::fem::ConvergenceError& e)
    {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_DOUBLE_EQ(e.context()->depth, 0.3);
        EXPECT_EQ(e.iterations(), 2u);
    }
}

TEST_F(TestSimulator, FailuresInWorkersReachTheCaller)
{
    tactile::fem::SolverOptions options{};
    options.max_iterations = 2;
    const ContactSimulator simulator(m_sensor, options);

    const std::vector<ContactObject> objects{m_cylinder, ContactObject("small", tactile::fem::make_cylinder_surface(1.0, 1.0))};
    const std::vector<double> depths{0.2};
    EXPECT_THROW((void)simulator.collect_calibration_data(objects, m_material, depths, 2), tactile::fem::ConvergenceError);
}

TEST_F(TestSimulator, CalibrationErrorComparesMaterials)
{
    const ContactSimulator simulator(m_sensor);
    const std::vector<ContactObject> objects{m_cylinder};
    const std::vector<double> depths{0.2};

    const auto reference = simulator.collect_calibration_data(objects, m_material, depths, 1);
    const auto other_ratio = simulator.collect_calibration_data(objects, MaterialParameters{0.2, 0.3}, depths, 1);

    EXPECT_DOUBLE_EQ(tactile::fem::calibration_error(reference, reference), 0.0);
    EXPECT_GT(tactile::fem::calibration_error(other_ratio, reference), 0.0);

    auto renamed = reference;
    renamed.front().object_id = "other";
    EXPECT_DOUBLE_EQ(tactile::fem::calibration_error(renamed, reference), 0.0);
}

TEST(CalibrationError, MatchesSamplesByObjectAndDepth)
{
    using tactile::fem::FieldGrid;
    using tactile::fem::GridShape;
    const auto sample = [](std::string id, double depth, float value) {
        SimulationOutput output{};
        output.depth_field = FieldGrid(GridShape{2, 2}, 1, value);
        output.marker_displacement = FieldGrid(GridShape{1, 1}, 2, 0.0f);
        return CalibrationSample{std::move(id), depth, std::move(output)};
    };

    const std::vector<CalibrationSample> simulated{sample("a", 0.1, 1.0f), sample("a", 0.2, 2.0f), sample("b", 0.2, 0.0f)};
    // Captures arrive in any order, may lack depths, and may carry depths with float noise.
    const std::vector<CalibrationSample> captured{sample("b", 0.2, 1.0f), sample("a", 0.1 + 0.1, 1.0f)};

    // a@0.2: depth MSE 1; b@0.2: depth MSE 1; a@0.1 is unmatched. Marker MSE is 0.
    EXPECT_DOUBLE_EQ(tactile::fem::calibration_error(simulated, captured), 1.0);
    EXPECT_DOUBLE_EQ(tactile::fem::calibration_error(simulated, std::vector<CalibrationSample>{}), 0.0);
    EXPECT_DOUBLE_EQ(tactile::fem::calibration_error(std::vector<CalibrationSample>{}, captured), 0.0);

    auto reshaped = captured;
    reshaped.front().output.depth_field = FieldGrid(GridShape{3, 3}, 1);
    EXPECT_THROW((void)tactile::fem::calibration_error(simulated, reshaped), std::invalid_argument);
}

TEST(JoiningThreads, JoinsStartedWorkersWhenUnwinding)
{
    std::atomic<int> finished{0};
    try
    {
        tactile::fem::detail::JoiningThreads pool;
        for (int i = 0; i < 3; ++i)
        {
            pool.spawn([&finished]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                finished.fetch_add(1);
            });
        }
        EXPECT_EQ(pool.size(), 3u);
        throw std::runtime_error("worker could not be started");
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "worker could not be started");
    }
    EXPECT_EQ(finished.load(), 3);
}
