#include <gtest/gtest.h>

#include "test_support.hpp"

#include <tactile_fem/errors.hpp>
#include <tactile_fem/result_cache.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tactile::fem::CacheError;
using tactile::fem::FieldGrid;
using tactile::fem::GridShape;
using tactile::fem::ResultCache;
using tactile::fem::SimulationOutput;

namespace
{
    SimulationOutput make_output(float scale)
    {
        SimulationOutput output{};
        output.depth_field = FieldGrid(GridShape{3, 4}, 1);
        output.marker_displacement = FieldGrid(GridShape{2, 2}, 2);
        for (std::size_t i = 0; i < output.depth_field.size(); ++i)
        {
            output.depth_field.values()[i] = scale * static_cast<float>(i);
        }
        for (std::size_t i = 0; i < output.marker_displacement.size(); ++i)
        {
            output.marker_displacement.values()[i] = -scale * static_cast<float>(i);
        }
        return output;
    }
} // namespace

class TestResultCache : public ::testing::Test
{
protected:
    tactile::fem::test_support::TemporaryDirectory m_directory{};
    ResultCache m_cache{m_directory.path() / "entries", "sensor-a"};
};

TEST_F(TestResultCache, StoresAndReturnsOutputs)
{
    const auto key = m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    EXPECT_FALSE(m_cache.get(key).has_value());

    const auto output = make_output(0.5f);
    EXPECT_TRUE(m_cache.put(key, output));
    EXPECT_TRUE(std::filesystem::exists(m_cache.entry_path(key)));

    const auto loaded = m_cache.get(key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, output);
}

TEST_F(TestResultCache, KeysAbsorbFloatingPointNoise)
{
    const auto key = m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    EXPECT_EQ(m_cache.key("circle", "geometry-a", 0.2 + 1e-9, 0.45 - 1e-9, 0.1 + 0.2).digest, key.digest);
    EXPECT_NE(m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.301).digest, key.digest);
    EXPECT_NE(m_cache.key("circle", "geometry-a", 0.21, 0.45, 0.3).digest, key.digest);
    EXPECT_NE(m_cache.key("sphere", "geometry-a", 0.2, 0.45, 0.3).digest, key.digest);
    EXPECT_NE(m_cache.key("circle", "geometry-b", 0.2, 0.45, 0.3).digest, key.digest);
    EXPECT_EQ(key.digest.size(), 32u);

    const ResultCache other(m_directory.path() / "entries", "sensor-b");
    EXPECT_NE(other.key("circle", "geometry-a", 0.2, 0.45, 0.3).digest, key.digest);

    EXPECT_THROW((void)m_cache.key("circle", "geometry-a", std::numeric_limits<double>::quiet_NaN(), 0.45, 0.3), std::invalid_argument);
}

TEST_F(TestResultCache, ObjectIdsCannotCollideThroughSeparators)
{
    // The id is length-prefixed, so an id containing the separator stays distinct.
    EXPECT_NE(m_cache.key("a|1", "geometry-a", 0.2, 0.45, 0.3).text, m_cache.key("a", "geometry-a", 0.2, 0.45, 0.3).text);
}

TEST_F(TestResultCache, FirstWriterWins)
{
    const auto key = m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    const auto first = make_output(1.0f);
    EXPECT_TRUE(m_cache.put(key, first));
    EXPECT_FALSE(m_cache.put(key, make_output(2.0f)));
    EXPECT_EQ(m_cache.get(key).value(), first);

    // No temporary files are left behind.
    std::size_t files = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(m_cache.directory()))
    {
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(TestResultCache, ConcurrentWritersPublishOneEntry)
{
    const auto key = m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    std::vector<int> published(8, 0);
    std::vector<std::thread> writers;
    for (std::size_t w = 0; w < published.size(); ++w)
    {
        writers.emplace_back([&, w]() { published[w] = m_cache.put(key, make_output(static_cast<float>(w + 1))) ? 1 : 0; });
    }
    for (auto& writer : writers)
    {
        writer.join();
    }

    int winners = 0;
    for (const int p : published)
    {
        winners += p;
    }
    EXPECT_EQ(winners, 1);

    const auto loaded = m_cache.get(key);
    ASSERT_TRUE(loaded.has_value());
    bool matches_a_writer = false;
    for (std::size_t w = 0; w < published.size(); ++w)
    {
        matches_a_writer = matches_a_writer || *loaded == make_output(static_cast<float>(w + 1));
    }
    EXPECT_TRUE(matches_a_writer);
}

TEST_F(TestResultCache, CorruptEntryIsReported)
{
    const auto key = m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    ASSERT_TRUE(m_cache.put(key, make_output(1.0f)));

    const auto path = m_cache.entry_path(key);
    std::string bytes;
    {
        std::ifstream file(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
    bytes[bytes.size() / 2] = static_cast<char>(bytes[bytes.size() / 2] ^ 0x5a);
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }
    EXPECT_THROW((void)m_cache.get(key), CacheError);

    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << "TFEM";
    }
    EXPECT_THROW((void)m_cache.get(key), CacheError);
}

TEST_F(TestResultCache, EntryForAnotherKeyIsAMiss)
{
    const auto key = m_cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    const auto other = m_cache.key("sphere", "geometry-a", 0.2, 0.45, 0.3);
    ASSERT_TRUE(m_cache.put(other, make_output(1.0f)));

    std::filesystem::create_directories(m_cache.entry_path(key).parent_path());
    std::filesystem::copy_file(m_cache.entry_path(other), m_cache.entry_path(key));
    EXPECT_FALSE(m_cache.get(key).has_value());
}

TEST_F(TestResultCache, UnusableDirectoryFailsToStore)
{
    const auto blocker = m_directory.write("not_a_directory", "x");
    const ResultCache cache(blocker / "entries", "sensor-a");
    const auto key = cache.key("circle", "geometry-a", 0.2, 0.45, 0.3);
    EXPECT_THROW((void)cache.put(key, make_output(1.0f)), CacheError);
}

TEST(ResultCacheConstruction, RequiresADirectory)
{
    EXPECT_THROW(ResultCache("", "sensor"), std::invalid_argument);
}
