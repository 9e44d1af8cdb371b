#pragma once

#include "detail/hashing.hpp"
#include "errors.hpp"
#include "grid.hpp"

#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/std.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    struct CacheKey
    {
        // Canonical input description, stored in the entry and verified on read.
        std::string text{};
        // 128-bit FNV-1a of `text` in hex; the entry's file name.
        std::string digest{};
    };

    namespace detail
    {
        inline constexpr std::string_view cache_magic = "TFEMCACH";
        inline constexpr std::uint32_t cache_version = 1;
        inline constexpr std::uint32_t byte_order_marker = 0x01020304;
        inline constexpr double cache_quantum = 1e-6;

        inline long long quantize(double value)
        {
            if (!std::isfinite(value))
            {
                throw std::invalid_argument(fmt::format("Cache key component {} is not finite", value));
            }
            return std::llround(value / cache_quantum);
        }

        class ByteWriter
        {
        public:
            template <typename T>
            void put(const T& value)
            {
                const auto* bytes = reinterpret_cast<const char*>(&value);
                m_buffer.append(bytes, sizeof(T));
            }

            void put_text(std::string_view text)
            {
                put(static_cast<std::uint32_t>(text.size()));
                m_buffer.append(text.data(), text.size());
            }

            void put_grid(const FieldGrid& grid)
            {
                put(static_cast<std::uint32_t>(grid.rows()));
                put(static_cast<std::uint32_t>(grid.cols()));
                put(static_cast<std::uint32_t>(grid.channels()));
                const auto values = grid.values();
                m_buffer.append(reinterpret_cast<const char*>(values.data()), values.size() * sizeof(float));
            }

            [[nodiscard]] std::string& buffer() noexcept { return m_buffer; }

        private:
            std::string m_buffer{};
        };

        class ByteReader
        {
        public:
            ByteReader(std::string_view data, const std::filesystem::path& path)
                : m_data(data)
                , m_path(path)
            {
            }

            template <typename T>
            T get()
            {
                T value{};
                std::memcpy(&value, take(sizeof(T)), sizeof(T));
                return value;
            }

            std::string get_text()
            {
                const auto size = get<std::uint32_t>();
                return std::string(take(size), size);
            }

            FieldGrid get_grid()
            {
                const auto rows = get<std::uint32_t>();
                const auto cols = get<std::uint32_t>();
                const auto channels = get<std::uint32_t>();
                if (channels == 0)
                {
                    throw CacheError(fmt::format("Cache entry {} holds a grid without channels", m_path));
                }
                const auto count = static_cast<std::size_t>(rows) * cols * channels;
                if (count > (m_data.size() - m_offset) / sizeof(float))
                {
                    throw CacheError(fmt::format("Cache entry {} is truncated", m_path));
                }
                std::vector<float> values(count);
                std::memcpy(values.data(), take(count * sizeof(float)), count * sizeof(float));
                return FieldGrid(GridShape{rows, cols}, channels, std::move(values));
            }

            [[nodiscard]] bool exhausted() const noexcept { return m_offset == m_data.size(); }

        private:
            const char* take(std::size_t size)
            {
                if (size > m_data.size() - m_offset)
                {
                    throw CacheError(fmt::format("Cache entry {} is truncated", m_path));
                }
                const char* start = m_data.data() + m_offset;
                m_offset += size;
                return start;
            }

            std::string_view m_data{};
            std::filesystem::path m_path{};
            std::size_t m_offset{0};
        };

        inline std::string unique_suffix()
        {
            static std::atomic<std::uint64_t> counter{0};
            thread_local std::mt19937_64 engine{std::random_device{}()};
            return fmt::format("{:016x}-{}", engine(), counter.fetch_add(1));
        }
    } // namespace detail

    // Write-once, content-addressed store of simulation outputs. Entries are
    // published by atomic no-clobber link so concurrent writers never expose a
    // partial file; the first published entry for a key wins.
    class ResultCache
    {
    public:
        // `namespace_tag` separates entries of differently configured sensors.
        ResultCache(std::filesystem::path directory, std::string namespace_tag)
            : m_directory(std::move(directory))
            , m_namespace(std::move(namespace_tag))
        {
            if (m_directory.empty())
            {
                throw std::invalid_argument("Result cache needs a directory");
            }
        }

        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }
        [[nodiscard]] const std::string& namespace_tag() const noexcept { return m_namespace; }

        // E, nu and depth are quantised to 1e-6 so float noise in repeated
        // queries maps onto the same entry. `geometry` identifies the object's
        // shape and placement, since an id alone does not pin them down.
        [[nodiscard]] CacheKey key(std::string_view object_id, std::string_view geometry, double youngs_modulus, double poisson_ratio, double depth) const
        {
            CacheKey key{};
            key.text = fmt::format("{}:{}|{}|{}|{}|{}|{}",
                                   object_id.size(), object_id,
                                   geometry,
                                   detail::quantize(youngs_modulus),
                                   detail::quantize(poisson_ratio),
                                   detail::quantize(depth),
                                   m_namespace);
            detail::Fnv1a128 hash{};
            hash.update(key.text);
            key.digest = hash.hex();
            return key;
        }

        [[nodiscard]] std::filesystem::path entry_path(const CacheKey& key) const
        {
            return m_directory / (key.digest + ".tfc");
        }

        // nullopt on a miss or when the entry belongs to a different key text.
        // Throws CacheError for an unreadable or corrupt entry.
        [[nodiscard]] std::optional<SimulationOutput> get(const CacheKey& key) const
        {
            const auto path = entry_path(key);
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                if (ec)
                {
                    throw CacheError(fmt::format("Cannot inspect cache entry {}: {}", path, ec.message()));
                }
                return std::nullopt;
            }

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw CacheError(fmt::format("Cannot open cache entry {}", path));
            }
            const std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            if (file.bad())
            {
                throw CacheError(fmt::format("Cannot read cache entry {}", path));
            }

            if (bytes.size() < sizeof(std::uint64_t))
            {
                throw CacheError(fmt::format("Cache entry {} is truncated", path));
            }
            const auto body = std::string_view(bytes).substr(0, bytes.size() - sizeof(std::uint64_t));
            std::uint64_t stored_checksum = 0;
            std::memcpy(&stored_checksum, bytes.data() + body.size(), sizeof(stored_checksum));
            detail::Fnv1a64 checksum{};
            checksum.update(body);
            if (checksum.digest() != stored_checksum)
            {
                throw CacheError(fmt::format("Cache entry {} failed its checksum", path));
            }

            detail::ByteReader reader(body, path);
            if (reader.get<std::array<char, 8>>() != magic_bytes())
            {
                throw CacheError(fmt::format("{} is not a cache entry", path));
            }
            if (const auto version = reader.get<std::uint32_t>(); version != detail::cache_version)
            {
                throw CacheError(fmt::format("Cache entry {} has unsupported version {}", path, version));
            }
            if (reader.get<std::uint32_t>() != detail::byte_order_marker)
            {
                throw CacheError(fmt::format("Cache entry {} was written with a different byte order", path));
            }
            if (reader.get_text() != key.text)
            {
                safe_io::debug("Cache entry {} belongs to another key", path);
                return std::nullopt;
            }

            SimulationOutput output{};
            output.depth_field = reader.get_grid();
            output.marker_displacement = reader.get_grid();
            if (!reader.exhausted())
            {
                throw CacheError(fmt::format("Cache entry {} has trailing data", path));
            }
            return output;
        }

        // Returns true when this call published the entry, false when an entry
        // for the key already existed and `output` was discarded.
        bool put(const CacheKey& key, const SimulationOutput& output) const
        {
            std::error_code ec;
            std::filesystem::create_directories(m_directory, ec);
            if (ec)
            {
                throw CacheError(fmt::format("Cannot create cache directory {}: {}", m_directory, ec.message()));
            }

            const auto path = entry_path(key);
            if (std::filesystem::exists(path, ec))
            {
                return false;
            }

            detail::ByteWriter writer{};
            writer.put(magic_bytes());
            writer.put(detail::cache_version);
            writer.put(detail::byte_order_marker);
            writer.put_text(key.text);
            writer.put_grid(output.depth_field);
            writer.put_grid(output.marker_displacement);
            detail::Fnv1a64 checksum{};
            checksum.update(writer.buffer());
            writer.put(checksum.digest());

            const auto temporary = m_directory / fmt::format(".{}.{}.tmp", key.digest, detail::unique_suffix());
            {
                std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
                file.write(writer.buffer().data(), static_cast<std::streamsize>(writer.buffer().size()));
                file.close();
                if (!file)
                {
                    std::filesystem::remove(temporary, ec);
                    throw CacheError(fmt::format("Cannot write cache entry {}", temporary));
                }
            }

            const bool published = publish(temporary, path);
            std::filesystem::remove(temporary, ec);
            return published;
        }

    private:
        static std::array<char, 8> magic_bytes() noexcept
        {
            std::array<char, 8> magic{};
            std::memcpy(magic.data(), detail::cache_magic.data(), magic.size());
            return magic;
        }

        // Hard links never replace an existing file. Filesystems without hard
        // links fall back to rename after an existence check.
        static bool publish(const std::filesystem::path& temporary, const std::filesystem::path& path)
        {
            std::error_code ec;
            std::filesystem::create_hard_link(temporary, path, ec);
            if (!ec)
            {
                return true;
            }
            if (ec == std::errc::file_exists)
            {
                return false;
            }

            safe_io::debug("Hard link into cache failed ({}), falling back to rename", ec.message());
            if (std::filesystem::exists(path, ec))
            {
                return false;
            }
            std::filesystem::rename(temporary, path, ec);
            if (ec)
            {
                throw CacheError(fmt::format("Cannot publish cache entry {}: {}", path, ec.message()));
            }
            return true;
        }

        std::filesystem::path m_directory{};
        std::string m_namespace{};
    };
} // namespace tactile::fem
