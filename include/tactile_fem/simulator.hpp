#pragma once

#include "errors.hpp"
#include "fields.hpp"
#include "footprint.hpp"
#include "grid.hpp"
#include "material.hpp"
#include "result_cache.hpp"
#include "sensor.hpp"
#include "solver.hpp"
#include "stiffness.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    namespace detail
    {
        // Owns worker threads and joins every started one on destruction, so a
        // failed spawn unwinds without destroying a joinable std::thread.
        class JoiningThreads
        {
        public:
            JoiningThreads() = default;
            JoiningThreads(const JoiningThreads&) = delete;
            JoiningThreads& operator=(const JoiningThreads&) = delete;

            ~JoiningThreads() { join(); }

            template <typename Function>
            void spawn(Function&& function)
            {
                m_threads.emplace_back(std::forward<Function>(function));
            }

            void join() noexcept
            {
                for (auto& thread : m_threads)
                {
                    if (thread.joinable())
                    {
                        thread.join();
                    }
                }
            }

            [[nodiscard]] std::size_t size() const noexcept { return m_threads.size(); }

        private:
            std::vector<std::thread> m_threads{};
        };
    } // namespace detail

    // One simulated (or captured) reading of an object at a nominal depth.
    struct CalibrationSample
    {
        std::string object_id{};
        double depth{0.0};
        SimulationOutput output{};
    };

    // Functional entry point for the calibration loop:
    // solve(object, material, depth) -> (depth field, marker field) or an Error.
    // The sensor and cache are shared; stiffness and solve results stay local
    // to each call, so one simulator can serve many threads.
    class ContactSimulator
    {
    public:
        explicit ContactSimulator(std::shared_ptr<const SensorModel> sensor,
                                  SolverOptions options = {},
                                  std::shared_ptr<const ResultCache> cache = nullptr)
            : m_sensor(std::move(sensor))
            , m_options(options)
            , m_cache(std::move(cache))
        {
            if (!m_sensor)
            {
                throw std::invalid_argument("ContactSimulator needs a sensor model");
            }
        }

        [[nodiscard]] const SensorModel& sensor() const noexcept { return *m_sensor; }
        [[nodiscard]] const SolverOptions& options() const noexcept { return m_options; }
        [[nodiscard]] const std::shared_ptr<const ResultCache>& cache() const noexcept { return m_cache; }

        [[nodiscard]] SimulationOutput solve(const ContactObject& object, const MaterialParameters& material, double depth) const
        {
            const double depths[] = {depth};
            return std::move(solve_depths(object, material, depths).front());
        }

        // Sweeps several depths for one object. The footprint and stiffness
        // are built once, and only if some depth misses the cache.
        [[nodiscard]] std::vector<SimulationOutput> solve_depths(const ContactObject& object, const MaterialParameters& material, std::span<const double> depths) const
        {
            for (const double depth : depths)
            {
                if (!std::isfinite(depth) || depth < 0.0)
                {
                    throw std::invalid_argument(fmt::format("Indentation depth must be finite and non-negative, got {}", depth));
                }
            }

            SolveContext context{object.id(), material.youngs_modulus, material.poisson_ratio, depths.empty() ? 0.0 : depths.front()};
            try
            {
                material.validate();
            }
            catch (Error& e)
            {
                e.annotate(context);
                throw;
            }

            std::vector<std::optional<SimulationOutput>> outputs(depths.size());
            std::vector<CacheKey> keys(depths.size());
            std::size_t misses = 0;
            for (std::size_t i = 0; i < depths.size(); ++i)
            {
                if (m_cache)
                {
                    keys[i] = m_cache->key(object.id(), object.geometry_digest(), material.youngs_modulus, material.poisson_ratio, depths[i]);
                    outputs[i] = lookup(keys[i]);
                }
                if (!outputs[i])
                {
                    ++misses;
                }
            }

            if (misses > 0)
            {
                safe_io::info("Simulating '{}' at {} depth(s), E={}, nu={}", object.id(), misses, material.youngs_modulus, material.poisson_ratio);

                std::optional<Footprint> footprint;
                std::optional<CsrMatrix> stiffness;
                const IsotropicElasticity model(material);
                for (std::size_t i = 0; i < depths.size(); ++i)
                {
                    if (outputs[i])
                    {
                        continue;
                    }

                    context.depth = depths[i];
                    try
                    {
                        if (!footprint)
                        {
                            footprint = derive_footprint(*m_sensor, object);
                            stiffness = assemble_stiffness(m_sensor->pad(), model);
                        }
                        outputs[i] = simulate(*stiffness, *footprint, depths[i]);
                    }
                    catch (Error& e)
                    {
                        e.annotate(context);
                        throw;
                    }

                    if (m_cache)
                    {
                        store(keys[i], *outputs[i]);
                    }
                }
            }

            std::vector<SimulationOutput> result;
            result.reserve(outputs.size());
            for (auto& output : outputs)
            {
                result.push_back(std::move(*output));
            }
            return result;
        }

        // Every object at every depth, one object per task on up to `workers`
        // threads (0 = hardware concurrency). Samples are ordered by object,
        // then depth. The first failure is rethrown once all workers have joined.
        [[nodiscard]] std::vector<CalibrationSample> collect_calibration_data(std::span<const ContactObject> objects,
                                                                              const MaterialParameters& material,
                                                                              std::span<const double> depths,
                                                                              std::size_t workers = 0) const
        {
            std::vector<std::vector<SimulationOutput>> per_object(objects.size());
            if (objects.empty())
            {
                return {};
            }

            if (workers == 0)
            {
                workers = std::max(1u, std::thread::hardware_concurrency());
            }
            workers = std::min(workers, objects.size());

            std::atomic<std::size_t> next{0};
            std::atomic<bool> failed{false};
            std::mutex error_mutex;
            std::exception_ptr first_error;

            const auto run = [&]() {
                for (std::size_t i = next.fetch_add(1); i < objects.size() && !failed.load(); i = next.fetch_add(1))
                {
                    try
                    {
                        per_object[i] = solve_depths(objects[i], material, depths);
                    }
                    catch (...)
                    {
                        const std::lock_guard lock(error_mutex);
                        if (!first_error)
                        {
                            first_error = std::current_exception();
                        }
                        failed.store(true);
                    }
                }
            };

            if (workers == 1)
            {
                run();
            }
            else
            {
                detail::JoiningThreads pool;
                try
                {
                    for (std::size_t w = 0; w < workers; ++w)
                    {
                        pool.spawn(run);
                    }
                }
                catch (const std::system_error&)
                {
                    // Started workers stop at their next object and are joined by `pool`.
                    failed.store(true);
                    throw;
                }
                pool.join();
            }

            if (first_error)
            {
                std::rethrow_exception(first_error);
            }

            std::vector<CalibrationSample> samples;
            samples.reserve(objects.size() * depths.size());
            for (std::size_t i = 0; i < objects.size(); ++i)
            {
                for (std::size_t d = 0; d < depths.size(); ++d)
                {
                    samples.push_back(CalibrationSample{objects[i].id(), depths[d], std::move(per_object[i][d])});
                }
            }
            return samples;
        }

    private:
        SimulationOutput simulate(const CsrMatrix& stiffness, const Footprint& footprint, double depth) const
        {
            const auto problem = make_contact_conditions(*m_sensor, footprint, depth);
            const auto solution = fem::solve(stiffness, problem, m_options);
            safe_io::debug("Depth {:.4f}: {} contact nodes, {} iterations, relative residual {:.3e}",
                           depth, footprint.contact_count(depth), solution.iterations, solution.relative_residual);

            SimulationOutput output{};
            output.depth_field = extract_depth_field(*m_sensor, solution.displacements);
            output.marker_displacement = extract_marker_displacement(*m_sensor, solution.displacements);
            return output;
        }

        // A broken entry is reported and treated as a miss.
        std::optional<SimulationOutput> lookup(const CacheKey& key) const
        {
            try
            {
                return m_cache->get(key);
            }
            catch (const CacheError& e)
            {
                safe_io::warn("Ignoring cache entry: {}", e.what());
                return std::nullopt;
            }
        }

        void store(const CacheKey& key, const SimulationOutput& output) const
        {
            try
            {
                if (!m_cache->put(key, output))
                {
                    safe_io::debug("Cache already holds {}, result discarded", key.digest);
                }
            }
            catch (const CacheError& e)
            {
                safe_io::warn("Result not cached: {}", e.what());
            }
        }

        std::shared_ptr<const SensorModel> m_sensor{};
        SolverOptions m_options{};
        std::shared_ptr<const ResultCache> m_cache{};
    };

    // Mean over matched samples of depth-field MSE plus marker MSE. A simulated
    // sample is matched to the captured sample with the same object id and
    // depth (quantised like cache keys); samples without a partner are skipped.
    // No match at all scores zero.
    inline double calibration_error(std::span<const CalibrationSample> simulated, std::span<const CalibrationSample> captured)
    {
        std::map<std::pair<std::string_view, long long>, const CalibrationSample*> by_key;
        for (const auto& sample : captured)
        {
            by_key.try_emplace({sample.object_id, detail::quantize(sample.depth)}, &sample);
        }

        double total = 0.0;
        std::size_t matched = 0;
        for (const auto& sim : simulated)
        {
            const auto found = by_key.find({sim.object_id, detail::quantize(sim.depth)});
            if (found == by_key.end())
            {
                continue;
            }
            const auto& real = *found->second;
            total += mean_squared_error(sim.output.depth_field, real.output.depth_field);
            total += mean_squared_error(sim.output.marker_displacement, real.output.marker_displacement);
            ++matched;
        }

        if (matched < simulated.size())
        {
            safe_io::debug("Calibration error: {} of {} simulated samples have no captured counterpart", simulated.size() - matched, simulated.size());
        }
        return total / static_cast<double>(std::max<std::size_t>(matched, 1));
    }
} // namespace tactile::fem
