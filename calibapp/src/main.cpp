// Depth sweep over a few material samples, scored against the reference sample.
#include <tactile_fem/tactile_fem.hpp>
#include <safe_io/utils.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    using tactile::fem::CalibrationSample;
    using tactile::fem::ContactObject;
    using tactile::fem::ContactSimulator;
    using tactile::fem::MaterialParameters;
    using tactile::fem::ObjectDescriptor;
    using tactile::fem::ResultCache;
    using tactile::fem::SensorConfig;
    using tactile::fem::SensorModel;
    using tactile::fem::SolverOptions;

    struct DemoOptions
    {
        std::filesystem::path cache_directory{"tactile_cache"};
        bool verbose{false};
        std::vector<std::filesystem::path> meshes{};
    };

    DemoOptions parse_arguments(int argc, char** argv)
    {
        DemoOptions options{};
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view argument{argv[i]};
            if (argument == "--verbose")
            {
                options.verbose = true;
            }
            else if (argument == "--cache" && i + 1 < argc)
            {
                options.cache_directory = argv[++i];
            }
            else
            {
                options.meshes.emplace_back(argv[i]);
            }
        }
        return options;
    }

    std::vector<ContactObject> build_objects(const DemoOptions& options)
    {
        std::vector<ContactObject> objects;
        if (options.meshes.empty())
        {
            objects.emplace_back("builtin_circle_r4", tactile::fem::make_cylinder_surface(4.0, 5.0));
            objects.emplace_back("builtin_sphere_r5", tactile::fem::make_sphere_surface(5.0), 0.0, 4.0);
            return objects;
        }

        for (const auto& path : options.meshes)
        {
            ObjectDescriptor descriptor{};
            descriptor.id = path.stem().string();
            descriptor.path = path;
            objects.push_back(ContactObject::from_descriptor(descriptor));
        }
        return objects;
    }

    double peak_marker_displacement(const tactile::fem::MarkerDisplacementField& markers)
    {
        double peak = 0.0;
        for (std::size_t r = 0; r < markers.rows(); ++r)
        {
            for (std::size_t c = 0; c < markers.cols(); ++c)
            {
                peak = std::max(peak, std::hypot(static_cast<double>(markers.at(r, c, 0)), static_cast<double>(markers.at(r, c, 1))));
            }
        }
        return peak;
    }

    void run_demo(const DemoOptions& options)
    {
        if (options.verbose)
        {
            safe_io::set_level(safe_io::Level::Debug);
        }

        const auto sensor = SensorModel::create(SensorConfig{});
        const auto cache = std::make_shared<const ResultCache>(options.cache_directory, sensor->fingerprint());
        const ContactSimulator simulator(sensor, SolverOptions{}, cache);

        const auto objects = build_objects(options);
        const std::vector<double> depths{0.1, 0.2, 0.3, 0.4, 0.5};

        const MaterialParameters reference{.youngs_modulus = 0.2, .poisson_ratio = 0.45};
        const std::array<MaterialParameters, 3> candidates{{
            {.youngs_modulus = 0.15, .poisson_ratio = 0.42},
            {.youngs_modulus = 0.2, .poisson_ratio = 0.45},
            {.youngs_modulus = 0.28, .poisson_ratio = 0.48},
        }};

        safe_io::print("Sensor pad {} x {} x {} mm: {} nodes, {} tetrahedra, cache at {}",
                       sensor->config().pad_width,
                       sensor->config().pad_length,
                       sensor->config().pad_thickness,
                       sensor->pad().node_count(),
                       sensor->pad().element_count(),
                       cache->directory().string());

        const auto captured = simulator.collect_calibration_data(objects, reference, depths);
        for (const auto& sample : captured)
        {
            safe_io::print("{:<20} depth {:.2f} mm  peak depth {:.4f} mm  peak marker {:.4f} mm",
                           sample.object_id,
                           sample.depth,
                           sample.output.depth_field.max_value(),
                           peak_marker_displacement(sample.output.marker_displacement));
        }

        for (const auto& material : candidates)
        {
            try
            {
                const auto simulated = simulator.collect_calibration_data(objects, material, depths);
                safe_io::print("E={:.3f} nu={:.3f}  calibration error {:.6e}",
                               material.youngs_modulus,
                               material.poisson_ratio,
                               tactile::fem::calibration_error(simulated, captured));
            }
            catch (const tactile::fem::IllConditionedError& e)
            {
                safe_io::warn("Rejected sample: {}", e.what());
            }
            catch (const tactile::fem::ConvergenceError& e)
            {
                safe_io::warn("Sample did not converge after {} iterations: {}", e.iterations(), e.what());
            }
        }
    }
} // namespace

int main(int argc, char** argv)
{
    try
    {
        run_demo(parse_arguments(argc, argv));
    }
    catch (const std::exception& e)
    {
        safe_io::eprint("Calibration demo failed: {}", e.what());
        return 1;
    }
    return 0;
}
