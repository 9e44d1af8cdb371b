#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tactile::fem
{
    // Inputs of one solve, attached to errors so a failure can be reproduced.
    struct SolveContext
    {
        std::string object_id{};
        double youngs_modulus{0.0};
        double poisson_ratio{0.0};
        double depth{0.0};
    };

    [[nodiscard]] inline std::string describe(const SolveContext& context)
    {
        return fmt::format("object '{}', E={:.6g}, nu={:.6g}, depth={:.6g}",
                           context.object_id,
                           context.youngs_modulus,
                           context.poisson_ratio,
                           context.depth);
    }

    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string& message)
            : std::runtime_error(message)
            , m_message(message)
        {
        }

        [[nodiscard]] const char* what() const noexcept override { return m_message.c_str(); }

        [[nodiscard]] const std::optional<SolveContext>& context() const noexcept { return m_context; }

        // Only the first context sticks; an inner layer knows the failing solve best.
        void annotate(const SolveContext& context)
        {
            if (m_context)
            {
                return;
            }
            m_context = context;
            m_message += fmt::format(" [{}]", describe(context));
        }

    private:
        std::string m_message{};
        std::optional<SolveContext> m_context{};
    };

    // Geometry source missing or malformed.
    class AssetError final : public Error
    {
    public:
        using Error::Error;
    };

    // Degenerate topology found while building or assembling a mesh.
    class MeshError final : public Error
    {
    public:
        using Error::Error;
    };

    // Non-physical material parameters or a system that is not positive definite.
    class IllConditionedError final : public Error
    {
    public:
        using Error::Error;
    };

    class ConvergenceError final : public Error
    {
    public:
        ConvergenceError(const std::string& message, std::size_t iterations, double relative_residual)
            : Error(message)
            , m_iterations(iterations)
            , m_relative_residual(relative_residual)
        {
        }

        [[nodiscard]] std::size_t iterations() const noexcept { return m_iterations; }
        [[nodiscard]] double relative_residual() const noexcept { return m_relative_residual; }

    private:
        std::size_t m_iterations{0};
        double m_relative_residual{0.0};
    };

    // Result cache storage failure. Callers degrade to an uncached solve.
    class CacheError final : public Error
    {
    public:
        using Error::Error;
    };
} // namespace tactile::fem
