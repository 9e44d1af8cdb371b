#pragma once

#include "errors.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <string_view>

#include <fmt/format.h>

namespace tactile::fem
{
    struct MaterialParameters
    {
        double youngs_modulus{0.2};
        double poisson_ratio{0.45};

        // Rejects non-physical samples before anything is assembled; the
        // calibration layer treats the error as an infeasible point.
        void validate() const
        {
            if (!std::isfinite(youngs_modulus) || youngs_modulus <= 0.0)
            {
                throw IllConditionedError(fmt::format("Young's modulus must be positive, got {}", youngs_modulus));
            }
            if (!std::isfinite(poisson_ratio) || poisson_ratio <= 0.0 || poisson_ratio >= 0.5)
            {
                throw IllConditionedError(fmt::format("Poisson ratio must lie in (0, 0.5), got {}", poisson_ratio));
            }
        }

        [[nodiscard]] double lame_lambda() const noexcept
        {
            return youngs_modulus * poisson_ratio / ((1.0 + poisson_ratio) * (1.0 - 2.0 * poisson_ratio));
        }

        [[nodiscard]] double shear_modulus() const noexcept
        {
            return youngs_modulus / (2.0 * (1.0 + poisson_ratio));
        }
    };

    // Voigt order: xx, yy, zz, yz, xz, xy with engineering shear strains.
    using ElasticityMatrix = std::array<double, 36>;

    // Produces the material tangent used for every element's local stiffness.
    class ConstitutiveModel
    {
    public:
        virtual ~ConstitutiveModel() = default;
        [[nodiscard]] virtual ElasticityMatrix elasticity_matrix() const = 0;
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    };

    class IsotropicElasticity final : public ConstitutiveModel
    {
    public:
        explicit IsotropicElasticity(const MaterialParameters& parameters)
            : m_parameters(parameters)
        {
            m_parameters.validate();
        }

        [[nodiscard]] ElasticityMatrix elasticity_matrix() const override
        {
            const double lambda = m_parameters.lame_lambda();
            const double mu = m_parameters.shear_modulus();

            ElasticityMatrix d{};
            for (std::size_t i = 0; i < 3; ++i)
            {
                for (std::size_t j = 0; j < 3; ++j)
                {
                    d[i * 6 + j] = lambda;
                }
                d[i * 6 + i] = lambda + 2.0 * mu;
                d[(i + 3) * 6 + (i + 3)] = mu;
            }
            return d;
        }

        [[nodiscard]] std::string_view name() const noexcept override { return "IsotropicElasticity"; }

        [[nodiscard]] const MaterialParameters& parameters() const noexcept { return m_parameters; }

    private:
        MaterialParameters m_parameters{};
    };
} // namespace tactile::fem
