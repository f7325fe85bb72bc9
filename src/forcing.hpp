//src/forcing.hpp
#pragma once

#include <cstddef>
#include <vector>

/**
 * @brief PETForcing bundles the per-sample meteorological arrays fed to the
 *        Priestley-Taylor pipeline.
 *
 * Each member holds one value per sample (time step or site). A member with a
 * single element is broadcast against the others, so a constant site
 * elevation can be given once:
 *   - @c air_T       air temperature [°C]
 *   - @c fuel_T      fuel / surface temperature [°C]
 *   - @c elevation   site elevation [m]
 *   - @c RH          relative humidity of air [%]
 *   - @c fuel_moist  fuel moisture [%]
 *   - @c Rs          solar radiation [MJ m^-2 day^-1]
 *   - @c Ra          extraterrestrial radiation [MJ m^-2 day^-1]
 *
 * Albedo and the cloudiness coefficients are scalars and travel separately.
 */
struct PETForcing {
    std::vector<double> air_T;
    std::vector<double> fuel_T;
    std::vector<double> elevation;
    std::vector<double> RH;
    std::vector<double> fuel_moist;
    std::vector<double> Rs;
    std::vector<double> Ra;
};
