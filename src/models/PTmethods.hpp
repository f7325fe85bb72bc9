#pragma once
// models/PTmethods.hpp

#include <cmath>

// Host/device qualifier for the scalar equations. Under nvcc every function
// below is callable from kernels as well as from host code.
#if defined(__CUDACC__)
#define PTET_HOST_DEVICE __host__ __device__
#else
#define PTET_HOST_DEVICE
#endif

namespace PTMethods {

// Stefan-Boltzmann-like constant used by the net radiation balance
// [MJ m^-2 day^-1 K^-4]
constexpr double SIGMA = 4.89e-9;

// Default Angstrom-type cloudiness coefficients
constexpr double DEFAULT_AC = 0.72;
constexpr double DEFAULT_BC = 0.28;

// Cloudiness coefficients passed per call through the pipeline.
struct CloudinessCoefficients {
    double ac = DEFAULT_AC;
    double bc = DEFAULT_BC;
};

// ───────── SaturationVaporPressure ─────────
// Saturation vapor pressure over water.
// Singular at T = -237.3 °C; not checked.
//
// @param T   Temperature [°C]
// @returns   e_s [kPa]
PTET_HOST_DEVICE
inline double SaturationVaporPressure(double T)
{
    return 0.6108 * std::exp(17.27 * T / (T + 237.3));
}

// ───────── ActualVaporPressure ─────────
// @param T   Temperature [°C]
// @param RH  Relative humidity [%], not clamped
// @returns   e [kPa]
PTET_HOST_DEVICE
inline double ActualVaporPressure(double T, double RH)
{
    return RH * SaturationVaporPressure(T) / 100.0;
}

// ───────── AtmosphericPressure ─────────
// @param elevation  Site elevation [m]
// @returns          P [kPa]
PTET_HOST_DEVICE
inline double AtmosphericPressure(double elevation)
{
    return 101.3 - 0.01055 * elevation;
}

// ───────── LatentHeatOfVaporization ─────────
// @param air_T  Air temperature [°C]
// @returns      lambda [MJ/kg]
PTET_HOST_DEVICE
inline double LatentHeatOfVaporization(double air_T)
{
    return 2.501 - 0.002361 * air_T;
}

// ───────── PsychrometricConstant ─────────
// @param P       Atmospheric pressure [kPa]
// @param lambda  Latent heat of vaporization [MJ/kg]
// @returns       gamma [kPa/°C]
PTET_HOST_DEVICE
inline double PsychrometricConstant(double P, double lambda)
{
    return 0.00163 * P / lambda;
}

// ───────── SlopeOfSaturationCurve ─────────
// Slope of the saturation vapor pressure curve (Delta).
//
// @param T  Temperature [°C]
// @returns  Delta [kPa/°C]
PTET_HOST_DEVICE
inline double SlopeOfSaturationCurve(double T)
{
    return 4098.0 * SaturationVaporPressure(T) / ((T + 237.3) * (T + 237.3));
}

// ───────── BowenRatio ─────────
// Ratio of sensible to latent heat flux between two levels (e.g. air and fuel
// surface). A zero temperature difference carries no sensible heat and
// returns 0 even when e2 == e1; any other e2 == e1 gives +-inf.
//
// @param gamma  Psychrometric constant [kPa/°C]
// @param T2     Upper temperature [°C]
// @param T1     Lower temperature [°C]
// @param e2     Upper vapor pressure [kPa]
// @param e1     Lower vapor pressure [kPa]
// @returns      beta [-]
PTET_HOST_DEVICE
inline double BowenRatio(double gamma, double T2, double T1, double e2, double e1)
{
    const double dT = T2 - T1;
    if (dT == 0.0) {
        return 0.0;
    }
    return gamma * (dT / (e2 - e1));
}

// ───────── SaturationDeficitFactor ─────────
// Priestley-Taylor alpha from the energy partitioning.
//
// @param Delta  Slope of saturation curve [kPa/°C]
// @param gamma  Psychrometric constant [kPa/°C]
// @param beta   Bowen ratio [-]
// @returns      alpha [-]
PTET_HOST_DEVICE
inline double SaturationDeficitFactor(double Delta, double gamma, double beta)
{
    return (Delta + gamma) / (Delta * (1.0 + beta));
}

// ───────── CloudinessFactor ─────────
// Rs/Ra is taken as 0 where Ra is exactly 0, so C falls back to bc.
//
// @param Rs  Solar radiation [MJ m^-2 day^-1]
// @param Ra  Extraterrestrial radiation [MJ m^-2 day^-1]
// @param ac  Slope coefficient
// @param bc  Intercept coefficient
// @returns   C [-]
PTET_HOST_DEVICE
inline double CloudinessFactor(double Rs, double Ra,
                               double ac = DEFAULT_AC,
                               double bc = DEFAULT_BC)
{
    const double R = (Ra != 0.0) ? Rs / Ra : 0.0;
    return ac * R + bc;
}

// ───────── NetEmissivity ─────────
// @param T  Temperature as supplied by the pipeline (air temperature)
// @returns  epsilon [-]
PTET_HOST_DEVICE
inline double NetEmissivity(double T)
{
    return 0.261 * std::exp(-7.77e-4 * T * T) - 0.02;
}

// ───────── NetRadiation ─────────
// Shortwave gain minus the longwave loss.
//
// @param albedo   Surface albedo [-]
// @param Rs       Solar radiation [MJ m^-2 day^-1]
// @param C        Cloudiness factor [-]
// @param epsilon  Net emissivity [-]
// @param T_k      Radiating temperature
// @returns        Rn [MJ m^-2 day^-1]
PTET_HOST_DEVICE
inline double NetRadiation(double albedo, double Rs, double C,
                           double epsilon, double T_k)
{
    return (1.0 - albedo) * Rs - C * epsilon * SIGMA * std::pow(T_k, 4);
}

// ───────── PriestleyTaylor ─────────
// @param alpha  Saturation deficit factor [-]
// @param Delta  Slope of saturation curve [kPa/°C]
// @param gamma  Psychrometric constant [kPa/°C]
// @param Rn     Net radiation [MJ m^-2 day^-1]
// @returns      ET [MJ m^-2 day^-1]
PTET_HOST_DEVICE
inline double PriestleyTaylor(double alpha, double Delta, double gamma, double Rn)
{
    return alpha * (Delta / (Delta + gamma)) * Rn;
}

// ───────── PotentialET ─────────
// Full Priestley-Taylor pipeline for one sample.
//
// @param air_T       Air temperature [°C]
// @param fuel_T      Fuel / surface temperature [°C]
// @param elevation   Elevation [m]
// @param RH          Relative humidity of air [%]
// @param fuel_moist  Fuel moisture [%]
// @param Rs          Solar radiation [MJ m^-2 day^-1]
// @param Ra          Extraterrestrial radiation [MJ m^-2 day^-1]
// @param albedo      Surface albedo [-]
// @param ac, bc      Cloudiness coefficients
// @returns           PET [MJ m^-2 day^-1]
PTET_HOST_DEVICE
inline double PotentialET(double air_T, double fuel_T, double elevation,
                          double RH, double fuel_moist,
                          double Rs, double Ra, double albedo,
                          double ac = DEFAULT_AC, double bc = DEFAULT_BC)
{
    double P      = AtmosphericPressure(elevation);
    double lambda = LatentHeatOfVaporization(air_T);
    double Delta  = SlopeOfSaturationCurve(air_T);
    double gamma  = PsychrometricConstant(P, lambda);

    double air_vape  = ActualVaporPressure(air_T, RH);
    double fuel_vape = ActualVaporPressure(fuel_T, fuel_moist);
    double beta      = BowenRatio(gamma, air_T, fuel_T, air_vape, fuel_vape);
    double alpha     = SaturationDeficitFactor(Delta, gamma, beta);

    double C       = CloudinessFactor(Rs, Ra, ac, bc);
    // Emissivity sees air_T as given; the longwave term uses air_T - 273.15.
    double T_k     = air_T - 273.15;
    double epsilon = NetEmissivity(air_T);
    double Rn      = NetRadiation(albedo, Rs, C, epsilon, T_k);

    return PriestleyTaylor(alpha, Delta, gamma, Rn);
}

} // namespace PTMethods
