#pragma once
// models/pt_array.hpp

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

#include "forcing.hpp"
#include "models/PTmethods.hpp"

namespace PTMethods {

// ───────── Elementwise array forms ─────────
// Each function applies its scalar counterpart from PTmethods.hpp position by
// position. Arguments of length 1 are broadcast; any other length
// disagreement throws std::invalid_argument before anything is computed.

using Array = std::vector<double>;

// Common length of the given argument lengths under the broadcast rule.
// @param op     Operation name used in the error message
// @param sizes  Argument lengths
std::size_t broadcastSize(const std::string& op,
                          std::initializer_list<std::size_t> sizes);

Array SaturationVaporPressure(const Array& T);
Array ActualVaporPressure(const Array& T, const Array& RH);

Array AtmosphericPressure(const Array& elevation);
Array LatentHeatOfVaporization(const Array& air_T);
Array PsychrometricConstant(const Array& P, const Array& lambda);

Array SlopeOfSaturationCurve(const Array& T);

Array BowenRatio(const Array& gamma, const Array& T2, const Array& T1,
                 const Array& e2, const Array& e1);

Array SaturationDeficitFactor(const Array& Delta, const Array& gamma,
                              const Array& beta);

Array CloudinessFactor(const Array& Rs, const Array& Ra,
                       double ac = DEFAULT_AC, double bc = DEFAULT_BC);

// Columnar Ra: one row per sample, only the first column is read.
// Throws std::invalid_argument if a row is empty.
Array CloudinessFactor(const Array& Rs, const std::vector<Array>& Ra_rows,
                       double ac = DEFAULT_AC, double bc = DEFAULT_BC);

Array NetEmissivity(const Array& T);

Array NetRadiation(double albedo, const Array& Rs, const Array& C,
                   const Array& epsilon, const Array& T_k);

Array PriestleyTaylor(const Array& alpha, const Array& Delta,
                      const Array& gamma, const Array& Rn);

// ───────── PotentialET (array) ─────────
// Runs the full pipeline over every sample of @p forcing.
//
// @param forcing  Per-sample inputs (length-1 members broadcast)
// @param albedo   Surface albedo [-]
// @param coeffs   Cloudiness coefficients
// @returns        PET per sample [MJ m^-2 day^-1]
Array PotentialET(const PETForcing& forcing, double albedo,
                  const CloudinessCoefficients& coeffs = CloudinessCoefficients());

// Same pipeline with Ra given as rows (first column read, as in the columnar
// CloudinessFactor). @p Ra_rows replaces forcing.Ra, which is ignored.
// Throws std::invalid_argument if a row is empty.
Array PotentialET(const PETForcing& forcing, const std::vector<Array>& Ra_rows,
                  double albedo,
                  const CloudinessCoefficients& coeffs = CloudinessCoefficients());

// Number of samples described by @p forcing (broadcast length).
std::size_t sampleCount(const PETForcing& forcing);

} // namespace PTMethods
