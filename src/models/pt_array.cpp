// models/pt_array.cpp

#include "models/pt_array.hpp"
#include <sstream>
#include <stdexcept>

namespace PTMethods {

namespace {

// Broadcast-aware element access.
inline double at(const Array& a, std::size_t i)
{
    return a.size() == 1 ? a[0] : a[i];
}

} // namespace

std::size_t broadcastSize(const std::string& op,
                          std::initializer_list<std::size_t> sizes)
{
    std::size_t n = 1;
    for (std::size_t s : sizes) {
        if (s == 1) continue;
        if (n == 1) {
            n = s;
        } else if (s != n) {
            std::ostringstream msg;
            msg << op << ": shape mismatch, lengths (";
            bool first = true;
            for (std::size_t t : sizes) {
                if (!first) msg << ", ";
                msg << t;
                first = false;
            }
            msg << ") cannot be broadcast together";
            throw std::invalid_argument(msg.str());
        }
    }
    return n;
}

Array SaturationVaporPressure(const Array& T)
{
    Array out(T.size());
    for (std::size_t i = 0; i < T.size(); ++i) {
        out[i] = SaturationVaporPressure(T[i]);
    }
    return out;
}

Array ActualVaporPressure(const Array& T, const Array& RH)
{
    std::size_t n = broadcastSize("ActualVaporPressure", {T.size(), RH.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = ActualVaporPressure(at(T, i), at(RH, i));
    }
    return out;
}

Array AtmosphericPressure(const Array& elevation)
{
    Array out(elevation.size());
    for (std::size_t i = 0; i < elevation.size(); ++i) {
        out[i] = AtmosphericPressure(elevation[i]);
    }
    return out;
}

Array LatentHeatOfVaporization(const Array& air_T)
{
    Array out(air_T.size());
    for (std::size_t i = 0; i < air_T.size(); ++i) {
        out[i] = LatentHeatOfVaporization(air_T[i]);
    }
    return out;
}

Array PsychrometricConstant(const Array& P, const Array& lambda)
{
    std::size_t n = broadcastSize("PsychrometricConstant", {P.size(), lambda.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = PsychrometricConstant(at(P, i), at(lambda, i));
    }
    return out;
}

Array SlopeOfSaturationCurve(const Array& T)
{
    Array out(T.size());
    for (std::size_t i = 0; i < T.size(); ++i) {
        out[i] = SlopeOfSaturationCurve(T[i]);
    }
    return out;
}

Array BowenRatio(const Array& gamma, const Array& T2, const Array& T1,
                 const Array& e2, const Array& e1)
{
    std::size_t n = broadcastSize("BowenRatio",
        {gamma.size(), T2.size(), T1.size(), e2.size(), e1.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = BowenRatio(at(gamma, i), at(T2, i), at(T1, i), at(e2, i), at(e1, i));
    }
    return out;
}

Array SaturationDeficitFactor(const Array& Delta, const Array& gamma,
                              const Array& beta)
{
    std::size_t n = broadcastSize("SaturationDeficitFactor",
        {Delta.size(), gamma.size(), beta.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = SaturationDeficitFactor(at(Delta, i), at(gamma, i), at(beta, i));
    }
    return out;
}

Array CloudinessFactor(const Array& Rs, const Array& Ra, double ac, double bc)
{
    std::size_t n = broadcastSize("CloudinessFactor", {Rs.size(), Ra.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = CloudinessFactor(at(Rs, i), at(Ra, i), ac, bc);
    }
    return out;
}

namespace {

// First column of each Ra row.
Array firstColumn(const std::string& op, const std::vector<Array>& Ra_rows)
{
    Array Ra;
    Ra.reserve(Ra_rows.size());
    for (std::size_t r = 0; r < Ra_rows.size(); ++r) {
        if (Ra_rows[r].empty()) {
            throw std::invalid_argument(op + ": Ra row "
                                        + std::to_string(r) + " has no columns");
        }
        Ra.push_back(Ra_rows[r][0]);
    }
    return Ra;
}

} // namespace

Array CloudinessFactor(const Array& Rs, const std::vector<Array>& Ra_rows,
                       double ac, double bc)
{
    return CloudinessFactor(Rs, firstColumn("CloudinessFactor", Ra_rows), ac, bc);
}

Array NetEmissivity(const Array& T)
{
    Array out(T.size());
    for (std::size_t i = 0; i < T.size(); ++i) {
        out[i] = NetEmissivity(T[i]);
    }
    return out;
}

Array NetRadiation(double albedo, const Array& Rs, const Array& C,
                   const Array& epsilon, const Array& T_k)
{
    std::size_t n = broadcastSize("NetRadiation",
        {Rs.size(), C.size(), epsilon.size(), T_k.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = NetRadiation(albedo, at(Rs, i), at(C, i), at(epsilon, i), at(T_k, i));
    }
    return out;
}

Array PriestleyTaylor(const Array& alpha, const Array& Delta,
                      const Array& gamma, const Array& Rn)
{
    std::size_t n = broadcastSize("PriestleyTaylor",
        {alpha.size(), Delta.size(), gamma.size(), Rn.size()});
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = PriestleyTaylor(at(alpha, i), at(Delta, i), at(gamma, i), at(Rn, i));
    }
    return out;
}

std::size_t sampleCount(const PETForcing& f)
{
    return broadcastSize("PotentialET",
        {f.air_T.size(), f.fuel_T.size(), f.elevation.size(), f.RH.size(),
         f.fuel_moist.size(), f.Rs.size(), f.Ra.size()});
}

Array PotentialET(const PETForcing& f, double albedo,
                  const CloudinessCoefficients& coeffs)
{
    std::size_t n = sampleCount(f);
    Array out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = PotentialET(at(f.air_T, i), at(f.fuel_T, i), at(f.elevation, i),
                             at(f.RH, i), at(f.fuel_moist, i),
                             at(f.Rs, i), at(f.Ra, i), albedo,
                             coeffs.ac, coeffs.bc);
    }
    return out;
}

Array PotentialET(const PETForcing& f, const std::vector<Array>& Ra_rows,
                  double albedo, const CloudinessCoefficients& coeffs)
{
    PETForcing columnar = f;
    columnar.Ra = firstColumn("PotentialET", Ra_rows);
    return PotentialET(columnar, albedo, coeffs);
}

} // namespace PTMethods
