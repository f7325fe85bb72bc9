#include "solver/pet_api.hpp"    // for run_pet, gpu_device_count, setup_gpu_buffers...
#include "models/pt_array.hpp"   // for PotentialET, sampleCount
#include "gtest/gtest.h"         // for Test, GTEST_SKIP, TestInfo...
#include <cmath>                 // for isfinite
#include <stdexcept>             // for invalid_argument
#include <vector>                // for vector

namespace {

PETForcing makeForcing(int n) {
    PETForcing f;
    for (int i = 0; i < n; ++i) {
        double x = double(i % 37);
        f.air_T.push_back(5. + 0.8 * x);
        f.fuel_T.push_back(4. + 0.9 * x);
        f.RH.push_back(30. + x);
        f.fuel_moist.push_back(35. + 1.2 * x);
        f.Rs.push_back(6. + 0.5 * x);
        f.Ra.push_back(i % 11 == 0 ? 0. : 25. + 0.3 * x);
    }
    f.elevation = {640.};
    return f;
}

// Test the GPU batch evaluator against the host pipeline
TEST(PetApiTest, MatchesHostEvaluation) {
    if (pet_api::gpu_device_count() == 0) {
        GTEST_SKIP() << "no CUDA device available";
    }

    // more samples than one block of threads
    PETForcing f = makeForcing(1000);
    PTMethods::CloudinessCoefficients coeffs;
    coeffs.ac = 0.7;
    coeffs.bc = 0.25;

    std::vector<double> host = PTMethods::PotentialET(f, 0.21, coeffs);
    std::vector<double> device = pet_api::run_pet(f, 0.21, coeffs);

    ASSERT_EQ(device.size(), host.size());
    for (size_t i = 0; i < host.size(); ++i) {
        if (std::isfinite(host[i])) {
            EXPECT_NEAR(device[i], host[i], 1e-9 * (1. + std::fabs(host[i]))) << "i = " << i;
        } else {
            EXPECT_FALSE(std::isfinite(device[i])) << "i = " << i;
        }
    }
}

TEST(PetApiTest, StepwiseApi) {
    if (pet_api::gpu_device_count() == 0) {
        GTEST_SKIP() << "no CUDA device available";
    }

    PETForcing f = makeForcing(5);
    PTMethods::CloudinessCoefficients coeffs;

    auto [d_forcing, d_pet, n] = pet_api::setup_gpu_buffers(f);
    ASSERT_EQ(n, 5);
    EXPECT_EQ(d_forcing.broadcast[pet_api::ELEVATION], 1);
    EXPECT_EQ(d_forcing.broadcast[pet_api::AIR_T], 0);

    pet_api::launch_pet_kernel(d_forcing, d_pet, n, 0.2, coeffs);
    std::vector<double> device = pet_api::retrieve_and_free(d_forcing, d_pet, n);

    std::vector<double> host = PTMethods::PotentialET(f, 0.2, coeffs);
    ASSERT_EQ(device.size(), host.size());
    for (size_t i = 0; i < host.size(); ++i) {
        EXPECT_NEAR(device[i], host[i], 1e-9 * (1. + std::fabs(host[i]))) << "i = " << i;
    }
}

TEST(PetApiTest, EmptyAndMismatchedForcing) {
    if (pet_api::gpu_device_count() == 0) {
        GTEST_SKIP() << "no CUDA device available";
    }

    PETForcing empty;
    EXPECT_TRUE(pet_api::run_pet(empty, 0.2, PTMethods::CloudinessCoefficients()).empty());

    PETForcing bad = makeForcing(4);
    bad.RH.pop_back();
    EXPECT_THROW(pet_api::run_pet(bad, 0.2, PTMethods::CloudinessCoefficients()),
                 std::invalid_argument);
}

} // namespace
