// src/solver/pet_api.hpp
#pragma once

#include <tuple>
#include <vector>

#include "forcing.hpp"
#include "models/PTmethods.hpp"

// Host-side API of the GPU batch evaluator. The kernel and the CUDA calls
// live in pet_api.cu; this header stays includable from plain C++.

namespace pet_api {

// Slots of the forcing arrays in DeviceForcing
enum ForcingSlot {
    AIR_T = 0,
    FUEL_T,
    ELEVATION,
    RH,
    FUEL_MOIST,
    RS,
    RA,
    N_FORCING
};

// Device copies of the PETForcing arrays.
//   • data[k]      device pointer of slot k
//   • broadcast[k] 1 if slot k holds a single value shared by all samples
struct DeviceForcing {
    double* data[N_FORCING];
    int     broadcast[N_FORCING];
};

// Number of CUDA devices visible to this process (0 if the runtime has none).
int gpu_device_count();

// Print name and compute capability of the current device.
void print_gpu_properties();

// ───────── 1) Allocate GPU buffers & copy inputs ─────────
// Returns the device forcing, the device output buffer and the sample count.
// Throws std::runtime_error on CUDA failures, std::invalid_argument on
// mismatched array lengths.
std::tuple<DeviceForcing, double*, int>
setup_gpu_buffers(const PETForcing& h_forcing);

// ───────── 2) Launch the PET kernel (one thread per sample) ─────────
void launch_pet_kernel(const DeviceForcing& d_forcing,
                       double* d_pet,
                       int num_samples,
                       double albedo,
                       const PTMethods::CloudinessCoefficients& coeffs);

// ───────── 3) Copy back results & free GPU memory ─────────
std::vector<double> retrieve_and_free(DeviceForcing& d_forcing,
                                      double* d_pet,
                                      int num_samples);

// ───────── run_pet composes everything ─────────
std::vector<double> run_pet(const PETForcing& h_forcing,
                            double albedo,
                            const PTMethods::CloudinessCoefficients& coeffs);

} // namespace pet_api
