// main.cpp

#include <cstdio>
#include <cmath>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <mpi.h>

#include "forcing.hpp"
#include "models/PTmethods.hpp"
#include "models/pt_array.hpp"       // PotentialET over PETForcing, sampleCount
#include "I_O/config_loader.hpp"     // RunConfig, ConfigLoader
#include "I_O/forcing_chunks.hpp"    // calculateSampleChunks, sliceForcing
#include "I_O/graph_results.hpp"     // graphETResults
#include "I_O/output_netcdf.hpp"     // write_pet_netcdf
#ifdef PTET_WITH_CUDA
#include "solver/pet_api.hpp"        // run_pet, print_gpu_properties
#endif

namespace {

// Evaluate one rank's chunk on the configured device
std::vector<double> evaluate_chunk(const RunConfig& config,
                                   const PETForcing& local,
                                   const PTMethods::CloudinessCoefficients& coeffs) {
    if (config.device == "gpu") {
#ifdef PTET_WITH_CUDA
        return pet_api::run_pet(local, config.albedo, coeffs);
#else
        throw std::runtime_error("run.device is 'gpu' but ptet was built without CUDA");
#endif
    }
    return PTMethods::PotentialET(local, config.albedo, coeffs);
}

} // namespace

// ────────── Main function: Priestley-Taylor PET over all samples ──────────

int main(int argc, char** argv) {

    MPI_Init(&argc, &argv);
    int rank = 0, size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (argc < 2) {
        if (rank == 0) {
            std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
        }
        MPI_Finalize();
        return 1;
    }

    try {
        // ───────── 0) load run configuration ─────────
        RunConfig config = ConfigLoader::loadConfig(argv[1]);
        size_t num_samples = PTMethods::sampleCount(config.forcing);

        if (rank == 0) {
            std::cout << "Run '" << config.run_name << "': " << num_samples
                      << " samples on " << size << " rank(s), device = "
                      << config.device << std::endl;
        }

#ifdef PTET_WITH_CUDA
        if (config.device == "gpu" && rank == 0) {
            pet_api::print_gpu_properties();
        }
#endif

        // ───────── 1) split samples over ranks ─────────
        auto chunks = calculateSampleChunks(num_samples, size);
        const SampleChunk& mine = chunks[rank];
        PETForcing local = sliceForcing(config.forcing, mine);

        // ───────── 2) evaluate this rank's chunk ─────────
        PTMethods::CloudinessCoefficients coeffs;
        coeffs.ac = config.ac;
        coeffs.bc = config.bc;

        auto start = std::chrono::high_resolution_clock::now();
        std::vector<double> local_pet;
        if (mine.count > 0) {
            local_pet = evaluate_chunk(config, local, coeffs);
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - start;

        // ───────── 3) gather on rank 0 ─────────
        std::vector<int> counts(size), displs(size);
        for (int r = 0; r < size; ++r) {
            counts[r] = int(chunks[r].count);
            displs[r] = int(chunks[r].start);
        }
        std::vector<double> pet(rank == 0 ? num_samples : 0);
        MPI_Gatherv(local_pet.data(), counts[rank], MPI_DOUBLE,
                    pet.data(), counts.data(), displs.data(), MPI_DOUBLE,
                    0, MPI_COMM_WORLD);

        if (rank == 0) {
            std::cout << "PET evaluation took " << elapsed.count() << " seconds on rank 0.\n";

            // ───────── Print a quick summary ─────────
            size_t non_finite = 0;
            for (double v : pet) {
                if (!std::isfinite(v)) ++non_finite;
            }
            if (non_finite > 0) {
                std::cerr << "Warning: " << non_finite << " of " << num_samples
                          << " PET values are not finite" << std::endl;
            }
            if (config.verbose) {
                std::printf("PET [MJ m^-2 day^-1]:\n");
                for (size_t i = 0; i < num_samples; ++i) {
                    if (!config.timestamps.empty()) {
                        std::printf(" %s: %.6f\n", config.timestamps[i].c_str(), pet[i]);
                    } else {
                        std::printf(" sample %zu: %.6f\n", i, pet[i]);
                    }
                }
            }

            // ───────── Write to netcdf ─────────
            std::string filename = config.output_path + "/" + config.output_file;
            write_pet_netcdf(filename, config.timestamps, pet, config.albedo,
                             config.compression_level);
            std::cout << "Write out finished: " << filename << std::endl;

            // ───────── Present results by date ─────────
            if (!config.timestamps.empty()) {
                auto dates = graphETResults(config.timestamps, pet, config.verbose,
                                            config.title, config.ylabel, config.xlabel);
                std::cout << dates.size() << " distinct date(s) from "
                          << dates.front().toString() << " to "
                          << dates.back().toString() << std::endl;
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error (rank " << rank << "): " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return 0;
}
