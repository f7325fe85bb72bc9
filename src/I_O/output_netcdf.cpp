#include <netcdf>
#include <string>
#include <vector>
#include <stdexcept>

#include "output_netcdf.hpp"

void write_pet_netcdf(const std::string& filename,
                      const std::vector<std::string>& timestamps,
                      const std::vector<double>& pet,
                      double albedo,
                      int compression_level) {
    const size_t num_samples = pet.size();
    // a zero-length dimension would be created as unlimited
    if (num_samples == 0) {
        throw std::runtime_error(filename + ": no PET samples to write");
    }
    if (!timestamps.empty() && timestamps.size() != num_samples) {
        throw std::runtime_error(filename + ": timestamp count does not match PET sample count");
    }

    try {
        netCDF::NcFile dataFile(filename, netCDF::NcFile::replace, netCDF::NcFile::nc4);

        // Create dimension
        auto timeDim = dataFile.addDim("time", num_samples);

        // Coordinate variable: sample index
        auto timeVar = dataFile.addVar("time", netCDF::ncDouble, timeDim);
        std::vector<double> time_vals(num_samples);
        for (size_t i = 0; i < num_samples; ++i) time_vals[i] = double(i);
        timeVar.putVar(time_vals.data());
        timeVar.putAtt("long_name", "Time");
        timeVar.putAtt("units", "sample index");
        if (!timestamps.empty()) {
            timeVar.putAtt("first_timestamp", timestamps.front());
            timeVar.putAtt("last_timestamp", timestamps.back());
        }

        // PET variable
        auto petVar = dataFile.addVar("pet", netCDF::ncDouble, timeDim);
        if (compression_level > 0) {
            petVar.setCompression(true, true, compression_level);
        }
        petVar.putAtt("long_name", "potential evapotranspiration (Priestley-Taylor)");
        petVar.putAtt("units", "MJ m-2 day-1");
        petVar.putVar(pet.data());

        dataFile.putAtt("albedo", netCDF::ncDouble, albedo);
        dataFile.putAtt("title", "Priestley-Taylor potential evapotranspiration");

    } catch (netCDF::exceptions::NcException &e) {
        throw std::runtime_error(filename + ": NetCDF error: " + e.what());
    }
}
