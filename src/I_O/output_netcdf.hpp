#pragma once
#include <string>
#include <vector>

/**
 * @brief Write a PET series to a NetCDF-4 file with optional compression.
 *
 * The file holds one dimension @c time, a coordinate variable @c time (sample
 * index) and the variable @c pet [MJ m-2 day-1]. When @p timestamps is not
 * empty, the first and last timestamps are stored as attributes of @c time.
 *
 * @param filename          Output NetCDF file name (overwritten).
 * @param timestamps        Sample timestamps, empty or one per value.
 * @param pet               PET values, one per sample.
 * @param albedo            Albedo used for the run (global attribute).
 * @param compression_level Compression level (0 = no compression, 1-9 = increasing compression).
 *
 * Throws std::runtime_error if the file cannot be written.
 */
void write_pet_netcdf(const std::string& filename,
                      const std::vector<std::string>& timestamps,
                      const std::vector<double>& pet,
                      double albedo,
                      int compression_level = 4);
