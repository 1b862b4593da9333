#pragma once

#include <iostream>
#include <vector>
#include <string>
#include <numeric>
#include <stdexcept>
#include <highfive/H5File.hpp>

struct FlatHDF5Data {
    std::vector<double> data;
    std::vector<size_t> shape;

    size_t size() const { return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<>()); }
    double& operator[](size_t i) { return data[i];}
};

inline FlatHDF5Data read_flat_hdf5_dataset(const std::string& filename, const std::string& dataset_path) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::DataSet dataset = file.getDataSet(dataset_path);
    std::vector<size_t> dims = dataset.getSpace().getDimensions();

    size_t total_size = std::accumulate(dims.begin(), dims.end(), size_t{1}, std::multiplies<>());
    std::vector<double> flat_data(total_size);

    dataset.read_raw(flat_data.data());

    return {flat_data, dims};
}

inline double read_hdf5_scalar(const std::string& filename, const std::string& dataset_path) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::DataSet dataset = file.getDataSet(dataset_path);

    double value;
    dataset.read(value);
    return value;
}

inline std::vector<std::string> read_hdf5_strings(const std::string& filename, const std::string& dataset_path) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::DataSet dataset = file.getDataSet(dataset_path);

    std::vector<std::string> values;
    dataset.read(values);
    return values;
}

// Write a flat buffer with the given shape; intermediate groups are created as needed
inline void write_flat_hdf5_dataset(HighFive::File& file, const std::string& dataset_path,
                                    const FlatHDF5Data& flat) {
    if (flat.data.size() != flat.size()) {
        throw std::invalid_argument("Shape of '" + dataset_path + "' does not match its data size");
    }
    HighFive::DataSet dataset = file.createDataSet<double>(dataset_path, HighFive::DataSpace(flat.shape));
    dataset.write_raw(flat.data.data());
}

inline void write_hdf5_vector(HighFive::File& file, const std::string& dataset_path,
                              const std::vector<double>& values) {
    write_flat_hdf5_dataset(file, dataset_path, FlatHDF5Data{values, {values.size()}});
}

inline void write_hdf5_scalar(HighFive::File& file, const std::string& dataset_path, double value) {
    file.createDataSet(dataset_path, value);
}

inline void write_hdf5_strings(HighFive::File& file, const std::string& dataset_path,
                               const std::vector<std::string>& values) {
    file.createDataSet(dataset_path, values);
}
