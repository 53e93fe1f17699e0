// ============================================================================
// data/sample_stream.hpp - Aligned per-sample channel arrays
// ============================================================================
#pragma once
#include <algorithm>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>
#include <eigen3/Eigen/Dense>
#include "../io/read_error.hpp"

namespace accelio {

// One fully decoded sample before it is appended to a stream.
struct Sample {
    double time = 0.0;                                  // local wall clock, s
    Eigen::Vector3d accel = Eigen::Vector3d::Zero();    // g
    Eigen::Vector3d gyro = Eigen::Vector3d::Zero();     // deg/s
    double temperature = 0.0;                           // deg C
    double light = 0.0;                                 // lux
    double battery = 0.0;                               // V
};

// Which optional channels a stream carries. Time and acceleration always exist.
struct ChannelLayout {
    bool gyro = false;
    bool temperature = false;
    bool light = false;
    bool battery = false;
};

// Parallel channel arrays sharing one sample-index space. Samples are only
// appended a whole block at a time, so a failed block never leaves a channel
// longer than the others.
class SampleStream {
public:
    using AxisMatrix = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;
    using AxisMap = Eigen::Map<const AxisMatrix>;

    void configure(const ChannelLayout& layout, size_t expected_samples) {
        channels = layout;
        clear();
        try {
            timestamps.reserve(expected_samples);
            accel_values.reserve(expected_samples * 3);
            if (channels.gyro) gyro_values.reserve(expected_samples * 3);
            if (channels.temperature) temperature_values.reserve(expected_samples);
            if (channels.light) light_values.reserve(expected_samples);
            if (channels.battery) battery_values.reserve(expected_samples);
        } catch (const std::bad_alloc&) {
            clear();
            throw ReadError(ErrorCode::Allocation,
                            "cannot reserve " + std::to_string(expected_samples) + " samples");
        } catch (const std::length_error&) {
            clear();
            throw ReadError(ErrorCode::Allocation,
                            "cannot reserve " + std::to_string(expected_samples) + " samples");
        }
    }

    // Append a decoded block. On allocation failure the stream is rolled back
    // to its previous length.
    void append(const std::vector<Sample>& block) {
        size_t n = size();
        try {
            for (const auto& s : block) {
                timestamps.push_back(s.time);
                accel_values.insert(accel_values.end(), s.accel.data(), s.accel.data() + 3);
                if (channels.gyro) gyro_values.insert(gyro_values.end(), s.gyro.data(), s.gyro.data() + 3);
                if (channels.temperature) temperature_values.push_back(s.temperature);
                if (channels.light) light_values.push_back(s.light);
                if (channels.battery) battery_values.push_back(s.battery);
            }
        } catch (const std::bad_alloc&) {
            truncate(n);
            throw ReadError(ErrorCode::Allocation,
                            "cannot grow sample stream past " + std::to_string(n) + " samples");
        }
    }

    // Trim spare capacity once decoding has ended.
    void finalize() {
        timestamps.shrink_to_fit();
        accel_values.shrink_to_fit();
        gyro_values.shrink_to_fit();
        temperature_values.shrink_to_fit();
        light_values.shrink_to_fit();
        battery_values.shrink_to_fit();
    }

    void clear() {
        timestamps.clear();
        accel_values.clear();
        gyro_values.clear();
        temperature_values.clear();
        light_values.clear();
        battery_values.clear();
    }

    size_t size() const { return timestamps.size(); }
    bool empty() const { return timestamps.empty(); }
    const ChannelLayout& layout() const { return channels; }

    const std::vector<double>& time() const { return timestamps; }
    const std::vector<double>& accel() const { return accel_values; }
    const std::vector<double>& gyro() const { return gyro_values; }
    const std::vector<double>& temperature() const { return temperature_values; }
    const std::vector<double>& light() const { return light_values; }
    const std::vector<double>& battery() const { return battery_values; }

    // N x 3 views without copying
    AxisMap accel_matrix() const { return AxisMap(accel_values.data(), Eigen::Index(size()), 3); }
    AxisMap gyro_matrix() const {
        return AxisMap(gyro_values.data(), Eigen::Index(gyro_values.size() / 3), 3);
    }

    // Every present channel has exactly one entry per timestamp.
    bool aligned() const {
        size_t n = size();
        return accel_values.size() == 3 * n
            && (!channels.gyro || gyro_values.size() == 3 * n)
            && (!channels.temperature || temperature_values.size() == n)
            && (!channels.light || light_values.size() == n)
            && (!channels.battery || battery_values.size() == n);
    }

private:
    void truncate(size_t n) {
        timestamps.resize(std::min(timestamps.size(), n));
        accel_values.resize(std::min(accel_values.size(), 3 * n));
        if (channels.gyro) gyro_values.resize(std::min(gyro_values.size(), 3 * n));
        if (channels.temperature) temperature_values.resize(std::min(temperature_values.size(), n));
        if (channels.light) light_values.resize(std::min(light_values.size(), n));
        if (channels.battery) battery_values.resize(std::min(battery_values.size(), n));
    }

    ChannelLayout channels;
    std::vector<double> timestamps;
    std::vector<double> accel_values;
    std::vector<double> gyro_values;
    std::vector<double> temperature_values;
    std::vector<double> light_values;
    std::vector<double> battery_values;
};

} // namespace accelio
