// ============================================================================
// io/device_metadata.hpp - Header-derived device description and output record
// ============================================================================
#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <eigen3/Eigen/Dense>
#include "read_error.hpp"
#include "../data/day_windower.hpp"
#include "../data/sample_stream.hpp"

namespace accelio {

enum class DeviceFormat { Axivity, GeneActiv, ActiGraph };

inline const char* format_name(DeviceFormat f) {
    switch (f) {
        case DeviceFormat::Axivity: return "Axivity";
        case DeviceFormat::GeneActiv: return "GeneActiv";
        case DeviceFormat::ActiGraph: return "ActiGraph";
    }
    return "Unknown";
}

// Recoverable problems seen while streaming blocks.
struct DecodeAnomalies {
    long bad_blocks = 0;          // blocks/records skipped, any reason
    long bad_checksums = 0;
    long bad_packing = 0;
    long bad_axes = 0;
    long bad_sample_counts = 0;
    bool sample_rate_drift = false;
    long drift_pages = 0;         // pages whose frequency differed from the header

    void record_bad_block(ErrorCode code) {
        ++bad_blocks;
        switch (code) {
            case ErrorCode::BadChecksum: ++bad_checksums; break;
            case ErrorCode::BadPackingCode: ++bad_packing; break;
            case ErrorCode::BadAxesPacked: ++bad_axes; break;
            case ErrorCode::InvalidBlockSamples: ++bad_sample_counts; break;
            default: break;
        }
    }

    void record_drift() {
        sample_rate_drift = true;
        ++drift_pages;
    }
};

struct Calibration {
    Eigen::Vector3d gain = Eigen::Vector3d::Ones();
    Eigen::Vector3d offset = Eigen::Vector3d::Zero();
    double volts = 0.0;           // GeneActiv light normalisation
    double lux = 0.0;             // GeneActiv light scale
    double accel_scale = 1.0;     // counts per g
    double lux_scale = 0.0;       // ActiGraph lux per count
    double lux_max = 0.0;         // ActiGraph lux ceiling
};

struct DeviceMetadata {
    DeviceFormat format = DeviceFormat::Axivity;
    std::string device_id;
    uint32_t session_id = 0;
    std::string model;
    std::string firmware;
    int hardware_type = 0;
    double sample_rate = 0.0;     // Hz, from the header
    double range_g = 0.0;
    int n_axes = 3;
    ChannelLayout channels;
    Calibration calibration;
    long declared_blocks = 0;
    size_t declared_samples = 0;
    double start_time = std::numeric_limits<double>::quiet_NaN();
    double stop_time = std::numeric_limits<double>::quiet_NaN();
    double last_sample_time = std::numeric_limits<double>::quiet_NaN();
    double download_time = std::numeric_limits<double>::quiet_NaN();
    bool legacy_layout = false;
    DecodeAnomalies anomalies;
};

// Everything a decode hands back to the caller.
struct OutputRecord {
    DeviceMetadata metadata;
    SampleStream samples;
    WindowIndex windows;
};

} // namespace accelio
