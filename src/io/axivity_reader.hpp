// ============================================================================
// io/axivity_reader.hpp - Axivity AX3/AX6 (.cwa) block decoder
// ============================================================================
#pragma once
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <eigen3/Eigen/Dense>
#include "byte_order.hpp"
#include "device_metadata.hpp"
#include "read_error.hpp"
#include "reader_common.hpp"
#include "../data/day_windower.hpp"
#include "../data/sample_stream.hpp"
#include "../utils/log.hpp"
#include "../utils/wall_clock.hpp"

namespace accelio {

constexpr size_t AX_HEADER_SIZE = 1024;
constexpr size_t AX_BLOCK_SIZE = 512;
constexpr size_t AX_PAYLOAD_SIZE = 480;
constexpr uint16_t AX_HEADER_MAGIC = 0x444D;  // "MD"
constexpr uint16_t AX_BLOCK_MAGIC = 0x5841;   // "AX"
constexpr uint16_t AX_HEADER_LENGTH = 1020;
constexpr uint16_t AX_BLOCK_LENGTH = 508;
constexpr uint8_t AX_HARDWARE_AX6 = 0x64;

// Header record, @offsets into the 1024 byte "MD" packet.
struct AxivityHeader {
    uint16_t packet_header = 0;      // @0
    uint16_t packet_length = 0;      // @2
    uint8_t hardware_type = 0;       // @4  0x00/0xff/0x17 AX3, 0x64 AX6
    uint32_t device_id = 0;          // @5 lower, @11 upper
    uint32_t session_id = 0;         // @7
    uint32_t logging_start = 0;      // @13 packed time
    uint32_t logging_end = 0;        // @17 packed time
    uint8_t sensor_config = 0;       // @35 gyro range nibble, 0/0xff accel only
    uint8_t sampling_rate = 0;       // @36 rate code
    uint8_t firmware_revision = 0;   // @41
};

// Fixed part of a 512 byte "AX" data block.
struct AxivityBlockHeader {
    uint16_t packet_header = 0;      // @0
    uint16_t packet_length = 0;      // @2
    uint16_t device_fractional = 0;  // @4  top bit: 15-bit fraction of a second
    uint32_t session_id = 0;         // @6
    uint32_t sequence_id = 0;        // @10
    uint32_t timestamp = 0;          // @14 packed time
    uint16_t light = 0;              // @18 AAAGGGLLLLLLLLLL
    uint16_t temperature = 0;        // @20 bottom 10 bits
    uint8_t events = 0;              // @22
    uint8_t battery = 0;             // @23
    uint8_t sample_rate = 0;         // @24 rate code
    uint8_t axes_bps = 0;            // @25 high nibble axes, low nibble packing
    int16_t timestamp_offset = 0;    // @26
    uint16_t sample_count = 0;       // @28
    uint16_t checksum = 0;           // @510
};

namespace axivity {

inline AxivityHeader parse_header(const uint8_t* b) {
    AxivityHeader h;
    h.packet_header = bytes::u16le(b);
    h.packet_length = bytes::u16le(b + 2);
    h.hardware_type = b[4];
    uint16_t upper = bytes::u16le(b + 11);
    h.device_id = bytes::u16le(b + 5) | (upper == 0xffff ? 0u : uint32_t(upper) << 16);
    h.session_id = bytes::u32le(b + 7);
    h.logging_start = bytes::u32le(b + 13);
    h.logging_end = bytes::u32le(b + 17);
    h.sensor_config = b[35];
    h.sampling_rate = b[36];
    h.firmware_revision = b[41];
    return h;
}

inline AxivityBlockHeader parse_block_header(const uint8_t* b) {
    AxivityBlockHeader h;
    h.packet_header = bytes::u16le(b);
    h.packet_length = bytes::u16le(b + 2);
    h.device_fractional = bytes::u16le(b + 4);
    h.session_id = bytes::u32le(b + 6);
    h.sequence_id = bytes::u32le(b + 10);
    h.timestamp = bytes::u32le(b + 14);
    h.light = bytes::u16le(b + 18);
    h.temperature = bytes::u16le(b + 20);
    h.events = b[22];
    h.battery = b[23];
    h.sample_rate = b[24];
    h.axes_bps = b[25];
    h.timestamp_offset = bytes::i16le(b + 26);
    h.sample_count = bytes::u16le(b + 28);
    h.checksum = bytes::u16le(b + 510);
    return h;
}

// (MSB) YYYYYYMM MMDDDDDh hhhhmmmm mmssssss
inline double packed_time_to_seconds(uint32_t t) {
    return civil_to_seconds(int((t >> 26) & 0x3f) + 2000, int((t >> 22) & 0x0f),
                            int((t >> 17) & 0x1f), int((t >> 12) & 0x1f),
                            int((t >> 6) & 0x3f), int(t & 0x3f));
}

inline double rate_code_frequency(uint8_t code) {
    return 3200.0 / double(1 << (15 - (code & 0x0f)));
}

inline double rate_code_range(uint8_t code) { return double(16 >> (code >> 6)); }

// 16-bit word-wise sum of the whole block is zero for a valid block.
inline bool checksum_ok(const uint8_t* block) {
    uint16_t sum = 0;
    for (size_t i = 0; i < AX_BLOCK_SIZE; i += 2) sum = uint16_t(sum + bytes::u16le(block + i));
    return sum == 0;
}

inline double light_to_lux(uint16_t light) {
    double log10_lux_x1000 = (double(light & 0x3ff) + 512.0) * 6000.0 / 1024.0;
    return std::pow(10.0, log10_lux_x1000 / 1000.0);
}

inline double temperature_to_celsius(uint16_t temperature) {
    return double(temperature & 0x3ff) * 75.0 / 256.0 - 50.0;
}

// Stored halved with 512 removed from the 10-bit ADC reading.
inline double battery_to_volts(uint8_t battery) {
    return (double(battery) * 2.0 + 512.0) * 6.0 / 1024.0;
}

// Packed sample, bytes [3][2][1][0]: eezzzzzz zzzzyyyy yyyyyyxx xxxxxxxx
inline Eigen::Vector3d unpack_sample(uint32_t v) {
    int e = int(v >> 30);
    auto axis = [&](uint32_t shifted) {
        return double(int16_t(uint16_t(shifted & 0xffc0)) >> (6 - e));
    };
    return Eigen::Vector3d(axis(v << 6), axis(v >> 4), axis(v >> 14));
}

// Three little-endian int16 values.
inline Eigen::Vector3d axis_triplet(const uint8_t* p) {
    return Eigen::Vector3d(double(bytes::i16le(p)), double(bytes::i16le(p + 2)),
                           double(bytes::i16le(p + 4)));
}

} // namespace axivity

class AxivityReader {
private:
    ReaderConfig config;
    std::ifstream file;
    AxivityHeader header;
    DeviceMetadata meta;
    SampleStream samples;
    WindowIndex windows;
    std::optional<DayWindower> windower;
    ReaderState state = ReaderState::Unopened;
    long block_index = 0;
    std::vector<uint8_t> block;      // raw block being decoded
    std::vector<Sample> decoded;     // samples of the current block

public:
    explicit AxivityReader(const ReaderConfig& cfg = ReaderConfig()) : config(cfg) {
        meta.format = DeviceFormat::Axivity;
    }

    void read_header(const std::string& filename) {
        require_state(state, ReaderState::Unopened, "read_header");

        file.open(filename, std::ios::binary);
        if (!file) fail(ErrorCode::FileOpen, "cannot open file: " + filename);

        file.seekg(0, std::ios::end);
        std::streamoff file_size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> raw(AX_HEADER_SIZE);
        if (!file.read(reinterpret_cast<char*>(raw.data()), raw.size())) {
            fail(ErrorCode::BadHeader, "file shorter than the 1024 byte header");
        }
        header = axivity::parse_header(raw.data());
        if (header.packet_header != AX_HEADER_MAGIC || header.packet_length != AX_HEADER_LENGTH) {
            fail(ErrorCode::BadHeader, "missing MD header packet");
        }

        meta.device_id = std::to_string(header.device_id);
        meta.session_id = header.session_id;
        meta.hardware_type = header.hardware_type;
        meta.model = header.hardware_type == AX_HARDWARE_AX6 ? "AX6" : "AX3";
        meta.firmware = std::to_string(header.firmware_revision);
        meta.sample_rate = axivity::rate_code_frequency(header.sampling_rate);
        meta.range_g = axivity::rate_code_range(header.sampling_rate);
        meta.declared_blocks = long((file_size - std::streamoff(AX_HEADER_SIZE)) / AX_BLOCK_SIZE);
        if (header.logging_start != 0 && header.logging_start != 0xffffffffu) {
            meta.start_time = axivity::packed_time_to_seconds(header.logging_start);
        }
        if (header.logging_end != 0 && header.logging_end != 0xffffffffu) {
            meta.stop_time = axivity::packed_time_to_seconds(header.logging_end);
        }

        bool gyro_enabled = header.hardware_type == AX_HARDWARE_AX6
                            && header.sensor_config != 0x00 && header.sensor_config != 0xff;
        meta.n_axes = gyro_enabled ? 6 : 3;

        size_t per_block = meta.n_axes == 6 ? 40 : 120;
        if (meta.declared_blocks > 0) {
            // the first data block tells how the device actually packed samples
            block.resize(AX_BLOCK_SIZE);
            if (file.read(reinterpret_cast<char*>(block.data()), block.size())) {
                auto first = axivity::parse_block_header(block.data());
                if (axivity::checksum_ok(block.data()) && first.packet_header == AX_BLOCK_MAGIC) {
                    int axes = first.axes_bps >> 4;
                    bool axes_supported = axes == 3 || axes == 6;
                    if (!axes_supported || axes != meta.n_axes) {
                        fail(ErrorCode::MismatchAxisCount,
                             "first block has " + std::to_string(axes) + " axes, "
                             + meta.model + " header implies " + std::to_string(meta.n_axes));
                    }
                    if (first.sample_count > 0) per_block = first.sample_count;
                }
            }
            file.clear();
            file.seekg(std::streamoff(AX_HEADER_SIZE), std::ios::beg);
        }
        meta.declared_samples = size_t(meta.declared_blocks) * per_block;

        meta.channels.gyro = meta.n_axes == 6;
        meta.channels.temperature = true;
        meta.channels.light = true;
        meta.channels.battery = true;
        try {
            samples.configure(meta.channels, meta.declared_samples);
        } catch (const ReadError& e) {
            mark_faulted();
            ACCELIO_LOG_WARN("Axivity read failed: " << e.what());
            throw;
        }
        windower.emplace(meta.sample_rate, config.windows, config.max_days,
                         config.max_window_occurrences);
        block.assign(AX_BLOCK_SIZE, 0);
        decoded.reserve(per_block);

        state = ReaderState::HeaderRead;
        ACCELIO_LOG_DBG("Opened Axivity file " << filename << ": device " << meta.device_id
                        << ", session " << meta.session_id << ", " << meta.declared_blocks
                        << " blocks, " << meta.n_axes << " axes, " << meta.sample_rate << " Hz");
    }

    // Decode the next block. Returns false once every block has been read.
    bool read_block() {
        require_streamable(state, "read_block");
        state = ReaderState::Streaming;

        if (block_index >= meta.declared_blocks) return false;

        file.read(reinterpret_cast<char*>(block.data()), AX_BLOCK_SIZE);
        if (file.bad()) fail(ErrorCode::Io, "read failed at block " + std::to_string(block_index));
        if (size_t(file.gcount()) != AX_BLOCK_SIZE) {
            ACCELIO_LOG_WARN("Axivity block " << block_index << " truncated at end of file");
            return false;
        }

        long index = block_index++;
        ErrorCode err = decode_block();
        if (err != ErrorCode::None) {
            meta.anomalies.record_bad_block(err);
            ACCELIO_LOG_WARN("skipping Axivity block " << index << ": " << error_name(err));
            return true;
        }

        size_t first = samples.size();
        try {
            samples.append(decoded);
        } catch (const ReadError& e) {
            mark_faulted();
            ACCELIO_LOG_WARN("Axivity read failed: " << e.what());
            throw;
        }
        windower->push(samples.time().data() + first, decoded.size());
        meta.last_sample_time = decoded.back().time;
        return true;
    }

    void close() {
        if (file.is_open()) file.close();
        std::vector<uint8_t>().swap(block);
        std::vector<Sample>().swap(decoded);

        if (state == ReaderState::Closed || state == ReaderState::Faulted) return;
        if (windower) {
            windows = windower->finalize();
            windower.reset();
        }
        samples.finalize();
        state = ReaderState::Closed;

        ACCELIO_LOG_INFO("Axivity decode finished: " << samples.size() << " samples, "
                         << meta.anomalies.bad_blocks << " bad blocks of " << block_index);
    }

    OutputRecord release() {
        require_state(state, ReaderState::Closed, "release");
        OutputRecord out;
        out.metadata = meta;
        out.samples = std::move(samples);
        out.windows = std::move(windows);
        samples = SampleStream();
        windows = WindowIndex();
        return out;
    }

    const DeviceMetadata& metadata() const { return meta; }
    const AxivityHeader& get_header() const { return header; }
    const SampleStream& stream() const { return samples; }
    ReaderState get_state() const { return state; }

private:
    void mark_faulted() {
        state = ReaderState::Faulted;
        if (file.is_open()) file.close();
    }

    [[noreturn]] void fail(ErrorCode code, const std::string& what) {
        mark_faulted();
        ACCELIO_LOG_WARN("Axivity read failed: " << error_name(code) << ": " << what);
        throw ReadError(code, what);
    }

    // Fills `decoded` from `block`, or reports why the block is unusable.
    ErrorCode decode_block() {
        decoded.clear();
        const uint8_t* b = block.data();

        if (!axivity::checksum_ok(b)) return ErrorCode::BadChecksum;

        auto h = axivity::parse_block_header(b);
        if (h.packet_header != AX_BLOCK_MAGIC || h.packet_length != AX_BLOCK_LENGTH) {
            return ErrorCode::BadPackingCode;
        }

        int axes = h.axes_bps >> 4;
        int packing = h.axes_bps & 0x0f;
        size_t bytes_per_sample;
        if (packing == 0 && axes == 3) {
            bytes_per_sample = 4;
        } else if (packing == 2) {
            bytes_per_sample = size_t(2 * axes);
        } else {
            return ErrorCode::BadPackingCode;
        }
        if (axes != meta.n_axes) return ErrorCode::BadAxesPacked;
        if (h.sample_count == 0 || h.sample_count * bytes_per_sample > AX_PAYLOAD_SIZE) {
            return ErrorCode::InvalidBlockSamples;
        }

        double freq = axivity::rate_code_frequency(h.sample_rate);
        // With the fractional bit set, firmware has already moved
        // timestampOffset back by fraction * freq samples.
        double t0 = axivity::packed_time_to_seconds(h.timestamp);
        double offset = double(h.timestamp_offset);
        if (h.device_fractional & 0x8000) {
            double fraction = double((h.device_fractional & 0x7fff) << 1) / 65536.0;
            t0 += fraction;
            offset += fraction * freq;
        }
        t0 -= offset / freq;

        double accel_scale = 256.0;
        double gyro_range = 2000.0;
        if (packing == 2) {
            accel_scale = double(1 << (8 + ((h.light >> 13) & 0x07)));
            int gyro_code = (h.light >> 10) & 0x07;
            if (gyro_code) gyro_range = 8000.0 / double(1 << gyro_code);
        }
        if (samples.empty()) meta.calibration.accel_scale = accel_scale;

        double lux = axivity::light_to_lux(h.light);
        double temperature = axivity::temperature_to_celsius(h.temperature);
        double battery = axivity::battery_to_volts(h.battery);
        const uint8_t* data = b + 30;

        decoded.resize(h.sample_count);
        for (size_t i = 0; i < h.sample_count; ++i) {
            Sample& s = decoded[i];
            s.time = t0 + double(i) / freq;
            s.temperature = temperature;
            s.light = lux;
            s.battery = battery;
            if (packing == 0) {
                s.accel = axivity::unpack_sample(bytes::u32le(data + 4 * i)) / accel_scale;
            } else {
                const uint8_t* p = data + i * bytes_per_sample;
                if (axes == 6) {
                    s.gyro = axivity::axis_triplet(p) * (gyro_range / 32768.0);
                    p += 6;
                }
                s.accel = axivity::axis_triplet(p) / accel_scale;
            }
        }
        return ErrorCode::None;
    }
};

} // namespace accelio
