// ============================================================================
// io/actigraph_reader.hpp - ActiGraph (.gt3x) archive decoder
// ============================================================================
#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <eigen3/Eigen/Dense>
#include "byte_order.hpp"
#include "device_metadata.hpp"
#include "read_error.hpp"
#include "reader_common.hpp"
#include "zip_member.hpp"
#include "../data/day_windower.hpp"
#include "../data/sample_stream.hpp"
#include "../utils/log.hpp"
#include "../utils/wall_clock.hpp"

namespace accelio {

namespace actigraph {

constexpr uint8_t RECORD_SEPARATOR = 0x1E;
constexpr size_t RECORD_HEADER_SIZE = 8;  // separator, type, timestamp(4), size(2)

enum LogRecordType : uint8_t {
    LOG_ACTIVITY = 0x00,    // 12-bit packed y, x, z
    LOG_BATTERY = 0x02,     // uint16 millivolts
    LOG_EVENT = 0x03,
    LOG_LUX = 0x05,         // uint16 raw lux
    LOG_METADATA = 0x06,
    LOG_PARAMETERS = 0x16,
    LOG_ACTIVITY2 = 0x1A    // int16 x, y, z
};

constexpr const char* INFO_MEMBER = "info.txt";
constexpr const char* LOG_MEMBER = "log.bin";
constexpr const char* OLD_ACTIVITY_MEMBER = "activity.bin";
constexpr const char* OLD_LUX_MEMBER = "lux.bin";

// 9 bytes hold exactly two packed samples
constexpr size_t OLD_CHUNK_BYTES = 9 * 512;

struct LogRecord {
    uint8_t type = 0;
    uint32_t timestamp = 0;
    std::vector<uint8_t> payload;
    bool checksum_ok = false;
};

// One's complement of the XOR of every byte from separator through payload.
inline uint8_t record_checksum(const uint8_t* header, const std::vector<uint8_t>& payload) {
    uint8_t x = 0;
    for (size_t i = 0; i < RECORD_HEADER_SIZE; ++i) x ^= header[i];
    for (uint8_t b : payload) x ^= b;
    return uint8_t(~x);
}

// Next record of log.bin. Returns false at the end of the log or on a record
// cut short by the end. Bytes skipped while looking for a separator are
// reported through `lost_framing`.
inline bool next_record(ZipMemberStream& in, LogRecord& rec, long& lost_framing) {
    uint8_t header[RECORD_HEADER_SIZE];
    bool skipping = false;
    for (;;) {
        if (!in.read_byte(header[0])) return false;
        if (header[0] == RECORD_SEPARATOR) break;
        if (!skipping) {
            ++lost_framing;
            skipping = true;
        }
    }
    if (in.read(header + 1, RECORD_HEADER_SIZE - 1) != RECORD_HEADER_SIZE - 1) return false;

    rec.type = header[1];
    rec.timestamp = bytes::u32le(header + 2);
    uint16_t size = bytes::u16le(header + 6);
    rec.payload.resize(size);
    if (in.read(rec.payload.data(), size) != size) return false;

    uint8_t checksum = 0;
    if (!in.read_byte(checksum)) return false;
    rec.checksum_ok = checksum == record_checksum(header, rec.payload);
    return true;
}

// k-th 12-bit value of a big-endian bit stream
inline int32_t packed_value(const uint8_t* data, size_t k) {
    size_t bit = k * 12;
    size_t byte = bit / 8;
    uint32_t v;
    if (bit % 8 == 0) {
        v = (uint32_t(data[byte]) << 4) | (uint32_t(data[byte + 1]) >> 4);
    } else {
        v = ((uint32_t(data[byte]) & 0x0f) << 8) | uint32_t(data[byte + 1]);
    }
    return bytes::sign_extend(v, 12);
}

inline size_t packed_sample_count(size_t n_bytes) { return n_bytes * 8 / 36; }

// Samples are stored y, x, z.
inline Eigen::Vector3d packed_sample(const uint8_t* data, size_t i) {
    return Eigen::Vector3d(double(packed_value(data, 3 * i + 1)),
                           double(packed_value(data, 3 * i)),
                           double(packed_value(data, 3 * i + 2)));
}

inline bool parse_ticks(const std::string& value, double& out) {
    try {
        size_t pos = 0;
        long long ticks = std::stoll(value, &pos);
        if (pos == 0) return false;
        out = ticks == 0 ? std::numeric_limits<double>::quiet_NaN() : ticks_to_seconds(ticks);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parse_double(const std::string& value, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(value, &pos);
        return pos > 0 && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

inline std::map<std::string, std::string> parse_info(const std::string& text) {
    std::map<std::string, std::string> params;
    std::istringstream in(text);
    std::string line;
    auto trim = [](const std::string& str) -> std::string {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    };
    while (std::getline(in, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        params[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return params;
}

} // namespace actigraph

class ActiGraphReader {
private:
    ReaderConfig config;
    ZipArchivePtr archive;
    ZipMemberStream activity;        // log.bin, or activity.bin for the legacy layout
    DeviceMetadata meta;
    SampleStream samples;
    WindowIndex windows;
    std::optional<DayWindower> windower;
    ReaderState state = ReaderState::Unopened;
    uint8_t activity_type = actigraph::LOG_ACTIVITY;
    long record_index = 0;
    double current_lux = std::numeric_limits<double>::quiet_NaN();
    double current_battery = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> old_lux;     // legacy lux.bin, one value per second
    actigraph::LogRecord record;
    std::vector<uint8_t> chunk;
    std::vector<Sample> decoded;

public:
    explicit ActiGraphReader(const ReaderConfig& cfg = ReaderConfig()) : config(cfg) {
        meta.format = DeviceFormat::ActiGraph;
    }

    void read_header(const std::string& filename) {
        require_state(state, ReaderState::Unopened, "read_header");

        int zip_err = 0;
        archive = open_zip_archive(filename, zip_err);
        if (!archive) {
            fail(ErrorCode::ArchiveOpen, "cannot open archive " + filename
                 + " (libzip error " + std::to_string(zip_err) + ")");
        }

        try {
            read_info();
            if (zip_has_member(archive.get(), actigraph::LOG_MEMBER)) {
                meta.legacy_layout = false;
                scan_log();
            } else if (zip_has_member(archive.get(), actigraph::OLD_ACTIVITY_MEMBER)) {
                meta.legacy_layout = true;
                open_old_activity();
            } else {
                fail(ErrorCode::LogOpen, "archive holds neither log.bin nor activity.bin");
            }

            meta.n_axes = 3;
            samples.configure(meta.channels, meta.declared_samples);
        } catch (const ReadError& e) {
            if (state != ReaderState::Faulted) {
                mark_faulted();
                ACCELIO_LOG_WARN("ActiGraph read failed: " << e.what());
            }
            throw;
        }

        windower.emplace(meta.sample_rate, config.windows, config.max_days,
                         config.max_window_occurrences);
        decoded.reserve(size_t(std::ceil(meta.sample_rate)));

        state = ReaderState::HeaderRead;
        ACCELIO_LOG_DBG("Opened ActiGraph archive " << filename << ": serial " << meta.device_id
                        << ", firmware " << meta.firmware << ", " << meta.sample_rate << " Hz, "
                        << (meta.legacy_layout ? "legacy activity.bin" : "log.bin")
                        << ", ~" << meta.declared_samples << " samples");
    }

    // Decode the next log record (or legacy chunk). Returns false at the end.
    bool read_block() {
        require_streamable(state, "read_block");
        state = ReaderState::Streaming;

        try {
            return meta.legacy_layout ? read_old_chunk() : read_log_record();
        } catch (const ReadError& e) {
            if (state != ReaderState::Faulted) {
                mark_faulted();
                ACCELIO_LOG_WARN("ActiGraph read failed: " << e.what());
            }
            throw;
        }
    }

    void close() {
        activity.close();
        archive.reset();
        std::vector<uint8_t>().swap(chunk);
        std::vector<uint8_t>().swap(record.payload);
        std::vector<Sample>().swap(decoded);
        std::vector<double>().swap(old_lux);

        if (state == ReaderState::Closed || state == ReaderState::Faulted) return;
        if (windower) {
            windows = windower->finalize();
            windower.reset();
        }
        samples.finalize();
        state = ReaderState::Closed;

        ACCELIO_LOG_INFO("ActiGraph decode finished: " << samples.size() << " samples, "
                         << meta.anomalies.bad_blocks << " bad records");
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
    const SampleStream& stream() const { return samples; }
    ReaderState get_state() const { return state; }

private:
    void read_info() {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat(archive.get(), actigraph::INFO_MEMBER, 0, &st) != 0) {
            fail(ErrorCode::InfoStat, "archive has no info.txt");
        }
        ZipMemberStream info;
        if (!info.open(archive.get(), actigraph::INFO_MEMBER)) {
            fail(ErrorCode::InfoOpen, "cannot open info.txt");
        }
        auto params = actigraph::parse_info(info.read_all());

        meta.device_id = params["Serial Number"];
        meta.model = params["Device Type"];
        meta.firmware = params["Firmware"];

        double rate = 0.0;
        if (!params.count("Sample Rate") || !actigraph::parse_double(params["Sample Rate"], rate)
            || rate <= 0.0) {
            fail(ErrorCode::BadHeader, "info.txt sample rate missing or invalid: '"
                 + params["Sample Rate"] + "'");
        }
        meta.sample_rate = rate;

        struct TickField { const char* key; double* target; };
        TickField tick_fields[] = {
            {"Start Date", &meta.start_time},
            {"Stop Date", &meta.stop_time},
            {"Last Sample Time", &meta.last_sample_time},
            {"Download Date", &meta.download_time},
        };
        for (const auto& f : tick_fields) {
            if (!params.count(f.key)) continue;
            if (!actigraph::parse_ticks(params[f.key], *f.target)) {
                fail(ErrorCode::BadHeader, std::string("info.txt '") + f.key + "' is not a tick count");
            }
        }

        auto& cal = meta.calibration;
        cal.accel_scale = 0.0;
        if (params.count("Acceleration Scale")
            && !actigraph::parse_double(params["Acceleration Scale"], cal.accel_scale)) {
            fail(ErrorCode::BadHeader, "info.txt acceleration scale is not a number");
        }
        if (params.count("Lux Scale Factor")
            && !actigraph::parse_double(params["Lux Scale Factor"], cal.lux_scale)) {
            fail(ErrorCode::BadHeader, "info.txt lux scale factor is not a number");
        }
        if (params.count("Lux Max Value")
            && !actigraph::parse_double(params["Lux Max Value"], cal.lux_max)) {
            fail(ErrorCode::BadHeader, "info.txt lux max value is not a number");
        }
        double range = 0.0;
        if (params.count("Acceleration Max") && actigraph::parse_double(params["Acceleration Max"], range)) {
            meta.range_g = range;
        }
    }

    // First pass over log.bin: activity record type and a sample count estimate.
    void scan_log() {
        ZipMemberStream log;
        if (!log.open(archive.get(), actigraph::LOG_MEMBER)) {
            fail(ErrorCode::LogOpen, "cannot open log.bin");
        }

        bool seen_activity = false, seen_activity2 = false;
        size_t n_samples = 0;
        long n_records = 0, lost = 0;
        actigraph::LogRecord rec;
        while (actigraph::next_record(log, rec, lost)) {
            ++n_records;
            // a corrupt record's type byte cannot be trusted
            if (!rec.checksum_ok) continue;
            switch (rec.type) {
                case actigraph::LOG_ACTIVITY:
                    seen_activity = true;
                    n_samples += actigraph::packed_sample_count(rec.payload.size());
                    break;
                case actigraph::LOG_ACTIVITY2:
                    seen_activity2 = true;
                    n_samples += rec.payload.size() / 6;
                    break;
                case actigraph::LOG_LUX:
                    meta.channels.light = true;
                    break;
                case actigraph::LOG_BATTERY:
                    meta.channels.battery = true;
                    break;
                default:
                    break;
            }
        }
        if (seen_activity && seen_activity2) {
            fail(ErrorCode::MultipleActivityTypes,
                 "log.bin holds both ACTIVITY and ACTIVITY2 records");
        }
        activity_type = seen_activity2 ? actigraph::LOG_ACTIVITY2 : actigraph::LOG_ACTIVITY;
        if (meta.calibration.accel_scale <= 0.0) {
            meta.calibration.accel_scale = seen_activity2 ? 256.0 : 341.0;
        }
        meta.declared_blocks = n_records;
        meta.declared_samples = n_samples;

        if (!activity.open(archive.get(), actigraph::LOG_MEMBER)) {
            fail(ErrorCode::LogOpen, "cannot reopen log.bin");
        }
    }

    void open_old_activity() {
        if (std::isnan(meta.start_time)) {
            fail(ErrorCode::BadHeader, "legacy archive needs a start date in info.txt");
        }
        if (meta.calibration.accel_scale <= 0.0) meta.calibration.accel_scale = 341.0;

        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat(archive.get(), actigraph::OLD_ACTIVITY_MEMBER, 0, &st) != 0
            || !activity.open(archive.get(), actigraph::OLD_ACTIVITY_MEMBER)) {
            fail(ErrorCode::OldActivityOpen, "cannot open activity.bin");
        }
        if (st.valid & ZIP_STAT_SIZE) {
            meta.declared_samples = actigraph::packed_sample_count(size_t(st.size));
            meta.declared_blocks = long((st.size + actigraph::OLD_CHUNK_BYTES - 1) / actigraph::OLD_CHUNK_BYTES);
        }

        if (zip_has_member(archive.get(), actigraph::OLD_LUX_MEMBER)) {
            ZipMemberStream lux;
            if (!lux.open(archive.get(), actigraph::OLD_LUX_MEMBER)) {
                fail(ErrorCode::OldLuxOpen, "cannot open lux.bin");
            }
            std::string raw = lux.read_all();
            old_lux.reserve(raw.size() / 2);
            for (size_t i = 0; i + 1 < raw.size(); i += 2) {
                old_lux.push_back(scale_lux(bytes::u16le(reinterpret_cast<const uint8_t*>(raw.data() + i))));
            }
            meta.channels.light = true;
        }
        chunk.resize(actigraph::OLD_CHUNK_BYTES);
    }

    double scale_lux(uint16_t raw) const {
        double lux = double(raw) * meta.calibration.lux_scale;
        if (meta.calibration.lux_max > 0.0) lux = std::min(lux, meta.calibration.lux_max);
        return lux;
    }

    bool read_log_record() {
        long lost = 0;
        bool more = actigraph::next_record(activity, record, lost);
        if (lost > 0) {
            meta.anomalies.bad_blocks += lost;
            ACCELIO_LOG_WARN("ActiGraph log lost record framing before record " << record_index);
        }
        if (!more) return false;

        long index = record_index++;
        if (!record.checksum_ok) {
            meta.anomalies.record_bad_block(ErrorCode::BadChecksum);
            ACCELIO_LOG_WARN("skipping ActiGraph record " << index << ": "
                             << error_name(ErrorCode::BadChecksum));
            return true;
        }

        const auto& p = record.payload;
        switch (record.type) {
            case actigraph::LOG_LUX:
                if (p.size() >= 2) current_lux = scale_lux(bytes::u16le(p.data()));
                return true;
            case actigraph::LOG_BATTERY:
                if (p.size() >= 2) current_battery = bytes::u16le(p.data()) / 1000.0;
                return true;
            case actigraph::LOG_ACTIVITY:
            case actigraph::LOG_ACTIVITY2:
                break;
            default:
                return true;
        }

        const double scale = meta.calibration.accel_scale;
        const double t0 = double(record.timestamp);
        decoded.clear();
        if (record.type == actigraph::LOG_ACTIVITY2) {
            if (p.size() % 6 != 0) {
                meta.anomalies.record_bad_block(ErrorCode::InvalidBlockSamples);
                ACCELIO_LOG_WARN("skipping ActiGraph record " << index << ": payload of "
                                 << p.size() << " bytes is not whole int16 triplets");
                return true;
            }
            decoded.resize(p.size() / 6);
            for (size_t i = 0; i < decoded.size(); ++i) {
                const uint8_t* s = p.data() + 6 * i;
                decoded[i].accel = Eigen::Vector3d(double(bytes::i16le(s)), double(bytes::i16le(s + 2)),
                                                   double(bytes::i16le(s + 4))) / scale;
            }
        } else {
            decoded.resize(actigraph::packed_sample_count(p.size()));
            for (size_t i = 0; i < decoded.size(); ++i) {
                decoded[i].accel = actigraph::packed_sample(p.data(), i) / scale;
            }
        }
        for (size_t i = 0; i < decoded.size(); ++i) {
            decoded[i].time = t0 + double(i) / meta.sample_rate;
            decoded[i].light = current_lux;
            decoded[i].battery = current_battery;
        }
        append_decoded();
        return true;
    }

    bool read_old_chunk() {
        size_t got = activity.read(chunk.data(), chunk.size());
        size_t n = actigraph::packed_sample_count(got);
        if (n == 0) return false;

        const double scale = meta.calibration.accel_scale;
        size_t first = samples.size();
        decoded.resize(n);
        for (size_t i = 0; i < n; ++i) {
            size_t k = first + i;
            Sample& s = decoded[i];
            s.time = meta.start_time + double(k) / meta.sample_rate;
            s.accel = actigraph::packed_sample(chunk.data(), i) / scale;
            if (meta.channels.light) {
                size_t second = size_t(double(k) / meta.sample_rate);
                s.light = second < old_lux.size() ? old_lux[second]
                                                  : std::numeric_limits<double>::quiet_NaN();
            }
        }
        ++record_index;
        append_decoded();
        return true;
    }

    void append_decoded() {
        if (decoded.empty()) return;
        size_t first = samples.size();
        samples.append(decoded);
        windower->push(samples.time().data() + first, decoded.size());
        meta.last_sample_time = decoded.back().time;
    }

    void mark_faulted() {
        state = ReaderState::Faulted;
        activity.close();
        archive.reset();
    }

    [[noreturn]] void fail(ErrorCode code, const std::string& what) {
        mark_faulted();
        ACCELIO_LOG_WARN("ActiGraph read failed: " << error_name(code) << ": " << what);
        throw ReadError(code, what);
    }
};

} // namespace accelio
