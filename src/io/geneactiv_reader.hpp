// ============================================================================
// io/geneactiv_reader.hpp - GENEActiv (.bin) page decoder
// ============================================================================
#pragma once
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <limits>
#include <map>
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

constexpr size_t GN_SAMPLES = 300;             // samples per page
constexpr size_t GN_SAMPLE_CHARS = 12;         // hex characters per sample
constexpr size_t GN_DATA_CHARS = GN_SAMPLES * GN_SAMPLE_CHARS;
constexpr size_t GN_PAGE_HEADER_LINES = 8;     // lines between "Recorded Data" and the data
constexpr double GN_FS_TOLERANCE = 1e-6;

namespace geneactiv {

inline std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

// Splits "Key:Value" at the first colon. Returns false for lines without one.
inline bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) return false;
    key = trim(line.substr(0, colon));
    value = trim(line.substr(colon + 1));
    return true;
}

// Leading number of a field such as "100 Hz" or "25548".
inline bool parse_number(const std::string& str, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(str, &pos);
        return pos > 0 && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

// "YYYY-MM-DD hh:mm:ss:mmm"
inline bool parse_page_time(const std::string& str, double& out) {
    int year, month, day, hour, minute, second, msec;
    char tail;
    if (std::sscanf(str.c_str(), "%4d-%2d-%2d %2d:%2d:%2d:%3d%c", &year, &month, &day,
                    &hour, &minute, &second, &msec, &tail) != 7) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59
        || second > 60 || msec < 0 || msec > 999) {
        return false;
    }
    out = civil_to_seconds(year, month, day, hour, minute, second) + msec / 1000.0;
    return true;
}

inline int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// One 48-bit sample: x(12) y(12) z(12) light(10) button(1) reserved(1)
struct RawSample {
    Eigen::Vector3d accel;
    double light = 0.0;
    bool button = false;
};

inline bool parse_raw_sample(const char* hex, RawSample& out) {
    uint64_t v = 0;
    for (size_t i = 0; i < GN_SAMPLE_CHARS; ++i) {
        int d = hex_digit(hex[i]);
        if (d < 0) return false;
        v = (v << 4) | uint64_t(d);
    }
    out.accel = Eigen::Vector3d(double(bytes::sign_extend(uint32_t(v >> 36), 12)),
                                double(bytes::sign_extend(uint32_t(v >> 24), 12)),
                                double(bytes::sign_extend(uint32_t(v >> 12), 12)));
    out.light = double((v >> 2) & 0x3ff);
    out.button = ((v >> 1) & 0x1) != 0;
    return true;
}

} // namespace geneactiv

class GeneActivReader {
private:
    ReaderConfig config;
    std::ifstream file;
    DeviceMetadata meta;
    SampleStream samples;
    WindowIndex windows;
    std::optional<DayWindower> windower;
    ReaderState state = ReaderState::Unopened;
    long page_index = 0;
    long line_num = 0;
    std::string line;
    std::vector<Sample> decoded;     // samples of the current page

public:
    explicit GeneActivReader(const ReaderConfig& cfg = ReaderConfig()) : config(cfg) {
        meta.format = DeviceFormat::GeneActiv;
    }

    void read_header(const std::string& filename) {
        require_state(state, ReaderState::Unopened, "read_header");

        file.open(filename);
        if (!file) fail(ErrorCode::FileOpen, "cannot open file: " + filename);

        std::map<std::string, std::string> params;
        bool have_pages = false;
        std::string key, value;
        while (next_line()) {
            if (!geneactiv::split_key_value(line, key, value)) continue;
            // first occurrence wins, pages repeat some keys
            if (!params.count(key)) params[key] = value;
            if (key == "Number of Pages") {
                have_pages = true;
                break;
            }
        }
        if (!have_pages) fail(ErrorCode::BadHeader, "no 'Number of Pages' entry in header");

        meta.device_id = params["Device Unique Serial Code"];
        meta.model = params["Device Model"];
        meta.firmware = params["Device Firmware"];

        meta.sample_rate = required_number(params, "Measurement Frequency");
        if (meta.sample_rate <= 0.0) fail(ErrorCode::BadHeader, "measurement frequency must be positive");
        double pages = required_number(params, "Number of Pages");
        if (pages < 0.0) fail(ErrorCode::BadHeader, "negative page count");
        if (pages >= double(std::numeric_limits<long>::max() / long(GN_SAMPLES))) {
            fail(ErrorCode::BadHeader, "page count " + params["Number of Pages"] + " out of range");
        }
        meta.declared_blocks = long(pages);

        auto& cal = meta.calibration;
        cal.gain = Eigen::Vector3d(required_number(params, "x gain"),
                                   required_number(params, "y gain"),
                                   required_number(params, "z gain"));
        cal.offset = Eigen::Vector3d(required_number(params, "x offset"),
                                     required_number(params, "y offset"),
                                     required_number(params, "z offset"));
        cal.volts = required_number(params, "Volts");
        cal.lux = required_number(params, "Lux");
        if ((cal.gain.array().abs() < 1e-12).any() || cal.volts == 0.0) {
            fail(ErrorCode::BadHeader, "zero gain or volts in calibration data");
        }

        double range = 0.0;
        if (params.count("Accelerometer Range")) {
            // "-8 to 8"
            std::string r = params["Accelerometer Range"];
            size_t to = r.find("to");
            if (to != std::string::npos && geneactiv::parse_number(r.substr(to + 2), range)) {
                meta.range_g = range;
            }
        }
        double start = 0.0;
        if (params.count("Start Time") && geneactiv::parse_page_time(params["Start Time"], start)) {
            meta.start_time = start;
        }

        meta.n_axes = 3;
        meta.declared_samples = size_t(meta.declared_blocks) * GN_SAMPLES;
        meta.channels.temperature = true;
        meta.channels.light = true;
        meta.channels.battery = true;
        try {
            samples.configure(meta.channels, meta.declared_samples);
        } catch (const ReadError& e) {
            mark_faulted();
            ACCELIO_LOG_WARN("GeneActiv read failed: " << e.what());
            throw;
        }
        windower.emplace(meta.sample_rate, config.windows, config.max_days,
                         config.max_window_occurrences);
        decoded.reserve(GN_SAMPLES);

        state = ReaderState::HeaderRead;
        ACCELIO_LOG_DBG("Opened GeneActiv file " << filename << ": serial " << meta.device_id
                        << ", " << meta.declared_blocks << " pages, " << meta.sample_rate << " Hz");
    }

    // Decode the next page. Returns false once every declared page has been read.
    bool read_block() {
        require_streamable(state, "read_block");
        state = ReaderState::Streaming;

        if (page_index >= meta.declared_blocks) return false;

        // pages are separated by blank lines
        bool found = false;
        while (next_line()) {
            if (line.empty()) continue;
            if (line != "Recorded Data") {
                fail(ErrorCode::TruncatedBlockData, "expected 'Recorded Data' at line "
                     + std::to_string(line_num) + ", lost page framing");
            }
            found = true;
            break;
        }
        if (!found) {
            if (file.bad()) fail(ErrorCode::Io, "read failed before page " + std::to_string(page_index));
            ACCELIO_LOG_WARN("GeneActiv file ended after " << page_index << " of "
                             << meta.declared_blocks << " pages");
            return false;
        }

        std::map<std::string, std::string> fields;
        std::string key, value;
        for (size_t i = 0; i < GN_PAGE_HEADER_LINES; ++i) {
            if (!next_line()) {
                fail(ErrorCode::TruncatedBlockData,
                     "page " + std::to_string(page_index) + " header cut short");
            }
            if (geneactiv::split_key_value(line, key, value)) fields[key] = value;
        }

        double page_time = 0.0;
        if (!fields.count("Page Time") || !geneactiv::parse_page_time(fields["Page Time"], page_time)) {
            fail(ErrorCode::BlockTimestamp, "page " + std::to_string(page_index)
                 + " has malformed time '" + fields["Page Time"] + "'");
        }

        double page_fs = 0.0;
        if (!geneactiv::parse_number(fields["Measurement Frequency"], page_fs)
            || std::abs(page_fs - meta.sample_rate) > GN_FS_TOLERANCE) {
            meta.anomalies.record_drift();
            ACCELIO_LOG_WARN(error_name(ErrorCode::SampleRateMismatch) << ": GeneActiv page "
                             << page_index << " frequency '"
                             << fields["Measurement Frequency"] << "' differs from header "
                             << meta.sample_rate << " Hz, using header rate");
        }

        double temperature = 0.0;
        if (!geneactiv::parse_number(fields["Temperature"], temperature)) {
            temperature = samples.temperature().empty() ? std::nan("") : samples.temperature().back();
        }
        double battery = 0.0;
        if (!geneactiv::parse_number(fields["Battery voltage"], battery)) {
            battery = samples.battery().empty() ? std::nan("") : samples.battery().back();
        }

        if (!next_line() || line.size() < GN_DATA_CHARS) {
            fail(ErrorCode::TruncatedBlockData, "page " + std::to_string(page_index) + " has "
                 + std::to_string(line.size()) + " data characters, expected "
                 + std::to_string(GN_DATA_CHARS));
        }

        const auto& cal = meta.calibration;
        decoded.resize(GN_SAMPLES);
        geneactiv::RawSample raw;
        for (size_t i = 0; i < GN_SAMPLES; ++i) {
            if (!geneactiv::parse_raw_sample(line.data() + i * GN_SAMPLE_CHARS, raw)) {
                fail(ErrorCode::TruncatedBlockData, "page " + std::to_string(page_index)
                     + " has a non-hex character in sample " + std::to_string(i));
            }
            Sample& s = decoded[i];
            s.time = page_time + double(i) / meta.sample_rate;
            s.accel = ((raw.accel.array() * 100.0 - cal.offset.array()) / cal.gain.array()).matrix();
            s.light = raw.light * cal.lux / cal.volts;
            s.temperature = temperature;
            s.battery = battery;
        }

        size_t first = samples.size();
        try {
            samples.append(decoded);
        } catch (const ReadError& e) {
            mark_faulted();
            ACCELIO_LOG_WARN("GeneActiv read failed: " << e.what());
            throw;
        }
        windower->push(samples.time().data() + first, decoded.size());
        meta.last_sample_time = decoded.back().time;
        ++page_index;
        return true;
    }

    void close() {
        if (file.is_open()) file.close();
        std::vector<Sample>().swap(decoded);
        std::string().swap(line);

        if (state == ReaderState::Closed || state == ReaderState::Faulted) return;
        if (windower) {
            windows = windower->finalize();
            windower.reset();
        }
        samples.finalize();
        state = ReaderState::Closed;

        ACCELIO_LOG_INFO("GeneActiv decode finished: " << samples.size() << " samples from "
                         << page_index << " pages, " << meta.anomalies.drift_pages
                         << " pages with frequency drift");
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
    bool next_line() {
        if (!std::getline(file, line)) return false;
        ++line_num;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    double required_number(std::map<std::string, std::string>& params, const std::string& key) {
        auto it = params.find(key);
        if (it == params.end()) fail(ErrorCode::BadHeader, "header field '" + key + "' missing");
        double v = 0.0;
        if (!geneactiv::parse_number(it->second, v)) {
            fail(ErrorCode::BadHeader, "header field '" + key + "' is not a number: '" + it->second + "'");
        }
        return v;
    }

    void mark_faulted() {
        state = ReaderState::Faulted;
        if (file.is_open()) file.close();
    }

    [[noreturn]] void fail(ErrorCode code, const std::string& what) {
        mark_faulted();
        ACCELIO_LOG_WARN("GeneActiv read failed: " << error_name(code) << ": " << what);
        throw ReadError(code, what);
    }
};

} // namespace accelio
