// ============================================================================
// tests/test_geneactiv_reader.cpp - Unit tests for the GENEActiv .bin decoder
// ============================================================================
#include <iostream>
#include <vector>
#include <cmath>
#include "test_common.hpp"
#include "test_files.hpp"
#include "../src/io/geneactiv_reader.hpp"

using namespace accelio;
using namespace testfiles;

OutputRecord decode(const std::string& path, const ReaderConfig& config = ReaderConfig()) {
    GeneActivReader reader(config);
    reader.read_header(path);
    while (reader.read_block()) {}
    reader.close();
    return reader.release();
}

std::string replace_first(std::string text, const std::string& from, const std::string& to) {
    size_t pos = text.find(from);
    if (pos != std::string::npos) text.replace(pos, from.size(), to);
    return text;
}

// ============================================================================
// Field parsing tests
// ============================================================================
void test_field_parsing() {
    std::cout << "\n--- Testing Field Parsing ---\n";

    double t = 0.0;
    check(geneactiv::parse_page_time("2024-03-10 23:59:57:250", t), "Page time", "valid time rejected");
    check(approx_equal(t, civil_to_seconds(2024, 3, 10, 23, 59, 57) + 0.25, 1e-6), "Page time",
          "wrong seconds " + std::to_string(t));
    check(!geneactiv::parse_page_time("2024-03-10 23:59:57", t), "Page time", "missing milliseconds accepted");
    check(!geneactiv::parse_page_time("2024-13-10 00:00:00:000", t), "Page time", "month 13 accepted");
    check(!geneactiv::parse_page_time("yesterday", t), "Page time", "garbage accepted");
    test_passed("Page time parsing");

    double v = 0.0;
    check(geneactiv::parse_number("100 Hz", v) && approx_equal(v, 100.0), "Number", "'100 Hz'");
    check(geneactiv::parse_number("-8", v) && approx_equal(v, -8.0), "Number", "'-8'");
    check(!geneactiv::parse_number("", v) && !geneactiv::parse_number("Hz", v), "Number",
          "non-numbers accepted");
    test_passed("Leading number parsing");

    geneactiv::RawSample raw;
    int accel[3] = {-128, 5, 256};
    std::string hex = geneactiv_sample_hex(accel, 1023);
    check(geneactiv::parse_raw_sample(hex.c_str(), raw), "Raw sample", "valid hex rejected");
    check(raw.accel == Eigen::Vector3d(-128.0, 5.0, 256.0), "Raw sample", "12-bit axes");
    check(approx_equal(raw.light, 1023.0) && !raw.button, "Raw sample", "light and button bits");
    check(!geneactiv::parse_raw_sample("F8000010019G", raw), "Raw sample", "non-hex accepted");
    test_passed("48-bit sample unpacking");
}

// ============================================================================
// Whole-file tests
// ============================================================================
void test_midnight_recording() {
    std::cout << "\n--- Testing Recording Across Midnight ---\n";

    std::string path = temp_path("midnight.bin");
    write_text(path, geneactiv_file(geneactiv_midnight_pages()));
    OutputRecord rec = decode(path);
    const auto& m = rec.metadata;

    check(m.format == DeviceFormat::GeneActiv, "Metadata", "wrong format");
    check(m.device_id == "034567" && m.model == "1.1", "Metadata", "serial / model");
    check(approx_equal(m.sample_rate, 100.0) && approx_equal(m.range_g, 8.0), "Metadata",
          "expected 100 Hz, 8 g");
    check(m.declared_blocks == 3 && m.declared_samples == 900, "Metadata", "declared pages");
    check(approx_equal(m.start_time, civil_to_seconds(2024, 3, 10, 23, 59, 57)), "Metadata", "start time");
    check(approx_equal(m.calibration.gain.x(), 25600.0) && approx_equal(m.calibration.lux, 800.0),
          "Metadata", "calibration data");
    test_passed("Header metadata");

    const auto& s = rec.samples;
    check(s.size() == 900 && s.aligned(), "Samples", "expected 900 aligned samples");
    check(approx_equal(s.time()[299], civil_to_seconds(2024, 3, 10, 23, 59, 59) + 0.99, 1e-6),
          "Samples", "last sample of page 0");
    check(approx_equal(s.time()[300], civil_to_seconds(2024, 3, 11, 0, 0, 0)), "Samples",
          "page 1 starts at midnight");
    auto accel = s.accel_matrix();
    check(approx_equal(accel(0, 0), -0.5) && approx_equal(accel(0, 1), 0.0)
          && approx_equal(accel(899, 2), 1.0), "Samples", "calibrated acceleration");
    check(approx_equal(s.light()[0], 200.0) && approx_equal(s.temperature()[0], 25.5)
          && approx_equal(s.battery()[0], 4.1), "Samples", "page-level channels");
    test_passed("Sample decoding and calibration");

    const auto& days = rec.windows.windows[0];
    check(days.size() == 2 && days[0] == WindowOccurrence{0, 300} && days[1] == WindowOccurrence{300, 900},
          "Windows", "expected [0,300) [300,900)");
    check(m.anomalies.bad_blocks == 0 && !m.anomalies.sample_rate_drift, "Anomalies", "clean file");
    test_passed("Day split at midnight");
    std::remove(path.c_str());
}

void test_sample_rate_drift() {
    std::cout << "\n--- Testing Page Frequency Drift ---\n";

    auto pages = geneactiv_midnight_pages();
    pages[1].frequency = "101.0";
    pages[0].temperature = "30.0";
    pages[1].temperature = "";
    std::string path = temp_path("drift.bin");
    write_text(path, geneactiv_file(pages));
    OutputRecord rec = decode(path);

    check(rec.metadata.anomalies.sample_rate_drift && rec.metadata.anomalies.drift_pages == 1,
          "Drift", "drift not recorded");
    check(rec.samples.size() == 900, "Drift", "drifting page must still be decoded");
    check(approx_equal(rec.samples.time()[301] - rec.samples.time()[300], 0.01, 1e-6), "Drift",
          "header rate should be used for spacing");
    check(approx_equal(rec.samples.temperature()[300], 30.0), "Drift",
          "missing temperature should repeat the previous page");
    test_passed("Frequency drift flagged, decoding continues");
    std::remove(path.c_str());
}

void test_fifth_page_drift() {
    std::cout << "\n--- Testing Drift on Page 5 ---\n";

    std::string clean_path = temp_path("clean6.bin");
    std::string drift_path = temp_path("drift6.bin");
    auto pages = geneactiv_pages(6);
    write_text(clean_path, geneactiv_file(pages, -1, pages[0].time));
    pages[4].frequency = "101.0";  // 1% above the header rate
    write_text(drift_path, geneactiv_file(pages, -1, pages[0].time));

    OutputRecord clean = decode(clean_path);
    OutputRecord drift = decode(drift_path);
    check(!clean.metadata.anomalies.sample_rate_drift, "Page 5 drift", "clean file flagged");
    check(drift.metadata.anomalies.sample_rate_drift && drift.metadata.anomalies.drift_pages == 1,
          "Page 5 drift", "drift warning missing");
    check(drift.samples.size() == clean.samples.size() && clean.samples.size() == 1800,
          "Page 5 drift", "sample count must not change");
    test_passed("Drifting page 5 keeps the sample count");

    std::remove(clean_path.c_str());
    std::remove(drift_path.c_str());
}

void test_fewer_pages_than_declared() {
    std::cout << "\n--- Testing Short File ---\n";

    std::string path = temp_path("short.bin");
    write_text(path, geneactiv_file(geneactiv_midnight_pages(), 5));
    OutputRecord rec = decode(path);

    check(rec.metadata.declared_blocks == 5 && rec.samples.size() == 900, "Short file",
          "expected the 3 pages present");
    test_passed("File ending before the declared page count");
    std::remove(path.c_str());
}

// ============================================================================
// Fatal errors
// ============================================================================
void test_fatal_errors() {
    std::cout << "\n--- Testing Fatal Errors ---\n";

    expect_error(ErrorCode::FileOpen, "Missing file", [] {
        GeneActivReader reader;
        reader.read_header(temp_path("does_not_exist.bin"));
    });

    std::string path = temp_path("fatal.bin");
    std::string good = geneactiv_file(geneactiv_midnight_pages());

    write_text(path, replace_first(good, "Number of Pages:3", "Pages:3"));
    expect_error(ErrorCode::BadHeader, "No page count", [&] { decode(path); });

    write_text(path, replace_first(good, "Number of Pages:3", "Number of Pages:1e30"));
    expect_error(ErrorCode::BadHeader, "Page count out of range", [&] { decode(path); });

    write_text(path, replace_first(good, "Number of Pages:3", "Number of Pages:1000000000000000"));
    expect_error(ErrorCode::Allocation, "Page count too large to allocate", [&] { decode(path); });

    write_text(path, replace_first(good, "x gain:25600", "x gain:0"));
    expect_error(ErrorCode::BadHeader, "Zero gain", [&] { decode(path); });

    write_text(path, replace_first(good, "Measurement Frequency:100 Hz", "Measurement Frequency:fast"));
    expect_error(ErrorCode::BadHeader, "Non-numeric frequency", [&] { decode(path); });

    auto pages = geneactiv_midnight_pages();
    pages[1].time = "2024-03-11 00:00";
    write_text(path, geneactiv_file(pages));
    expect_error(ErrorCode::BlockTimestamp, "Malformed page time", [&] { decode(path); });

    pages = geneactiv_midnight_pages();
    pages[2].data_chars = 3000;
    write_text(path, geneactiv_file(pages));
    expect_error(ErrorCode::TruncatedBlockData, "Short data line", [&] { decode(path); });

    write_text(path, replace_first(good, "F80000100190", "F8000010019G"));
    expect_error(ErrorCode::TruncatedBlockData, "Non-hex data", [&] { decode(path); });

    write_text(path, replace_first(good, "Recorded Data", "Recorded Dat"));
    expect_error(ErrorCode::TruncatedBlockData, "Lost page framing", [&] { decode(path); });

    GeneActivReader reader;
    pages = geneactiv_midnight_pages();
    pages[1].data_chars = 10;
    write_text(path, geneactiv_file(pages));
    reader.read_header(path);
    check(reader.read_block(), "Faulted state", "first page should decode");
    expect_error(ErrorCode::TruncatedBlockData, "Second page truncated", [&] { reader.read_block(); });
    check(reader.get_state() == ReaderState::Faulted, "Faulted state", "reader should be Faulted");
    check(reader.stream().size() == 300, "Faulted state", "pages before the fault stay decoded");
    test_passed("Fault keeps earlier pages");

    std::remove(path.c_str());
}

// ============================================================================
// Main test runner
// ============================================================================
int main() {
    std::cout << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║      GeneActiv Reader Unit Tests       ║\n";
    std::cout << "╚════════════════════════════════════════╝\n";

    try {
        test_field_parsing();
        test_midnight_recording();
        test_sample_rate_drift();
        test_fifth_page_drift();
        test_fewer_pages_than_declared();
        test_fatal_errors();

        std::cout << "\n✅ All tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
