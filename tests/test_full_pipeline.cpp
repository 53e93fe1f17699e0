// ============================================================================
// test_full_pipeline.cpp - Decode every device format through one interface
// ============================================================================
#include <iostream>
#include <iomanip>
#include <cmath>
#include "test_common.hpp"
#include "test_files.hpp"
#include "../src/accelio.hpp"

using namespace accelio;
using namespace testfiles;

void print_separator(const std::string& title) {
    std::cout << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║  " << std::setw(36) << std::left << title << "  ║\n";
    std::cout << "╚════════════════════════════════════════╝\n\n";
}

// Every window list must tile [0, n) and start each later occurrence on
// the definition's wall-clock grid.
void check_windows(const std::string& name, const OutputRecord& rec, const ReaderConfig& config) {
    const auto& ts = rec.samples.time();
    check(rec.windows.windows.size() == config.windows.size(), name, "one list per window definition");
    double tol = 0.5 / rec.metadata.sample_rate;
    double first_day = std::floor(ts.front() / 86400.0) * 86400.0;

    for (size_t w = 0; w < config.windows.size(); ++w) {
        const auto& list = rec.windows.windows[w];
        const auto& def = config.windows[w];
        check(!list.empty(), name, "window " + std::to_string(w) + " has no occurrences");
        check(list.front().start == 0 && list.back().stop == ts.size(), name,
              "window " + std::to_string(w) + " does not cover every sample");
        for (size_t k = 1; k < list.size(); ++k) {
            check(list[k].start == list[k - 1].stop, name, "gap in window " + std::to_string(w));
            double since_base = ts[list[k].start] - first_day - def.base_hour * 3600.0;
            double offset = std::fmod(since_base, def.period_hours * 3600.0);
            if (offset < 0) offset += def.period_hours * 3600.0;
            double prev_gap = ts[list[k].start] - ts[list[k].start - 1];
            check(offset < tol + prev_gap || def.period_hours * 3600.0 - offset <= tol, name,
                  "occurrence " + std::to_string(k) + " of window " + std::to_string(w)
                  + " starts off the boundary grid");
        }
    }
}

void run_format(const std::string& name, DeviceFormat format, const std::string& path,
                const ReaderConfig& config, size_t expected_samples) {
    OutputRecord rec = decode_file(format, path, config);
    check(rec.metadata.format == format, name, "wrong format in metadata");
    check(rec.samples.size() == expected_samples, name,
          "expected " + std::to_string(expected_samples) + " samples, got "
          + std::to_string(rec.samples.size()));
    check(rec.samples.aligned(), name, "channels not aligned");
    check_windows(name, rec, config);

    std::cout << "  " << std::setw(10) << std::left << format_name(format)
              << rec.samples.size() << " samples, "
              << rec.windows.occurrence_count() << " window occurrences\n";
    test_passed(name + " through decode_file");
}

void check_repeat_decode(const std::string& name, DeviceFormat format, const std::string& path,
                         const ReaderConfig& config) {
    OutputRecord first = decode_file(format, path, config);
    OutputRecord second = decode_file(format, path, config);
    const auto& a = first.samples;
    const auto& b = second.samples;
    check(a.time() == b.time() && a.accel() == b.accel() && a.gyro() == b.gyro()
          && a.temperature() == b.temperature() && a.light() == b.light()
          && a.battery() == b.battery(), name + " idempotence", "channels differ");
    check(first.windows.windows.size() == second.windows.windows.size()
          && first.windows.truncated == second.windows.truncated, name + " idempotence", "window lists differ");
    for (size_t w = 0; w < first.windows.windows.size(); ++w) {
        check(first.windows.windows[w] == second.windows.windows[w], name + " idempotence", "windows differ");
    }
    const auto& x = first.metadata.anomalies;
    const auto& y = second.metadata.anomalies;
    check(x.bad_blocks == y.bad_blocks && x.bad_checksums == y.bad_checksums
          && x.drift_pages == y.drift_pages, name + " idempotence", "anomalies differ");
    test_passed(name + " repeated decode is identical");
}

int main() {
    print_separator("accelio Full Pipeline Test");

    try {
        // ============================================================
        // Phase 1: Configuration
        // ============================================================
        std::cout << "Phase 1: Reader Configuration\n";
        std::cout << "=============================\n";

        std::string cfg_path = temp_path("pipeline.yaml");
        write_text(cfg_path, "windows: 0/24, 22/10, 23/1\nmax_days: 10\nmax_window_occurrences: 64\n");
        ReaderConfig config;
        check(ConfigParser::load_config(cfg_path, config), "Config", "config not loaded");
        std::cout << "  Windows: " << ConfigParser::format_windows(config.windows) << "\n";
        test_passed("Config loaded");

        // ============================================================
        // Phase 2: Build recordings
        // ============================================================
        std::cout << "\nPhase 2: Synthetic Recordings\n";
        std::cout << "=============================\n";

        std::string cwa = temp_path("pipeline.cwa");
        write_bytes(cwa, cwa_file(cwa_header(CWA_HW_AX3, 0x00), cwa_midnight_blocks()));
        std::string bin = temp_path("pipeline.bin");
        write_text(bin, geneactiv_file(geneactiv_midnight_pages()));
        std::string gt3x = temp_path("pipeline.gt3x");
        std::string info = gt3x_info(30, gt3x_midnight_start(), true);
        std::string log = gt3x_midnight_log();
        write_zip(gt3x, {{"info.txt", info}, {"log.bin", log}});
        test_passed("Recordings written");

        // ============================================================
        // Phase 3: Decode through the common interface
        // ============================================================
        std::cout << "\nPhase 3: Decoding\n";
        std::cout << "=================\n";

        run_format("Axivity", DeviceFormat::Axivity, cwa, config, 360);
        run_format("GeneActiv", DeviceFormat::GeneActiv, bin, config, 900);
        run_format("ActiGraph", DeviceFormat::ActiGraph, gt3x, config, 120);

        // Decoding the same file twice gives the same record
        check_repeat_decode("Axivity", DeviceFormat::Axivity, cwa, config);
        check_repeat_decode("GeneActiv", DeviceFormat::GeneActiv, bin, config);
        check_repeat_decode("ActiGraph", DeviceFormat::ActiGraph, gt3x, config);

        // ============================================================
        // Phase 4: Step-wise use of a variant reader
        // ============================================================
        std::cout << "\nPhase 4: Variant Reader\n";
        std::cout << "=======================\n";

        DeviceReader reader = make_reader(DeviceFormat::GeneActiv, config);
        check(std::holds_alternative<GeneActivReader>(reader), "Variant", "wrong alternative");
        check(state(reader) == ReaderState::Unopened, "Variant", "starts Unopened");
        read_header(reader, bin);
        check(metadata(reader).declared_blocks == 3, "Variant", "header metadata visible");
        check(read_block(reader) && state(reader) == ReaderState::Streaming, "Variant", "first page");
        close(reader);
        check(state(reader) == ReaderState::Closed, "Variant", "Closed after close");
        test_passed("Step-wise decode through the variant");

        // Fatal errors leave header metadata readable
        auto pages = geneactiv_midnight_pages();
        pages[1].data_chars = 100;
        write_text(bin, geneactiv_file(pages));
        DeviceReader faulty = make_reader(DeviceFormat::GeneActiv, config);
        expect_error(ErrorCode::TruncatedBlockData, "Fatal page error", [&] { decode_file(faulty, bin); });
        check(state(faulty) == ReaderState::Faulted, "Variant", "reader should be Faulted");
        check(approx_equal(metadata(faulty).sample_rate, 100.0), "Variant", "metadata after fault");
        test_passed("Header metadata survives a fatal error");

        // Capacity limits flow from the config into every reader
        ReaderConfig tight = config;
        tight.max_window_occurrences = 3;
        OutputRecord capped = decode_file(DeviceFormat::Axivity, cwa, tight);
        check(capped.windows.truncated && capped.windows.occurrence_count() == 3, "Capacity",
              "expected 3 occurrences and the truncated flag");
        test_passed("Occurrence cap applied");

        expect_error(ErrorCode::FileOpen, "Missing file through decode_file",
                     [&] { decode_file(DeviceFormat::Axivity, temp_path("nope.cwa"), config); });

        std::remove(cfg_path.c_str());
        std::remove(cwa.c_str());
        std::remove(bin.c_str());
        std::remove(gt3x.c_str());

        std::cout << "\n✅ All tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
