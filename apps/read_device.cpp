// ============================================================================
// apps/read_device.cpp - Decode one device file and print its day windows
// ============================================================================
#include <cctype>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <string>
#include <filesystem>
#include <ctime>

#include "../src/accelio.hpp"

using namespace accelio;

namespace fs = std::filesystem;

static bool format_from_extension(const std::string& path, DeviceFormat& format) {
    std::string ext = fs::path(path).extension().string();
    for (auto& c : ext) c = char(std::tolower(static_cast<unsigned char>(c)));
    if (ext == ".cwa") { format = DeviceFormat::Axivity; return true; }
    if (ext == ".bin") { format = DeviceFormat::GeneActiv; return true; }
    if (ext == ".gt3x") { format = DeviceFormat::ActiGraph; return true; }
    return false;
}

static std::string format_time(double t) {
    if (std::isnan(t)) return "-";
    std::time_t secs = std::time_t(std::floor(t));
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <file.cwa|file.bin|file.gt3x> [options]\n"
              << "  --config <path>      reader configuration (key: value)\n"
              << "  --windows <list>     window definitions, e.g. \"0/24, 22/10\"\n"
              << "  --max-days <n>       recording length cap in days\n"
              << "  --verbose            log header and block details\n";
}

static void print_record(const OutputRecord& rec, const ReaderConfig& config) {
    const auto& m = rec.metadata;
    std::cout << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║  " << std::setw(36) << std::left << (std::string(format_name(m.format)) + " recording")
              << "  ║\n";
    std::cout << "╚════════════════════════════════════════╝\n\n";

    std::cout << "Device:\n";
    std::cout << "  ID: " << m.device_id << "\n";
    if (m.session_id) std::cout << "  Session: " << m.session_id << "\n";
    if (!m.model.empty()) std::cout << "  Model: " << m.model << "\n";
    if (!m.firmware.empty()) std::cout << "  Firmware: " << m.firmware << "\n";
    std::cout << "  Sample rate: " << m.sample_rate << " Hz\n";
    std::cout << "  Axes: " << m.n_axes << "\n";
    if (m.format == DeviceFormat::ActiGraph) {
        std::cout << "  Layout: " << (m.legacy_layout ? "legacy activity.bin" : "log.bin") << "\n";
    }
    std::cout << "  Start: " << format_time(m.start_time) << "\n";

    std::cout << "\nDecoded:\n";
    std::cout << "  Blocks declared: " << m.declared_blocks << "\n";
    std::cout << "  Samples: " << rec.samples.size() << "\n";
    if (!rec.samples.empty()) {
        std::cout << "  First sample: " << format_time(rec.samples.time().front()) << "\n";
        std::cout << "  Last sample: " << format_time(rec.samples.time().back()) << "\n";
    }
    std::cout << "  Bad blocks: " << m.anomalies.bad_blocks
              << " (checksum " << m.anomalies.bad_checksums
              << ", packing " << m.anomalies.bad_packing
              << ", axes " << m.anomalies.bad_axes
              << ", sample count " << m.anomalies.bad_sample_counts << ")\n";
    std::cout << "  Sample rate drift: " << (m.anomalies.sample_rate_drift ? "yes" : "no");
    if (m.anomalies.sample_rate_drift) std::cout << " (" << m.anomalies.drift_pages << " pages)";
    std::cout << "\n";

    std::cout << "\nWindows:\n";
    for (size_t w = 0; w < rec.windows.windows.size(); ++w) {
        const auto& def = config.windows[w];
        std::cout << "  [" << def.base_hour << "h + " << def.period_hours << "h]\n";
        for (size_t k = 0; k < rec.windows.windows[w].size(); ++k) {
            const auto& occ = rec.windows.windows[w][k];
            std::cout << "    " << std::setw(3) << k << ": samples [" << occ.start << ", " << occ.stop << ")";
            if (occ.stop > occ.start) {
                std::cout << "  " << format_time(rec.samples.time()[occ.start]) << " .. "
                          << format_time(rec.samples.time()[occ.stop - 1]);
            }
            std::cout << "\n";
        }
    }
    if (rec.windows.truncated) {
        std::cout << "  Warning: window index truncated (max days " << config.max_days
                  << ", max occurrences " << config.max_window_occurrences << ")\n";
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string path = argv[1];
    ReaderConfig config;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                std::string cfg_file = argv[++i];
                if (!ConfigParser::load_config(cfg_file, config)) {
                    std::cerr << "Error: Cannot open config file: " << cfg_file << "\n";
                    return 1;
                }
            } else if (arg == "--windows" && i + 1 < argc) {
                config.windows = ConfigParser::parse_windows(argv[++i]);
            } else if (arg == "--max-days" && i + 1 < argc) {
                config.max_days = std::stoul(argv[++i]);
            } else if (arg == "--verbose") {
                config.verbose = true;
                log::set_verbose(true);
            } else {
                print_usage(argv[0]);
                return 1;
            }
        }

        DeviceFormat format;
        if (!format_from_extension(path, format)) {
            std::cerr << "Error: Unknown file extension for " << path << "\n";
            return 1;
        }

        OutputRecord rec = decode_file(format, path, config);
        print_record(rec, config);
    } catch (const ReadError& e) {
        std::cerr << "\n❌ Decode failed: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
