// ============================================================================
// apps/day_partitioner.cpp - Write each window occurrence of a recording to CSV
// ============================================================================
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <iomanip>

#include "../src/accelio.hpp"

using namespace accelio;

namespace fs = std::filesystem;

class DayPartitioner {
private:
    std::string input_file;
    DeviceFormat format;
    std::string output_dir;
    ReaderConfig config;
    OutputRecord record;
    
    std::string get_base_filename() const {
        fs::path p(input_file);
        return p.stem().string();
    }
    
    std::string get_output_filename(size_t window_idx, size_t occurrence_idx) const {
        const auto& def = config.windows[window_idx];
        std::ostringstream oss;
        oss << get_base_filename()
            << "_w" << std::setfill('0') << std::setw(2) << def.base_hour
            << "-" << std::setw(2) << def.period_hours
            << "_day_" << std::setw(3) << occurrence_idx + 1
            << ".csv";
        
        fs::path output_path = fs::path(output_dir) / oss.str();
        return output_path.string();
    }
    
public:
    DayPartitioner(const std::string& file, DeviceFormat fmt, const std::string& out_dir,
                   const ReaderConfig& cfg)
        : input_file(file), format(fmt), output_dir(out_dir), config(cfg) {
        
        if (!fs::exists(output_dir)) {
            std::cout << "Creating output directory: " << output_dir << std::endl;
            if (!fs::create_directories(output_dir)) {
                throw std::runtime_error("Failed to create output directory: " + output_dir);
            }
        } else if (!fs::is_directory(output_dir)) {
            throw std::runtime_error("Output path exists but is not a directory: " + output_dir);
        }
    }
    
    void decode() {
        record = decode_file(format, input_file, config);
        std::cout << "Decoded " << record.samples.size() << " samples from " << input_file
                  << " (" << record.metadata.anomalies.bad_blocks << " bad blocks)" << std::endl;
        if (record.windows.truncated) {
            std::cout << "Warning: window index was truncated, later days are not written" << std::endl;
        }
    }
    
    void partition() {
        const auto& s = record.samples;
        const auto& layout = s.layout();
        auto accel = s.accel_matrix();
        size_t files = 0;
        
        for (size_t w = 0; w < record.windows.windows.size(); ++w) {
            const auto& occurrences = record.windows.windows[w];
            for (size_t k = 0; k < occurrences.size(); ++k) {
                const auto& occ = occurrences[k];
                if (occ.stop <= occ.start) continue;
                
                std::string output_filename = get_output_filename(w, k);
                std::ofstream out(output_filename);
                if (!out.is_open()) {
                    throw std::runtime_error("Failed to create output file: " + output_filename);
                }
                
                out << "time,accel_x,accel_y,accel_z";
                if (layout.temperature) out << ",temperature";
                if (layout.light) out << ",light";
                if (layout.battery) out << ",battery";
                out << "\n";
                
                out << std::fixed;
                for (size_t i = occ.start; i < occ.stop; ++i) {
                    out << std::setprecision(3) << s.time()[i]
                        << std::setprecision(5)
                        << "," << accel(Eigen::Index(i), 0)
                        << "," << accel(Eigen::Index(i), 1)
                        << "," << accel(Eigen::Index(i), 2);
                    if (layout.temperature) out << "," << s.temperature()[i];
                    if (layout.light) out << "," << s.light()[i];
                    if (layout.battery) out << "," << s.battery()[i];
                    out << "\n";
                }
                
                std::cout << "Created " << output_filename << " with "
                          << (occ.stop - occ.start) << " samples" << std::endl;
                ++files;
            }
        }
        
        std::cout << "\nPartitioning complete: " << files << " files written to "
                  << output_dir << std::endl;
    }
};

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <file.cwa|file.bin|file.gt3x> <output_dir> [config]\n";
        return 1;
    }
    
    std::string input = argv[1];
    std::string output_dir = argv[2];
    ReaderConfig config;
    
    try {
        if (argc > 3 && !ConfigParser::load_config(argv[3], config)) {
            std::cerr << "Error: Cannot open config file: " << argv[3] << "\n";
            return 1;
        }
        
        std::string ext = fs::path(input).extension().string();
        DeviceFormat format;
        if (ext == ".cwa" || ext == ".CWA") {
            format = DeviceFormat::Axivity;
        } else if (ext == ".bin" || ext == ".BIN") {
            format = DeviceFormat::GeneActiv;
        } else if (ext == ".gt3x" || ext == ".GT3X") {
            format = DeviceFormat::ActiGraph;
        } else {
            std::cerr << "Error: Unknown file extension for " << input << "\n";
            return 1;
        }
        
        DayPartitioner partitioner(input, format, output_dir, config);
        partitioner.decode();
        partitioner.partition();
    } catch (const ReadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
