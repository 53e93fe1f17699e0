// ============================================================================
// utils/config_parser.hpp - YAML-style configuration parser for accelio readers
// ============================================================================
#pragma once
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <map>
#include <vector>
#include "log.hpp"
#include "../io/read_error.hpp"
#include "../io/reader_common.hpp"

namespace accelio {

class ConfigParser {
public:
    // Returns false if the file cannot be opened. Malformed values throw
    // ReadError(InvalidWindowSpec / InvalidConfig).
    static bool load_config(const std::string& filename, ReaderConfig& config) {
        std::ifstream file(filename);
        if (!file) {
            return false;
        }
        
        std::map<std::string, std::string> params;
        std::string line;
        
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#') continue;
            
            // Parse key: value
            size_t colon_pos = line.find(':');
            if (colon_pos != std::string::npos) {
                std::string key = trim(line.substr(0, colon_pos));
                std::string value = trim(line.substr(colon_pos + 1));
                params[key] = value;
            }
        }
        
        // Windowing
        if (params.count("windows")) config.windows = parse_windows(params["windows"]);
        if (params.count("max_days")) config.max_days = parse_count("max_days", params["max_days"]);
        if (params.count("max_window_occurrences")) {
            config.max_window_occurrences =
                parse_count("max_window_occurrences", params["max_window_occurrences"]);
        }
        
        // Logging
        if (params.count("verbose")) {
            config.verbose = parse_bool("verbose", params["verbose"]);
            log::set_verbose(config.verbose);
        }
        
        return true;
    }
    
    static void save_config(const std::string& filename, const ReaderConfig& config) {
        std::ofstream file(filename);
        
        file << "# accelio reader configuration\n";
        file << "# Windowing (base_hour/period_hours, comma separated)\n";
        file << "windows: " << format_windows(config.windows) << "\n";
        file << "max_days: " << config.max_days << "\n";
        file << "max_window_occurrences: " << config.max_window_occurrences << "\n";
        file << "\n";
        
        file << "# Logging\n";
        file << "verbose: " << (config.verbose ? "true" : "false") << "\n";
    }
    
    // "0/24, 22/10" -> {{0, 24}, {22, 10}}
    static WindowSpec parse_windows(const std::string& value) {
        std::vector<WindowDef> defs;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (item.empty()) continue;
            size_t slash = item.find('/');
            if (slash == std::string::npos) {
                throw ReadError(ErrorCode::InvalidWindowSpec,
                                "window '" + item + "' is not base_hour/period_hours");
            }
            WindowDef def;
            def.base_hour = parse_hours("window base hour", item.substr(0, slash), 23);
            def.period_hours = parse_hours("window period", item.substr(slash + 1),
                                           size_t(std::numeric_limits<int>::max()));
            defs.push_back(def);
        }
        if (defs.empty()) {
            throw ReadError(ErrorCode::InvalidWindowSpec, "no window definitions in '" + value + "'");
        }
        return WindowSpec(std::move(defs));
    }
    
    static std::string format_windows(const WindowSpec& spec) {
        std::string out;
        for (const auto& def : spec) {
            if (!out.empty()) out += ", ";
            out += std::to_string(def.base_hour) + "/" + std::to_string(def.period_hours);
        }
        return out;
    }
    
private:
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }
    
    static size_t parse_count(const std::string& key, const std::string& value,
                              ErrorCode code = ErrorCode::InvalidConfig) {
        std::string v = trim(value);
        if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
            throw ReadError(code, key + " must be a non-negative integer, got '" + value + "'");
        }
        try {
            return size_t(std::stoull(v));
        } catch (const std::exception&) {
            throw ReadError(code, key + " out of range: '" + value + "'");
        }
    }
    
    // Range is checked before narrowing so "0/4294967320" cannot wrap to "0/24".
    static int parse_hours(const std::string& key, const std::string& value, size_t max_hours) {
        size_t hours = parse_count(key, value, ErrorCode::InvalidWindowSpec);
        if (hours > max_hours) {
            throw ReadError(ErrorCode::InvalidWindowSpec,
                            key + " " + trim(value) + " above " + std::to_string(max_hours));
        }
        return int(hours);
    }
    
    static bool parse_bool(const std::string& key, const std::string& value) {
        std::string v = trim(value);
        if (v == "true" || v == "1" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "no") return false;
        throw ReadError(ErrorCode::InvalidConfig, key + " must be true or false, got '" + value + "'");
    }
};

} // namespace accelio
