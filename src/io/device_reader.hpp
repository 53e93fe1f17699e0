// ============================================================================
// io/device_reader.hpp - One decode interface over the three device formats
// ============================================================================
#pragma once
#include <string>
#include <type_traits>
#include <variant>
#include "actigraph_reader.hpp"
#include "axivity_reader.hpp"
#include "device_metadata.hpp"
#include "geneactiv_reader.hpp"
#include "reader_common.hpp"
#include "../utils/log.hpp"

namespace accelio {

using DeviceReader = std::variant<AxivityReader, GeneActivReader, ActiGraphReader>;

inline DeviceReader make_reader(DeviceFormat format, const ReaderConfig& config) {
    switch (format) {
        case DeviceFormat::Axivity: return DeviceReader(std::in_place_type<AxivityReader>, config);
        case DeviceFormat::GeneActiv: return DeviceReader(std::in_place_type<GeneActivReader>, config);
        case DeviceFormat::ActiGraph: return DeviceReader(std::in_place_type<ActiGraphReader>, config);
    }
    throw ReadError(ErrorCode::InvalidState, "unknown device format");
}

inline void read_header(DeviceReader& reader, const std::string& path) {
    std::visit([&](auto& r) { r.read_header(path); }, reader);
}

inline bool read_block(DeviceReader& reader) {
    return std::visit([](auto& r) { return r.read_block(); }, reader);
}

inline void close(DeviceReader& reader) {
    std::visit([](auto& r) { r.close(); }, reader);
}

inline const DeviceMetadata& metadata(const DeviceReader& reader) {
    return std::visit([](const auto& r) -> const DeviceMetadata& { return r.metadata(); }, reader);
}

inline ReaderState state(const DeviceReader& reader) {
    return std::visit([](const auto& r) { return r.get_state(); }, reader);
}

// Header, every block, close. Fatal errors propagate as ReadError with the
// reader left Faulted, so metadata(reader) still holds what the header gave.
inline OutputRecord decode_file(DeviceReader& reader, const std::string& path) {
    read_header(reader, path);
    long n_blocks = 0;
    while (read_block(reader)) ++n_blocks;
    close(reader);

    OutputRecord out = std::visit([](auto& r) { return r.release(); }, reader);
    ACCELIO_LOG_INFO(format_name(out.metadata.format) << " " << path << ": " << n_blocks
                     << " blocks, " << out.samples.size() << " samples, "
                     << out.windows.occurrence_count() << " window occurrences"
                     << (out.windows.truncated ? " (truncated)" : ""));
    return out;
}

inline OutputRecord decode_file(DeviceFormat format, const std::string& path,
                                const ReaderConfig& config) {
    DeviceReader reader = make_reader(format, config);
    try {
        return decode_file(reader, path);
    } catch (const ReadError&) {
        close(reader);
        throw;
    }
}

} // namespace accelio
