// ============================================================================
// io/read_error.hpp - Error kinds raised by the device readers
// ============================================================================
#pragma once
#include <stdexcept>
#include <string>

namespace accelio {

enum class ErrorCode {
    None = 0,
    FileOpen,               // device file could not be opened
    Io,                     // read failed mid-stream (handle closed, device error)
    BadHeader,              // signature or declared header field invalid
    MismatchAxisCount,      // axis count not supported by the hardware type
    InvalidBlockSamples,    // block sample count does not fit the payload
    BadAxesPacked,          // block axis count differs from the header
    BadPackingCode,         // unknown bit packing for the block
    BadChecksum,            // block checksum failed
    BlockTimestamp,         // page time line is malformed
    SampleRateMismatch,     // page frequency differs from the header
    TruncatedBlockData,     // page data shorter than 300 samples
    ArchiveOpen,            // .gt3x archive could not be opened
    InfoStat,               // info.txt missing from the archive
    InfoOpen,               // info.txt could not be read
    LogOpen,                // log.bin could not be opened
    MultipleActivityTypes,  // log holds more than one activity record type
    OldActivityOpen,        // legacy activity.bin could not be opened
    OldLuxOpen,             // legacy lux.bin could not be opened
    Allocation,             // sample buffers could not grow
    InvalidWindowSpec,      // window definition or capacity out of range
    InvalidConfig,          // configuration value malformed
    InvalidState            // operation called in the wrong reader state
};

inline const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::FileOpen: return "FileOpen";
        case ErrorCode::Io: return "Io";
        case ErrorCode::BadHeader: return "BadHeader";
        case ErrorCode::MismatchAxisCount: return "MismatchAxisCount";
        case ErrorCode::InvalidBlockSamples: return "InvalidBlockSamples";
        case ErrorCode::BadAxesPacked: return "BadAxesPacked";
        case ErrorCode::BadPackingCode: return "BadPackingCode";
        case ErrorCode::BadChecksum: return "BadChecksum";
        case ErrorCode::BlockTimestamp: return "BlockTimestamp";
        case ErrorCode::SampleRateMismatch: return "SampleRateMismatch";
        case ErrorCode::TruncatedBlockData: return "TruncatedBlockData";
        case ErrorCode::ArchiveOpen: return "ArchiveOpen";
        case ErrorCode::InfoStat: return "InfoStat";
        case ErrorCode::InfoOpen: return "InfoOpen";
        case ErrorCode::LogOpen: return "LogOpen";
        case ErrorCode::MultipleActivityTypes: return "MultipleActivityTypes";
        case ErrorCode::OldActivityOpen: return "OldActivityOpen";
        case ErrorCode::OldLuxOpen: return "OldLuxOpen";
        case ErrorCode::Allocation: return "Allocation";
        case ErrorCode::InvalidWindowSpec: return "InvalidWindowSpec";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

// Fatal reader error. Recoverable per-block problems are counted in
// DecodeAnomalies instead of being thrown.
class ReadError : public std::runtime_error {
public:
    ReadError(ErrorCode code, const std::string& what)
        : std::runtime_error(std::string(error_name(code)) + ": " + what), error_code(code) {}

    ErrorCode code() const { return error_code; }

private:
    ErrorCode error_code;
};

} // namespace accelio
