// ============================================================================
// io/reader_common.hpp - Reader configuration and lifecycle shared by formats
// ============================================================================
#pragma once
#include <string>
#include "read_error.hpp"
#include "../data/window_spec.hpp"

namespace accelio {

constexpr size_t DEFAULT_MAX_DAYS = 25;
constexpr size_t DEFAULT_MAX_WINDOW_OCCURRENCES = 256;

// Caller-supplied windowing settings. Sampling parameters always come from the
// file itself.
struct ReaderConfig {
    WindowSpec windows;
    size_t max_days = DEFAULT_MAX_DAYS;
    size_t max_window_occurrences = DEFAULT_MAX_WINDOW_OCCURRENCES;
    bool verbose = false;
};

enum class ReaderState { Unopened, HeaderRead, Streaming, Closed, Faulted };

inline const char* state_name(ReaderState s) {
    switch (s) {
        case ReaderState::Unopened: return "Unopened";
        case ReaderState::HeaderRead: return "HeaderRead";
        case ReaderState::Streaming: return "Streaming";
        case ReaderState::Closed: return "Closed";
        case ReaderState::Faulted: return "Faulted";
    }
    return "Unknown";
}

inline void require_state(ReaderState actual, ReaderState expected, const char* op) {
    if (actual != expected) {
        throw ReadError(ErrorCode::InvalidState, std::string(op) + " called in state "
                        + state_name(actual) + ", expected " + state_name(expected));
    }
}

inline void require_streamable(ReaderState actual, const char* op) {
    if (actual != ReaderState::HeaderRead && actual != ReaderState::Streaming) {
        throw ReadError(ErrorCode::InvalidState,
                        std::string(op) + " called in state " + state_name(actual));
    }
}

} // namespace accelio
