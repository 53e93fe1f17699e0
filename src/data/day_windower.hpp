// ============================================================================
// data/day_windower.hpp - Streaming day/window boundary indexing
// ============================================================================
#pragma once
#include <algorithm>
#include <cmath>
#include <vector>
#include "window_spec.hpp"
#include "../io/read_error.hpp"
#include "../utils/log.hpp"

namespace accelio {

// Sample-index range [start, stop) of one window occurrence.
struct WindowOccurrence {
    size_t start = 0;
    size_t stop = 0;
};

inline bool operator==(const WindowOccurrence& a, const WindowOccurrence& b) {
    return a.start == b.start && a.stop == b.stop;
}

struct WindowIndex {
    std::vector<std::vector<WindowOccurrence>> windows;  // one list per WindowDef
    bool truncated = false;  // capacity (max days / max occurrences) was hit

    size_t occurrence_count() const {
        size_t n = 0;
        for (const auto& w : windows) n += w.size();
        return n;
    }
};

// Walks timestamps block by block and records where every window occurrence
// starts and stops. Boundaries for a definition are base_hour + k * period_hours
// for integer k, so a period that divides 24 gives the same wall-clock window
// every day, and any other period rolls forward from base_hour. A boundary is
// assigned to the first sample no more than half a sample period before it.
//
// Not resumable: a new recording needs a new windower.
class DayWindower {
public:
    DayWindower(double sample_rate, const WindowSpec& spec,
                size_t max_days, size_t max_occurrences)
        : spec(spec), max_days(max_days), max_occurrences(max_occurrences) {
        if (!std::isfinite(sample_rate) || sample_rate <= 0.0) {
            throw ReadError(ErrorCode::InvalidWindowSpec,
                            "sample rate must be positive, got " + std::to_string(sample_rate));
        }
        tolerance = 0.5 / sample_rate;

        tracks.resize(spec.size());
        for (size_t w = 0; w < spec.size(); ++w) {
            tracks[w].period_s = double(spec[w].period_hours) * SECHOUR;
            size_t per_day = (24 + spec[w].period_hours - 1) / spec[w].period_hours;
            size_t expected = max_days < max_occurrences / per_day ? max_days * per_day + 1
                                                                   : max_occurrences;
            tracks[w].occurrences.reserve(std::min({expected, max_occurrences, size_t(4096)}));
        }
    }

    // Feed the timestamps of the next n samples, in recording order.
    // Boundaries are crossed in time order across all definitions, so the
    // shared occurrence cap is spent the same way however the samples are split
    // into pushes. Equal boundaries go to the earlier definition first.
    void push(const double* ts, size_t n) {
        if (finalized) {
            throw ReadError(ErrorCode::InvalidState, "windower already finalized");
        }
        if (n == 0) return;

        if (n_seen == 0) start(ts[0]);

        size_t i = 0;
        for (;;) {
            Track* track = next_track();
            if (track == nullptr) break;

            double target = track->next_boundary - tolerance;
            if (ts[n - 1] < target) break;

            const double* hit = std::find_if(ts + i, ts + n,
                                             [target](double t) { return t >= target; });
            i = size_t(hit - ts);
            size_t index = n_seen + i;

            track->occurrences.back().stop = index;
            track->open = false;
            open(*track, index, track->next_boundary);
            track->next_boundary += track->period_s;
        }
        n_seen += n;
    }

    void push(const std::vector<double>& ts) { push(ts.data(), ts.size()); }

    // Close every open occurrence at the total sample count.
    WindowIndex finalize() {
        if (finalized) {
            throw ReadError(ErrorCode::InvalidState, "windower already finalized");
        }
        finalized = true;

        WindowIndex index;
        index.truncated = hit_capacity;
        index.windows.reserve(tracks.size());
        for (auto& track : tracks) {
            if (track.open) {
                track.occurrences.back().stop = n_seen;
                track.open = false;
            }
            index.windows.push_back(std::move(track.occurrences));
        }
        if (hit_capacity) {
            ACCELIO_LOG_WARN("window index truncated at " << n_occurrences
                             << " occurrences (max days " << max_days
                             << ", max occurrences " << max_occurrences << ")");
        }
        return index;
    }

    size_t samples_seen() const { return n_seen; }
    bool truncated() const { return hit_capacity; }

private:
    struct Track {
        double period_s = 0.0;
        double next_boundary = 0.0;
        bool open = false;
        std::vector<WindowOccurrence> occurrences;
    };

    void start(double t0) {
        double first_day = std::floor(t0 / SECDAY) * SECDAY;
        day_limit = first_day + double(max_days) * SECDAY;

        for (size_t w = 0; w < tracks.size(); ++w) {
            auto& track = tracks[w];
            // latest boundary at or before the first sample
            double phase = first_day + double(spec[w].base_hour) * SECHOUR;
            double k = std::floor((t0 + tolerance - phase) / track.period_s);
            double anchor = phase + k * track.period_s;

            if (max_days == 0) {
                hit_capacity = true;
                continue;
            }
            open(track, 0, anchor, true);
            track.next_boundary = anchor + track.period_s;
        }
    }

    // Open track with the earliest pending boundary, or nullptr.
    Track* next_track() {
        Track* best = nullptr;
        for (auto& track : tracks) {
            if (track.open && (best == nullptr || track.next_boundary < best->next_boundary)) {
                best = &track;
            }
        }
        return best;
    }

    void open(Track& track, size_t index, double boundary, bool first = false) {
        if (n_occurrences >= max_occurrences || (!first && boundary >= day_limit)) {
            hit_capacity = true;
            return;
        }
        track.occurrences.push_back(WindowOccurrence{index, index});
        track.open = true;
        ++n_occurrences;
    }

    WindowSpec spec;
    size_t max_days;
    size_t max_occurrences;
    double tolerance = 0.0;
    double day_limit = 0.0;
    size_t n_seen = 0;
    size_t n_occurrences = 0;
    bool hit_capacity = false;
    bool finalized = false;
    std::vector<Track> tracks;
};

// One-shot indexing of a complete timestamp array.
inline WindowIndex compute_windows(double sample_rate, const std::vector<double>& timestamps,
                                   size_t max_days, const WindowSpec& spec,
                                   size_t max_occurrences) {
    DayWindower windower(sample_rate, spec, max_days, max_occurrences);
    windower.push(timestamps);
    return windower.finalize();
}

} // namespace accelio
