// =================================================================
// include/Distill/MetricsReporter.hpp
// =================================================================
// Human-readable run statistics printed after an ingest.

#pragma once

#include "Distill/Types.hpp"
#include <string>

namespace Distill {

class MetricsReporter {
public:
    /**
     * @brief Multi-line report of a finished run
     *
     * Counts, tokens, sizes, duration, peak memory and a language table
     * sorted by file count (ties by name).
     */
    static std::string summarize(const RunSummary& summary);

    /**
     * @brief Format a byte count as B, KB, MB or GB with one decimal
     */
    static std::string formatSize(size_t bytes);

    static std::string formatDuration(long duration_ms);

    /**
     * @brief One-line progress report
     *
     * While the walk is still running the total is unknown, so only counts
     * are shown; afterwards a bar of `width` cells and a percentage.
     */
    static std::string formatProgress(const RunProgress& progress, size_t width = 30);

    /**
     * @brief Peak resident set size of this process in kilobytes
     */
    static size_t peakMemoryKb();
};

} // namespace Distill
