// =================================================================
// src/Distill/MetricsReporter.cpp
// =================================================================
// Implementation for run statistics reporting.

#include "Distill/MetricsReporter.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>
#include <sys/resource.h>

namespace Distill {

std::string MetricsReporter::summarize(const RunSummary& summary) {
    std::ostringstream report;

    report << "\n=== Ingestion Summary ===\n";
    if (!summary.root.empty()) {
        report << "Root: " << summary.root << "\n";
    }
    report << "Model: " << summary.model << " (ceiling " << summary.context_ceiling << " tokens)\n";
    report << "Files discovered: " << summary.discovered << "\n";
    report << "  Processed: " << summary.processed << "\n";
    report << "  Skipped (binary): " << summary.skipped_binary << "\n";
    report << "  Failed: " << summary.failed << "\n";
    if (summary.truncated > 0) {
        report << "  Truncated: " << summary.truncated << "\n";
    }
    if (summary.overflowed > 0) {
        report << "  Over ceiling: " << summary.overflowed << "\n";
    }
    if (summary.omitted > 0) {
        report << "  Omitted: " << summary.omitted << "\n";
    }

    report << "Total tokens: " << summary.total_tokens;
    if (summary.context_ceiling > 0) {
        double usage = 100.0 * static_cast<double>(summary.total_tokens) / summary.context_ceiling;
        report << " (" << std::fixed << std::setprecision(1) << usage << "% of ceiling)";
    }
    report << "\n";
    report << "Total size: " << formatSize(summary.total_bytes) << "\n";
    report << "Duration: " << formatDuration(summary.duration_ms) << "\n";
    report << "Peak memory: " << formatSize(summary.peak_memory_kb * 1024) << "\n";

    if (!summary.languages.empty()) {
        std::vector<std::pair<std::string, size_t>> languages(summary.languages.begin(), summary.languages.end());
        std::sort(languages.begin(), languages.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) {
                return a.second > b.second;
            }
            return a.first < b.first;
        });

        size_t width = 0;
        for (const auto& entry : languages) {
            width = std::max(width, entry.first.size());
        }

        report << "\nLanguages:\n";
        for (const auto& entry : languages) {
            report << "  " << std::left << std::setw(static_cast<int>(width)) << entry.first
                   << "  " << std::right << std::setw(6) << entry.second << "\n";
        }
    }

    if (summary.cancelled) {
        report << "\nRun was cancelled; results are partial.\n";
    }

    return report.str();
}

std::string MetricsReporter::formatSize(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit_index = 0;
    double display_size = static_cast<double>(bytes);

    while (display_size >= 1024 && unit_index < 3) {
        display_size /= 1024;
        unit_index++;
    }

    std::ostringstream result;
    if (unit_index == 0) {
        result << bytes << " B";
    } else {
        result << std::fixed << std::setprecision(1) << display_size << " " << units[unit_index];
    }
    return result.str();
}

std::string MetricsReporter::formatDuration(long duration_ms) {
    std::ostringstream result;
    if (duration_ms < 1000) {
        result << duration_ms << " ms";
    } else {
        result << std::fixed << std::setprecision(2) << (duration_ms / 1000.0) << " s";
    }
    return result.str();
}

std::string MetricsReporter::formatProgress(const RunProgress& progress, size_t width) {
    std::ostringstream line;
    if (!progress.discovery_done) {
        line << "Processing: " << progress.completed << " done, " << progress.dispatched
             << " found so far, " << progress.tokens << " tokens";
        return line.str();
    }

    double fraction = progress.dispatched == 0
        ? 1.0
        : static_cast<double>(progress.completed) / progress.dispatched;
    size_t filled = static_cast<size_t>(fraction * width);

    line << "[";
    for (size_t i = 0; i < width; i++) {
        if (i < filled) {
            line << "=";
        } else if (i == filled) {
            line << ">";
        } else {
            line << " ";
        }
    }
    line << "] " << progress.completed << "/" << progress.dispatched << " files ("
         << std::fixed << std::setprecision(1) << (fraction * 100) << "%), " << progress.tokens << " tokens";
    return line.str();
}

size_t MetricsReporter::peakMemoryKb() {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0;
    }
    // Linux reports kilobytes
    return static_cast<size_t>(usage.ru_maxrss);
}

} // namespace Distill
