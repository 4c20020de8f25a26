// =================================================================
// include/Distill/ProcessingOrchestrator.hpp
// =================================================================
// Header for the concurrent ingestion run: walker, worker pool and aggregation.

#pragma once

#include "Distill/ContentSanitizer.hpp"
#include "Distill/DirectoryWalker.hpp"
#include "Distill/EncodingDetector.hpp"
#include "Distill/IgnorePattern.hpp"
#include "Distill/IngestConfig.hpp"
#include "Distill/LanguageClassifier.hpp"
#include "Distill/TokenAccountant.hpp"
#include "Distill/Types.hpp"
#include "Distill/WorkQueue.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace Distill {

class FileProcessor;
struct FileProcessResult;

/**
 * @brief The only shared mutable state of a run
 *
 * Workers append their outcomes here; one mutex guards the collections
 * and the running token total.
 */
class ResultSink {
public:
    /**
     * @brief Record one worker outcome
     * @return Running token total after the outcome was added
     */
    size_t add(FileProcessResult outcome);

    size_t getRunningTotal() const;

    /**
     * @brief Move the collected results out; the sink is empty afterwards
     */
    RunResult takeResult();

private:
    mutable std::mutex m_mutex;
    RunResult m_result;
    size_t m_running_total = 0;
};

/**
 * @brief Runs the whole pipeline over one project tree
 *
 * The calling thread walks the tree and feeds a bounded queue; a pool of
 * worker threads takes candidates off the queue and processes them
 * independently. Results are sorted by relative path before the context
 * ceiling is applied, so the outcome does not depend on scheduling.
 */
class ProcessingOrchestrator {
public:
    using ProgressCallback = std::function<void(const RunProgress&)>;

    static constexpr size_t kDefaultProgressInterval = 25;

    explicit ProcessingOrchestrator(const IngestConfig& config);

    /**
     * @brief Observe the run every `interval` completed files and once at the end
     *
     * Calls come from worker threads but never overlap.
     */
    void setProgressCallback(ProgressCallback callback, size_t interval = kDefaultProgressInterval);

    /**
     * @brief Process every candidate under the configured root
     * @throws SetupError if the root cannot be walked
     */
    RunResult run();

    /**
     * @brief Process every candidate under root_path
     * @throws SetupError if the root cannot be walked
     */
    RunResult run(const std::string& root_path);

    /**
     * @brief Stop dispatching new files; may be called from any thread
     *
     * Files already being processed finish, queued files are dropped and
     * the run returns a partial result marked cancelled.
     */
    void cancel();

    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Ignore rules for a root: defaults, configured patterns, then the ignore file
     */
    IgnoreRuleSet buildRuleSet(const std::string& root_path) const;

    WalkerOptions buildWalkerOptions() const;

    /**
     * @brief Configured ceiling, or the model's context window when unset
     */
    size_t getContextCeiling() const;

    /**
     * @brief Accountant used by the workers; register custom counters before run()
     */
    TokenAccountant& getTokenAccountant() { return m_accountant; }

    const IngestConfig& getConfig() const { return m_config; }

private:
    IngestConfig m_config;
    TokenAccountant m_accountant;
    EncodingDetector m_detector;
    LanguageClassifier m_classifier;
    ContentSanitizer m_sanitizer;

    std::atomic<bool> m_cancelled{false};

    ProgressCallback m_progress_callback;
    size_t m_progress_interval = kDefaultProgressInterval;
    std::mutex m_progress_mutex;
    std::atomic<size_t> m_completed{0};
    std::atomic<size_t> m_dispatched{0};
    std::atomic<bool> m_discovery_done{false};
    std::mutex m_queue_mutex;
    WorkQueue<CandidatePath>* m_active_queue = nullptr;

    void workerLoop(WorkQueue<CandidatePath>& queue, const FileProcessor& processor,
                    ResultSink& sink, size_t ceiling);

    void reportProgress(size_t completed, size_t tokens, bool force);

    void finalize(RunResult& result, size_t ceiling) const;
};

} // namespace Distill
