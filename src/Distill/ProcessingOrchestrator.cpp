// =================================================================
// src/Distill/ProcessingOrchestrator.cpp
// =================================================================
// Implementation for the concurrent ingestion run.

#include "Distill/ProcessingOrchestrator.hpp"
#include "Distill/FileProcessor.hpp"
#include "Distill/Logger.hpp"
#include "Distill/MetricsReporter.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

namespace Distill {

namespace {

EncodingOptions makeEncodingOptions(const IngestConfig& config) {
    EncodingOptions options;
    options.max_file_size_bytes = config.max_file_size_bytes;
    options.fallback_encodings = config.fallback_encodings;
    return options;
}

SanitizeOptions makeSanitizeOptions(const IngestConfig& config) {
    SanitizeOptions options;
    options.strip_comments = config.strip_comments;
    options.max_consecutive_blank_lines = config.max_consecutive_blank_lines;
    return options;
}

bool byRelativePath(const FailureRecord& a, const FailureRecord& b) {
    return a.relative_path < b.relative_path;
}

// Joins the worker threads however run() is left
class WorkerGroup {
public:
    explicit WorkerGroup(WorkQueue<CandidatePath>& queue) : m_queue(queue) {}

    ~WorkerGroup() {
        if (!m_threads.empty()) {
            m_queue.cancel();
            join();
        }
    }

    template<typename F>
    void spawn(size_t count, F body) {
        for (size_t i = 0; i < count; ++i) {
            m_threads.emplace_back(body);
        }
    }

    void join() {
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        m_threads.clear();
    }

private:
    WorkQueue<CandidatePath>& m_queue;
    std::vector<std::thread> m_threads;
};

} // namespace

// ResultSink implementation

size_t ResultSink::add(FileProcessResult outcome) {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (outcome.status) {
        case ProcessStatus::Processed: {
            FileRecord& record = outcome.record;
            m_running_total += record.token_count;
            m_result.records.push_back(std::move(record));
            break;
        }
        case ProcessStatus::SkippedBinary:
            m_result.skipped.push_back(std::move(outcome.failure));
            break;
        case ProcessStatus::Failed:
            m_result.failures.push_back(std::move(outcome.failure));
            break;
    }

    return m_running_total;
}

size_t ResultSink::getRunningTotal() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running_total;
}

RunResult ResultSink::takeResult() {
    std::lock_guard<std::mutex> lock(m_mutex);
    RunResult result = std::move(m_result);
    m_result = RunResult();
    m_running_total = 0;
    return result;
}

// ProcessingOrchestrator implementation

ProcessingOrchestrator::ProcessingOrchestrator(const IngestConfig& config)
    : m_config(config),
      m_detector(makeEncodingOptions(config)),
      m_sanitizer(makeSanitizeOptions(config)) {
}

void ProcessingOrchestrator::setProgressCallback(ProgressCallback callback, size_t interval) {
    m_progress_callback = std::move(callback);
    m_progress_interval = interval == 0 ? 1 : interval;
}

RunResult ProcessingOrchestrator::run() {
    return run(m_config.root_path);
}

RunResult ProcessingOrchestrator::run(const std::string& root_path) {
    auto start_time = std::chrono::steady_clock::now();
    m_cancelled = false;
    m_completed = 0;
    m_dispatched = 0;
    m_discovery_done = false;

    IgnoreRuleSet rules = buildRuleSet(root_path);
    DirectoryWalker walker(root_path, rules, buildWalkerOptions());

    const size_t ceiling = getContextCeiling();
    const size_t worker_count = m_config.getEffectiveWorkers();
    FileProcessor processor(m_detector, m_classifier, m_sanitizer, m_accountant,
                            m_config.model, m_config.max_tokens_per_file);

    Logger::getInstance().info("Orchestrator", "Starting run",
        "Root: " + walker.getRoot() + ", Workers: " + std::to_string(worker_count) +
        ", Model: " + m_config.model + ", Ceiling: " + std::to_string(ceiling));

    ResultSink sink;
    WorkQueue<CandidatePath> queue(m_config.getEffectiveQueueCapacity());
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_active_queue = &queue;
    }

    size_t dispatched = 0;
    {
        WorkerGroup workers(queue);
        workers.spawn(worker_count, [this, &queue, &processor, &sink, ceiling]() {
            workerLoop(queue, processor, sink, ceiling);
        });

        CandidatePath candidate;
        while (!m_cancelled && walker.next(candidate)) {
            if (!queue.push(candidate)) {
                break;
            }
            ++dispatched;
            m_dispatched = dispatched;
        }
        m_discovery_done = true;

        queue.close();
        workers.join();
    }
    reportProgress(m_completed.load(), sink.getRunningTotal(), true);

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_active_queue = nullptr;
    }

    Logger::getInstance().logDiscovery(dispatched, walker.discoveryErrors().size());

    RunResult result = sink.takeResult();
    const auto& discovery_errors = walker.discoveryErrors();
    result.failures.insert(result.failures.end(), discovery_errors.begin(), discovery_errors.end());

    const size_t completed = result.records.size() + result.skipped.size() +
                             result.failures.size() - discovery_errors.size();
    if (completed < dispatched) {
        Logger::getInstance().warning("Orchestrator", "Queued files were not processed after cancellation",
                                      "Files: " + std::to_string(dispatched - completed));
    }

    finalize(result, ceiling);

    result.summary.root = walker.getRoot();
    result.summary.cancelled = m_cancelled.load();
    result.summary.duration_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());
    result.summary.peak_memory_kb = MetricsReporter::peakMemoryKb();

    Logger::getInstance().logRunSummary(result.summary);
    return result;
}

void ProcessingOrchestrator::cancel() {
    m_cancelled = true;

    std::lock_guard<std::mutex> lock(m_queue_mutex);
    if (m_active_queue) {
        m_active_queue->cancel();
    }
}

IgnoreRuleSet ProcessingOrchestrator::buildRuleSet(const std::string& root_path) const {
    std::string ignore_file = m_config.ignore_file.empty()
        ? (std::filesystem::path(root_path) / ".gitignore").string()
        : m_config.ignore_file;

    std::vector<std::string> supplemental;
    if (!m_config.bypass_ignore) {
        supplemental = IgnoreRuleSet::loadRuleFile(ignore_file);
        if (!supplemental.empty()) {
            LOG_DEBUG("Orchestrator", "Loaded " + std::to_string(supplemental.size()) +
                                      " ignore file lines from " + ignore_file);
        }
    }

    return IgnoreRuleSet::compile(m_config.getMergedIgnorePatterns(), supplemental, m_config.bypass_ignore);
}

WalkerOptions ProcessingOrchestrator::buildWalkerOptions() const {
    WalkerOptions options;
    options.follow_symlinks = m_config.follow_symlinks;
    options.include_extensions = m_config.include_extensions;
    options.exclude_extensions = m_config.exclude_extensions;
    if (!m_config.output_path.empty()) {
        options.excluded_paths.push_back(m_config.output_path);
    }
    return options;
}

size_t ProcessingOrchestrator::getContextCeiling() const {
    return m_config.context_ceiling > 0 ? m_config.context_ceiling : m_accountant.contextWindow(m_config.model);
}

void ProcessingOrchestrator::workerLoop(WorkQueue<CandidatePath>& queue, const FileProcessor& processor,
                                        ResultSink& sink, size_t ceiling) {
    CandidatePath candidate;
    while (queue.pop(candidate)) {
        FileProcessResult outcome;
        try {
            outcome = processor.process(candidate);
        } catch (const std::exception& e) {
            outcome.status = ProcessStatus::Failed;
            outcome.failure = {candidate.relative_path, PipelineStage::Read, std::string("unexpected error: ") + e.what()};
        }

        const bool processed = outcome.status == ProcessStatus::Processed;
        size_t running_total = sink.add(std::move(outcome));
        reportProgress(++m_completed, running_total, false);

        if (processed && m_config.overflow_policy == OverflowPolicy::Abort && running_total > ceiling && !m_cancelled) {
            Logger::getInstance().warning("Orchestrator", "Context ceiling crossed, stopping dispatch",
                "Total: " + std::to_string(running_total) + ", Ceiling: " + std::to_string(ceiling));
            cancel();
        }
    }
}

void ProcessingOrchestrator::reportProgress(size_t completed, size_t tokens, bool force) {
    if (!force && completed % m_progress_interval != 0) {
        return;
    }

    RunProgress progress;
    progress.completed = completed;
    progress.dispatched = std::max(completed, m_dispatched.load());
    progress.tokens = tokens;
    progress.discovery_done = m_discovery_done.load();

    std::lock_guard<std::mutex> lock(m_progress_mutex);
    LOG_INFO("Orchestrator", "Progress: " + std::to_string(progress.completed) + " of " +
                              std::to_string(progress.dispatched) + " files, " +
                              std::to_string(progress.tokens) + " tokens");
    if (m_progress_callback) {
        m_progress_callback(progress);
    }
}

void ProcessingOrchestrator::finalize(RunResult& result, size_t ceiling) const {
    std::sort(result.records.begin(), result.records.end(),
              [](const FileRecord& a, const FileRecord& b) { return a.relative_path < b.relative_path; });
    std::sort(result.skipped.begin(), result.skipped.end(), byRelativePath);
    std::sort(result.failures.begin(), result.failures.end(), byRelativePath);

    RunSummary& summary = result.summary;
    summary.model = m_config.model;
    summary.context_ceiling = ceiling;
    summary.processed = result.records.size();
    summary.skipped_binary = result.skipped.size();
    summary.failed = result.failures.size();
    summary.discovered = summary.processed + summary.skipped_binary + summary.failed;

    std::vector<FileRecord> admitted;
    admitted.reserve(result.records.size());
    size_t running_total = 0;

    for (auto& record : result.records) {
        if (record.truncated) {
            summary.truncated++;
        }

        if (running_total + record.token_count > ceiling) {
            record.overflow = true;
            summary.overflowed++;

            if (m_config.overflow_policy == OverflowPolicy::Drop) {
                result.omitted.push_back({record.relative_path, PipelineStage::Done,
                    std::to_string(record.token_count) + " tokens would exceed the context ceiling of " +
                    std::to_string(ceiling) + " (running total " + std::to_string(running_total) + ")"});
                continue;
            }
        }

        running_total += record.token_count;
        summary.total_bytes += record.original_size;
        summary.languages[record.language]++;
        summary.encodings[record.encoding]++;
        admitted.push_back(std::move(record));
    }

    summary.omitted = result.omitted.size();
    summary.total_tokens = running_total;
    result.records = std::move(admitted);
}

} // namespace Distill
