#include "../../include/parallel_executor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_category.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace squisher {

namespace {

    std::string format_seconds(const std::chrono::milliseconds elapsed) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(elapsed.count()) / 1000.0);
        return buf;
    }

    uintmax_t safe_size(const fs::path& p) {
        std::error_code ec;
        const auto s = fs::file_size(p, ec);
        return ec ? 0 : s;
    }

} // namespace

template <typename Event>
void ParallelExecutor::notify(const Event& event) {
    try {
        event_bus_.publish(event);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("event handler failed: ") + e.what(), "Executor");
    }
}

ParallelExecutor::ParallelExecutor(const PipelineRegistry& registry,
                                   PathMapper mapper,
                                   fs::path input_root,
                                   EventBus& bus,
                                   const unsigned threads)
    : registry_(registry),
      mapper_(std::move(mapper)),
      input_root_(std::move(input_root)),
      event_bus_(bus),
      threads_(threads == 0 ? 1 : threads) {}

RunSummary ParallelExecutor::run(const std::vector<fs::path>& files) {
    return run(files, [this](const SourceFile& source) { return process_file(source); });
}

RunSummary ParallelExecutor::run(const std::vector<fs::path>& files, const FileTask& task) {
    {
        std::lock_guard lock(outcomes_mtx_);
        outcomes_.clear();
        outcomes_.reserve(files.size());
    }

    {
        ThreadPool pool(threads_);
        for (const auto& file : files) {
            // process_one never throws, so the futures carry nothing
            (void)pool.enqueue([this, &file, &task] { process_one(file, task); });
        }
        pool.wait_idle();
    }

    RunSummary summary;
    {
        std::lock_guard lock(outcomes_mtx_);
        summary.outcomes = std::move(outcomes_);
        outcomes_.clear();
    }
    summary.total = summary.outcomes.size();
    for (const auto& outcome : summary.outcomes) {
        switch (outcome.status) {
            case OutcomeStatus::Succeeded: ++summary.succeeded; break;
            case OutcomeStatus::Skipped:   ++summary.skipped;   break;
            case OutcomeStatus::Failed:    ++summary.failed;    break;
        }
    }

    Logger::log(summary.ok() ? LogLevel::Info : LogLevel::Warning,
                "processed " + std::to_string(summary.total) + " files: " +
                std::to_string(summary.succeeded) + " succeeded, " +
                std::to_string(summary.skipped) + " skipped, " +
                std::to_string(summary.failed) + " failed", "Executor");
    return summary;
}

FileResult ParallelExecutor::process_file(const SourceFile& source) const {
    FileResult result;
    const FileCategory category = classify(source.relative_path);
    const IPipeline* pipeline = registry_.find(category);
    if (!pipeline) {
        result.skipped = true;
        result.skip_reason = "already compressed";
        return result;
    }
    Logger::log(LogLevel::Debug, source.relative_path.string() + ": " + std::string(category_to_string(category)) +
                " -> " + std::string(pipeline->get_name()) + " pipeline", "Executor");
    result.artifacts = pipeline->run(source, mapper_.map(source));
    return result;
}

void ParallelExecutor::process_one(const fs::path& file, const FileTask& task) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    PipelineOutcome outcome;
    outcome.source.absolute_path = file;
    outcome.source.relative_path = file.filename();

    try {
        outcome.source = SourceFile::from(input_root_, file);
        notify(FileProcessStartEvent{outcome.source.relative_path});

        FileResult result = task(outcome.source);
        outcome.elapsed = elapsed();
        if (result.skipped) {
            outcome.status = OutcomeStatus::Skipped;
            outcome.message = std::move(result.skip_reason);
        } else {
            outcome.status = OutcomeStatus::Succeeded;
            outcome.artifacts = std::move(result.artifacts);
        }
    } catch (const Error& e) {
        outcome.elapsed = elapsed();
        outcome.status = OutcomeStatus::Failed;
        outcome.error_kind = e.kind();
        outcome.message = e.what();
    } catch (const std::exception& e) {
        outcome.elapsed = elapsed();
        outcome.status = OutcomeStatus::Failed;
        outcome.message = e.what();
    }

    if (outcome.status == OutcomeStatus::Failed) {
        any_failure_.store(true, std::memory_order_relaxed);
        Logger::log(LogLevel::Error, "Error processing file " + file.string() + ": " + outcome.message +
                    " (" + format_seconds(outcome.elapsed) + " seconds)", "Executor");
    } else if (outcome.status == OutcomeStatus::Skipped) {
        Logger::log(LogLevel::Debug, "skipped " + file.string() + ": " + outcome.message, "Executor");
    }

    const OutcomeStatus status = outcome.status;
    const fs::path relative = outcome.source.relative_path;
    std::optional<FileProcessCompleteEvent> complete;
    if (status == OutcomeStatus::Succeeded) {
        complete = FileProcessCompleteEvent{relative, safe_size(file), outcome.artifacts, outcome.elapsed};
    }
    const FileProcessErrorEvent error{relative, outcome.error_kind, outcome.message, outcome.elapsed};

    // record first: subscribers only ever see outcomes that are already counted
    {
        std::lock_guard lock(outcomes_mtx_);
        outcomes_.push_back(std::move(outcome));
    }

    switch (status) {
        case OutcomeStatus::Succeeded: notify(*complete); break;
        case OutcomeStatus::Skipped:   notify(FileProcessSkippedEvent{relative, error.error_message}); break;
        case OutcomeStatus::Failed:    notify(error); break;
    }
}

} // namespace squisher
