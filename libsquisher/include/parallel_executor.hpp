/**
 * @file parallel_executor.hpp
 * @brief Drives a whole run: one pipeline per file, spread over a thread pool.
 */

#ifndef SQUISHER_PARALLEL_EXECUTOR_HPP
#define SQUISHER_PARALLEL_EXECUTOR_HPP

#include "artifact.hpp"
#include "event_bus.hpp"
#include "path_mapper.hpp"
#include "pipeline_registry.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace squisher {

/**
 * @brief Aggregated result of a run.
 */
struct RunSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::vector<PipelineOutcome> outcomes; ///< One per input file, in completion order

    /// @return true when no file failed.
    [[nodiscard]] bool ok() const noexcept { return failed == 0; }
};

/**
 * @brief Runs a per-file task for every input file on a fixed-size pool.
 *
 * @details Each file is handled start to finish by exactly one worker.
 * Whatever a task throws is caught at the file boundary, logged with the
 * file's path and elapsed time, published as a FileProcessErrorEvent and
 * recorded; it never reaches other files. Any failure sets a shared
 * atomic flag that decides the aggregate status. Outcomes are recorded
 * before events are published, and an exception thrown by a subscriber
 * is logged without affecting the file's outcome.
 *
 * There is no cancellation: run() returns once every file has finished.
 */
class ParallelExecutor {
public:
    /// Work done for one file. Throws to report failure.
    using FileTask = std::function<FileResult(const SourceFile&)>;

    /**
     * @param registry Pipelines used by the default task.
     * @param mapper Maps relative paths into the output tree.
     * @param input_root Root every input file must lie under.
     * @param bus Receives per-file progress events.
     * @param threads Worker count; 0 means one.
     */
    ParallelExecutor(const PipelineRegistry& registry,
                     PathMapper mapper,
                     std::filesystem::path input_root,
                     EventBus& bus,
                     unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Process @p files with the default dispatch: classify, map,
     * then run the category's pipeline. Already-compressed files are skipped.
     */
    RunSummary run(const std::vector<std::filesystem::path>& files);

    /**
     * @brief Process @p files with a caller-supplied task.
     */
    RunSummary run(const std::vector<std::filesystem::path>& files, const FileTask& task);

    /**
     * @brief The default per-file task used by run(files).
     */
    [[nodiscard]] FileResult process_file(const SourceFile& source) const;

    /// @return true once any file of any run on this executor failed.
    [[nodiscard]] bool any_failure() const noexcept {
        return any_failure_.load(std::memory_order_relaxed);
    }

private:
    void process_one(const std::filesystem::path& file, const FileTask& task);

    /// Publishes @p event; a throwing subscriber is logged and ignored.
    template <typename Event>
    void notify(const Event& event);

    const PipelineRegistry& registry_;
    PathMapper mapper_;
    std::filesystem::path input_root_;
    EventBus& event_bus_;
    unsigned threads_;

    std::atomic<bool> any_failure_{false};
    std::mutex outcomes_mtx_;               ///< Protects outcomes_
    std::vector<PipelineOutcome> outcomes_; ///< Filled by workers during run()
};

} // namespace squisher

#endif // SQUISHER_PARALLEL_EXECUTOR_HPP
