#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include "../libsquisher/include/directory_walker.hpp"
#include "../libsquisher/include/errors.hpp"
#include "../libsquisher/include/event_bus.hpp"
#include "../libsquisher/include/events.hpp"
#include "../libsquisher/include/parallel_executor.hpp"
#include "../libsquisher/include/pipeline_registry.hpp"
#include "../libsquisher/include/png_codec.hpp"
#include "test_utils.hpp"

using namespace squisher;
namespace fs = std::filesystem;

int main() {
    test_utils::ScratchDir scratch("executor");
    const fs::path in_root = scratch / "in";
    const fs::path out_root = scratch / "out";

    constexpr int kTextFiles = 12;
    for (int i = 0; i < kTextFiles; ++i) {
        test_utils::write_text(in_root / ("dir" + std::to_string(i % 3)) / ("file" + std::to_string(i) + ".txt"),
                               std::string(1000 + i * 17, static_cast<char>('a' + i % 26)));
    }
    test_utils::write_file(in_root / "img/logo.png", PngEncoder().encode(test_utils::gradient(40, 20, true)));
    test_utils::write_text(in_root / "img/broken.png", "definitely not an image");
    test_utils::write_text(in_root / "bundle.js.gz", "already squeezed");

    const Config config{CompressionConfig(), ImageVariantConfig(WebpMode::lossy(80.0f), false, {}, false)};
    const PipelineRegistry registry(config);

    EventBus bus;
    std::atomic<int> started{0};
    std::atomic<int> completed{0};
    std::mutex mtx;
    std::set<fs::path> failed_paths;
    std::set<fs::path> skipped_paths;
    bus.subscribe<FileProcessStartEvent>([&](const FileProcessStartEvent&) { ++started; });
    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        assert(!e.artifacts.empty());
        ++completed;
    });
    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent& e) {
        std::lock_guard lock(mtx);
        failed_paths.insert(e.path);
    });
    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent& e) {
        std::lock_guard lock(mtx);
        skipped_paths.insert(e.path);
    });

    const auto files = collect_regular_files(in_root);
    assert(files.size() == kTextFiles + 3);

    std::cout << "[Test] One bad image fails exactly one file..." << std::endl;
    ParallelExecutor executor(registry, PathMapper(out_root), in_root, bus, 4);
    const RunSummary summary = executor.run(files);

    assert(summary.total == files.size());
    assert(summary.failed == 1);
    assert(summary.skipped == 1);
    assert(summary.succeeded == kTextFiles + 1);
    assert(!summary.ok());
    assert(executor.any_failure());
    assert(started == static_cast<int>(files.size()));
    assert(completed == kTextFiles + 1);
    assert(failed_paths == std::set<fs::path>{fs::path("img") / "broken.png"});
    assert(skipped_paths == std::set<fs::path>{fs::path("bundle.js.gz")});

    for (const auto& outcome : summary.outcomes) {
        if (outcome.status == OutcomeStatus::Failed) {
            assert(outcome.error_kind == ErrorKind::Decode);
        }
    }

    std::cout << "[Test] Output tree mirrors the input tree..." << std::endl;
    assert(fs::exists(out_root / "dir0" / "file0.txt"));
    assert(fs::exists(out_root / "dir0" / "file0.txt.br"));
    assert(fs::exists(out_root / "dir2" / "file11.txt.zz"));
    assert(fs::exists(out_root / "img" / "logo.webp"));
    assert(fs::exists(out_root / "img" / "logo.png"));
    assert(!fs::exists(out_root / "bundle.js.gz"));

    std::cout << "[Test] Re-running over the same output fails every processed file..." << std::endl;
    const RunSummary again = executor.run(files);
    assert(again.failed == kTextFiles + 2);
    assert(again.skipped == 1);

    std::cout << "[Test] Custom tasks: thrown exceptions stay with their file..." << std::endl;
    EventBus quiet_bus;
    ParallelExecutor custom(registry, PathMapper(out_root), in_root, quiet_bus, 3);
    std::atomic<int> calls{0};
    const RunSummary custom_summary = custom.run(files, [&calls](const SourceFile& source) {
        ++calls;
        if (source.relative_path.filename() == "file3.txt") {
            throw std::runtime_error("boom");
        }
        if (source.relative_path.filename() == "file4.txt") {
            throw EncodeError("encoder refused");
        }
        FileResult result;
        result.artifacts.push_back({source.absolute_path, source, ArtifactKind::Original, std::nullopt});
        return result;
    });
    assert(calls == static_cast<int>(files.size()));
    assert(custom_summary.failed == 2);
    assert(custom_summary.succeeded == files.size() - 2);
    for (const auto& outcome : custom_summary.outcomes) {
        if (outcome.source.relative_path.filename() == "file3.txt") {
            assert(outcome.status == OutcomeStatus::Failed);
            assert(!outcome.error_kind);
            assert(outcome.message == "boom");
        } else if (outcome.source.relative_path.filename() == "file4.txt") {
            assert(outcome.error_kind == ErrorKind::Encode);
        }
    }

    std::cout << "[Test] Throwing subscribers cannot hide a failed file..." << std::endl;
    {
        EventBus noisy_bus;
        noisy_bus.subscribe<FileProcessErrorEvent>([](const FileProcessErrorEvent&) {
            throw std::runtime_error("error handler exploded");
        });
        noisy_bus.subscribe<FileProcessCompleteEvent>([](const FileProcessCompleteEvent&) {
            throw std::runtime_error("complete handler exploded");
        });
        const std::vector<fs::path> pair = {in_root / "dir0" / "file0.txt", in_root / "dir1" / "file1.txt"};
        ParallelExecutor fragile(registry, PathMapper(out_root), in_root, noisy_bus, 2);
        const RunSummary fragile_summary = fragile.run(pair, [](const SourceFile& source) {
            if (source.relative_path.filename() == "file1.txt") {
                throw EncodeError("encoder refused");
            }
            return FileResult{};
        });
        assert(fragile_summary.total == 2);
        assert(fragile_summary.failed == 1);
        assert(fragile_summary.succeeded == 1);
        assert(!fragile_summary.ok());
        assert(fragile.any_failure());
    }

    std::cout << "[Test] An all-good run reports success..." << std::endl;
    ParallelExecutor clean(registry, PathMapper(out_root), in_root, quiet_bus, 0);
    const RunSummary clean_summary = clean.run(files, [](const SourceFile&) { return FileResult{}; });
    assert(clean_summary.ok());
    assert(!clean.any_failure());
    assert(clean_summary.succeeded == files.size());

    std::cout << "[Test] PASSED" << std::endl;
    return 0;
}
