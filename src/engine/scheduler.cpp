// =============================================================================
// logq - Scheduler Implementation
// =============================================================================
// Tasks are dispatched with tbb::parallel_for inside a task_arena sized to
// the configured worker count. A grain size of one task and the simple
// partitioner keep scheduling at task granularity, so one slow file does not
// hold back a batch of others.
// =============================================================================

#include "logq/engine/scheduler.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>

#include <fmt/format.h>

#include "logq/common/logger.h"
#include "logq/io/byte_source.h"
#include "logq/io/record_splitter.h"

namespace logq::engine {

namespace fs = std::filesystem;

// =============================================================================
// Utility Functions
// =============================================================================

std::size_t recommendedWorkerCount() noexcept {
    auto hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 4;  // Fallback default
    }
    return std::min<std::size_t>(hwThreads, kMaxDefaultWorkers);
}

namespace {

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool matchesExtension(const std::string& lowerName, const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return true;
    }
    for (const auto& ext : extensions) {
        std::string suffix = toLower(ext);
        if (!suffix.empty() && suffix.front() != '.') {
            suffix.insert(suffix.begin(), '.');
        }
        if (lowerName.ends_with(suffix)) {
            return true;
        }
    }
    return false;
}

bool matchesNameFilter(const std::string& name, const std::vector<std::string>& needles) {
    if (needles.empty()) {
        return true;
    }
    return std::any_of(needles.begin(), needles.end(), [&name](const std::string& needle) {
        return name.find(needle) != std::string::npos;
    });
}

}  // namespace

// =============================================================================
// ScanOptions Implementation
// =============================================================================

VoidResult ScanOptions::validate() const {
    if (logRoot.empty()) {
        return makeVoidError(ErrorCode::kConfigError, "log directory is not set");
    }
    if (chunkSize < kMinChunkSize) {
        return makeVoidError(ErrorCode::kConfigError,
                             fmt::format("chunk size must be at least {} bytes", kMinChunkSize));
    }
    if (inputBufferSize == 0) {
        return makeVoidError(ErrorCode::kConfigError, "input buffer size must be > 0");
    }
    if (recordDelimiter.empty()) {
        return makeVoidError(ErrorCode::kConfigError, "record delimiter must not be empty");
    }
    return makeVoidSuccess();
}

std::size_t ScanOptions::effectiveWorkers() const noexcept {
    return numWorkers > 0 ? numWorkers : recommendedWorkerCount();
}

// =============================================================================
// Enumeration and Planning
// =============================================================================

Result<std::vector<FileHandle>> enumerateFiles(const ScanOptions& options) {
    using FileList = std::vector<FileHandle>;
    const fs::path& root = options.logRoot;

    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        return makeError<FileList>(ErrorCode::kEnumerationError,
                                   fmt::format("log root does not exist: {}", root.string()));
    }
    if (!fs::is_directory(status)) {
        return makeError<FileList>(ErrorCode::kEnumerationError,
                                   fmt::format("log root is not a directory: {}", root.string()));
    }

    FileList files;
    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            return;
        }

        const std::string name = entry.path().filename().string();
        if (!matchesExtension(toLower(name), options.extensions) ||
            !matchesNameFilter(name, options.nameContains)) {
            return;
        }

        FileHandle handle;
        handle.path = entry.path();
        handle.size = entry.file_size(entryEc);
        if (entryEc) {
            LOGQ_LOG_WARNING("Cannot stat {}: {}", handle.path.string(), entryEc.message());
            handle.size = 0;
            entryEc.clear();
        }
        handle.modified = entry.last_write_time(entryEc);
        handle.extensionHint = io::detectCompressionFormatFromExtension(handle.path);
        files.push_back(std::move(handle));
    };

    auto listError = [&root](const std::error_code& error) {
        return makeError<FileList>(
            ErrorCode::kEnumerationError,
            fmt::format("cannot list log root {}: {}", root.string(), error.message()));
    };

    if (options.recursive) {
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied,
                                            ec);
        if (ec) {
            return listError(ec);
        }
        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                return listError(ec);
            }
            const fs::directory_entry& entry = *it;
            if (!options.includeHidden && entry.path().filename().string().starts_with('.')) {
                std::error_code dirEc;
                if (entry.is_directory(dirEc)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            consider(entry);
        }
    } else {
        fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return listError(ec);
        }
        for (const fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                return listError(ec);
            }
            const fs::directory_entry& entry = *it;
            if (!options.includeHidden && entry.path().filename().string().starts_with('.')) {
                continue;
            }
            consider(entry);
        }
    }
    if (ec) {
        return listError(ec);
    }

    std::sort(files.begin(), files.end(),
              [](const FileHandle& a, const FileHandle& b) { return a.path < b.path; });
    for (std::size_t i = 0; i < files.size(); ++i) {
        files[i].index = static_cast<FileIndex>(i);
    }

    LOGQ_LOG_DEBUG("Enumerated {} files under {}", files.size(), root.string());
    return files;
}

std::vector<FileTask> planTasks(const std::vector<FileHandle>& files, const ScanOptions& options) {
    const std::uint64_t threshold = options.splitThreshold;
    const bool splittable =
        threshold != kNoSplit && !io::RecordSplitter::isSelfOverlapping(options.recordDelimiter);

    std::vector<FileTask> tasks;
    tasks.reserve(files.size());
    TaskId nextId = 0;

    for (const auto& file : files) {
        if (splittable && file.size > threshold &&
            file.extensionHint == CompressionFormat::kNone) {
            auto sniffed = io::sniffCompressionFormat(file.path);
            if (sniffed && *sniffed == CompressionFormat::kNone) {
                for (std::uint64_t begin = 0; begin < file.size; begin += threshold) {
                    const std::uint64_t end =
                        file.size - begin <= threshold ? kEndOfStream : begin + threshold;
                    tasks.emplace_back(nextId++, file, ByteRange{begin, end});
                }
                continue;
            }
        }
        tasks.emplace_back(nextId++, file);
    }

    return tasks;
}

// =============================================================================
// SchedulerImpl
// =============================================================================

class SchedulerImpl {
public:
    explicit SchedulerImpl(ScanOptions options) : options_(std::move(options)) {}

    Result<FinalResult> run(std::shared_ptr<const query::QuerySpec> spec) {
        if (running_.exchange(true)) {
            return makeError<FinalResult>(ErrorCode::kInvalidArgument,
                                          "scheduler is already running");
        }
        cancelled_.store(false);

        auto result = runLocked(std::move(spec));

        cancelRequested_.store(false);
        running_.store(false);
        return result;
    }

    void cancel() noexcept { cancelRequested_.store(true); }

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(); }

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] const ScanOptions& options() const noexcept { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] bool stopRequested() const noexcept {
        return cancelRequested_.load(std::memory_order_relaxed) ||
               (options_.cancelFlag != nullptr &&
                options_.cancelFlag->load(std::memory_order_relaxed));
    }

    [[nodiscard]] std::uint64_t elapsedMs() const {
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count());
    }

    Result<FinalResult> cancelledResult(std::size_t settled, std::size_t total) {
        cancelled_.store(true);
        LOGQ_LOG_WARNING("Run cancelled after {} of {} tasks", settled, total);
        return makeError<FinalResult>(ErrorCode::kCancelled,
                                      fmt::format("run cancelled after {} of {} tasks", settled,
                                                  total));
    }

    Result<FinalResult> runLocked(std::shared_ptr<const query::QuerySpec> spec) {
        if (auto valid = options_.validate(); !valid) {
            return std::unexpected(valid.error());
        }
        if (!spec) {
            return makeError<FinalResult>(ErrorCode::kConfigError, "no query to run");
        }

        start_ = Clock::now();
        if (stopRequested()) {
            return cancelledResult(0, 0);
        }

        auto files = enumerateFiles(options_);
        if (!files) {
            return std::unexpected(files.error());
        }
        if (files->empty()) {
            LOGQ_LOG_WARNING("No files to scan under {}", options_.logRoot.string());
        }

        std::vector<FileTask> tasks = planTasks(*files, options_);
        const std::size_t workers = options_.effectiveWorkers();
        LOGQ_LOG_INFO("Scanning {} files ({} tasks) with {} workers", files->size(), tasks.size(),
                      workers);

        // Per-file count of unsettled tasks, for file-level progress
        std::vector<std::atomic<std::uint32_t>> remaining(files->size());
        for (const auto& task : tasks) {
            remaining[task.file().index].fetch_add(1, std::memory_order_relaxed);
        }

        totalFiles_ = files->size();
        totalTasks_ = tasks.size();
        tasksDone_.store(0);
        filesDone_.store(0);
        bytesDone_.store(0);
        lastReportMs_.store(0);

        TaskOptions taskOptions;
        taskOptions.recordDelimiter = options_.recordDelimiter;
        taskOptions.chunkSize = options_.chunkSize;
        taskOptions.inputBufferSize = options_.inputBufferSize;
        taskOptions.trimCarriageReturn = options_.trimCarriageReturn;
        taskOptions.shouldStop = [this] { return stopRequested(); };

        Aggregator aggregator(spec, tasks.size());
        std::atomic<std::size_t> abandoned{0};

        tbb::task_arena arena(static_cast<int>(workers));
        arena.execute([&] {
            tbb::parallel_for(
                tbb::blocked_range<std::size_t>(0, tasks.size(), 1),
                [&](const tbb::blocked_range<std::size_t>& range) {
                    for (std::size_t i = range.begin(); i != range.end(); ++i) {
                        FileTask& task = tasks[i];
                        if (stopRequested()) {
                            task.abandon();
                            abandoned.fetch_add(1);
                            continue;
                        }

                        const TaskState state = task.run(*spec, taskOptions);
                        if (state == TaskState::kCompleted) {
                            aggregator.contribute(task.id(), task.file().index,
                                                  task.takeResult());
                        } else if (state == TaskState::kFailedSkipped) {
                            aggregator.reportFailure(task.id(), *task.error());
                        } else {
                            abandoned.fetch_add(1);
                            continue;
                        }

                        tasksDone_.fetch_add(1);
                        bytesDone_.fetch_add(task.bytesDecoded());
                        if (remaining[task.file().index].fetch_sub(1) == 1) {
                            filesDone_.fetch_add(1);
                        }
                        reportProgress(false);
                    }
                },
                tbb::simple_partitioner());
        });

        if (abandoned.load() > 0) {
            return cancelledResult(aggregator.settledTasks(), tasks.size());
        }

        reportProgress(true);
        if (cancelRequested_.load()) {
            return cancelledResult(aggregator.settledTasks(), tasks.size());
        }

        std::vector<fs::path> paths;
        paths.reserve(files->size());
        for (const auto& file : *files) {
            paths.push_back(file.path);
        }

        FinalResult result = aggregator.finalize(std::move(paths));
        result.stats.elapsedMs = elapsedMs();

        LOGQ_LOG_INFO("Scanned {} files ({} failed): {} records, {} matched, {} bytes in {} ms",
                      result.stats.filesScanned, result.stats.filesFailed,
                      result.stats.recordsScanned, result.stats.recordsMatched,
                      result.stats.bytesDecoded, result.stats.elapsedMs);
        if (result.stats.schemaMismatches > 0 || result.stats.coercionFailures > 0) {
            LOGQ_LOG_INFO("{} schema mismatches, {} field coercion failures",
                          result.stats.schemaMismatches, result.stats.coercionFailures);
        }
        return result;
    }

    void reportProgress(bool force) {
        if (!options_.progressCallback) {
            return;
        }

        const auto now = static_cast<std::int64_t>(elapsedMs());
        auto last = lastReportMs_.load();
        if (!force && now - last < static_cast<std::int64_t>(options_.progressIntervalMs)) {
            return;
        }
        if (!force && !lastReportMs_.compare_exchange_strong(last, now)) {
            return;
        }

        std::unique_lock<std::mutex> lock(progressMutex_, std::defer_lock);
        if (force) {
            lock.lock();
        } else if (!lock.try_lock()) {
            return;
        }

        ProgressInfo info;
        info.filesCompleted = filesDone_.load();
        info.totalFiles = totalFiles_;
        info.tasksCompleted = tasksDone_.load();
        info.totalTasks = totalTasks_;
        info.bytesProcessed = bytesDone_.load();
        info.elapsedMs = static_cast<std::uint64_t>(now);

        if (!options_.progressCallback(info)) {
            LOGQ_LOG_INFO("Run cancelled by progress callback");
            cancelRequested_.store(true);
        }
    }

    ScanOptions options_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> cancelled_{false};

    Clock::time_point start_{};
    std::uint64_t totalFiles_ = 0;
    std::uint64_t totalTasks_ = 0;
    std::atomic<std::uint64_t> tasksDone_{0};
    std::atomic<std::uint64_t> filesDone_{0};
    std::atomic<std::uint64_t> bytesDone_{0};
    std::atomic<std::int64_t> lastReportMs_{0};
    std::mutex progressMutex_;
};

// =============================================================================
// Scheduler
// =============================================================================

Scheduler::Scheduler(ScanOptions options)
    : impl_(std::make_unique<SchedulerImpl>(std::move(options))) {}

Scheduler::~Scheduler() = default;

Scheduler::Scheduler(Scheduler&&) noexcept = default;

Scheduler& Scheduler::operator=(Scheduler&&) noexcept = default;

Result<FinalResult> Scheduler::run(std::shared_ptr<const query::QuerySpec> spec) {
    return impl_->run(std::move(spec));
}

void Scheduler::cancel() noexcept {
    impl_->cancel();
}

bool Scheduler::isCancelled() const noexcept {
    return impl_->isCancelled();
}

bool Scheduler::isRunning() const noexcept {
    return impl_->isRunning();
}

const ScanOptions& Scheduler::options() const noexcept {
    return impl_->options();
}

}  // namespace logq::engine
