#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace hframe {

/**
 * @brief Retention settings for the per-build log file
 */
struct BuildLogOptions {
    std::optional<std::filesystem::path> file;  // nullopt keeps the log in memory only
    bool keep_on_success = false;               // keep the file even when no error occurred
};

/**
 * @brief Structured log of one build
 *
 * Entries go to an in-memory spdlog sink with timestamps and are mirrored to
 * the default spdlog logger. finalize() writes the collected text to the log
 * file and removes it again after a clean build unless keep_on_success is
 * set. Problems with the log file itself are reported through spdlog and
 * never propagate.
 */
class BuildLog {
public:
    /**
     * @brief Start a log and write its header
     * @param root Build root shown in the header
     * @param options File location and retention policy
     */
    explicit BuildLog(std::filesystem::path root, BuildLogOptions options = {});

    BuildLog(const BuildLog&) = delete;
    BuildLog& operator=(const BuildLog&) = delete;

    void info(std::string_view message, std::optional<std::string_view> context = std::nullopt);
    void warning(std::string_view message, std::optional<std::string_view> context = std::nullopt);

    /**
     * @brief Record an error; marks the build as failed
     */
    void error(std::string_view message, std::optional<std::string_view> context = std::nullopt);

    /**
     * @brief Start a titled section
     */
    void section(std::string_view title);

    bool has_errors() const { return has_errors_; }

    /**
     * @brief Append the footer and write the log file
     *
     * Safe to call more than once; only the first call has an effect.
     */
    void finalize();

    /**
     * @brief Path of the kept log file, nullopt when none was kept
     */
    std::optional<std::filesystem::path> log_path() const;

    /**
     * @brief Log text collected so far
     */
    std::string text() const { return buffer_.str(); }

private:
    void write_raw(std::string_view line);
    void write_context(std::optional<std::string_view> context);

    std::filesystem::path root_;
    BuildLogOptions options_;
    std::ostringstream buffer_;
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::system_clock::time_point start_time_;
    bool has_errors_ = false;
    bool finalized_ = false;
    bool file_kept_ = false;
};

} // namespace hframe
