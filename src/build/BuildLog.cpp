#include "BuildLog.hpp"
#include <spdlog/fmt/chrono.h>
#include <spdlog/sinks/ostream_sink.h>
#include <fstream>
#include <system_error>

namespace hframe {

namespace {

const std::string kRule(70, '=');
const std::string kSectionRule(70, '-');

std::string format_time(std::chrono::system_clock::time_point tp) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(tp)));
}

} // namespace

BuildLog::BuildLog(std::filesystem::path root, BuildLogOptions options)
    : root_(std::move(root)),
      options_(std::move(options)),
      start_time_(std::chrono::system_clock::now()) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(buffer_);
    sink->set_pattern("[%H:%M:%S.%e] %l: %v");

    logger_ = std::make_shared<spdlog::logger>("build", sink);
    logger_->set_level(spdlog::level::info);

    write_raw(kRule);
    write_raw("HandeeFramer Build Log");
    write_raw(kRule);
    write_raw("Started: " + format_time(start_time_));
    write_raw("Root Path: " + root_.string());
    write_raw(fmt::format("Keep Log: {}", options_.keep_on_success));
    write_raw(kRule);
    write_raw("");
}

void BuildLog::write_raw(std::string_view line) {
    logger_->flush();
    buffer_ << line << '\n';
}

void BuildLog::write_context(std::optional<std::string_view> context) {
    if (context && !context->empty()) {
        write_raw(fmt::format("  Context: {}", *context));
    }
}

void BuildLog::info(std::string_view message, std::optional<std::string_view> context) {
    logger_->info("{}", message);
    write_context(context);
    spdlog::debug("{}{}", message, context ? fmt::format(" ({})", *context) : "");
}

void BuildLog::warning(std::string_view message, std::optional<std::string_view> context) {
    logger_->warn("{}", message);
    write_context(context);
    spdlog::warn("{}{}", message, context ? fmt::format(" ({})", *context) : "");
}

void BuildLog::error(std::string_view message, std::optional<std::string_view> context) {
    has_errors_ = true;
    logger_->error("{}", message);
    write_context(context);
    spdlog::error("{}{}", message, context ? fmt::format(" ({})", *context) : "");
}

void BuildLog::section(std::string_view title) {
    write_raw("");
    write_raw(kSectionRule);
    write_raw(fmt::format("  {}", title));
    write_raw(kSectionRule);
}

void BuildLog::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;

    auto end_time = std::chrono::system_clock::now();
    std::chrono::duration<double> duration = end_time - start_time_;

    write_raw("");
    write_raw(kRule);
    write_raw("Completed: " + format_time(end_time));
    write_raw(fmt::format("Duration: {:.2f} seconds", duration.count()));
    write_raw(fmt::format("Status: {}", has_errors_ ? "FAILED" : "SUCCESS"));
    write_raw(kRule);

    if (!options_.file) {
        return;
    }

    const auto& path = *options_.file;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::warn("Failed to open build log {}", path.string());
        return;
    }
    out << buffer_.str();
    out.close();
    if (!out) {
        spdlog::warn("Failed to write build log {}", path.string());
        return;
    }
    file_kept_ = true;

    if (!has_errors_ && !options_.keep_on_success) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            spdlog::warn("Failed to remove build log {}: {}", path.string(), ec.message());
        } else {
            file_kept_ = false;
        }
    }
}

std::optional<std::filesystem::path> BuildLog::log_path() const {
    if (file_kept_) {
        return options_.file;
    }
    return std::nullopt;
}

} // namespace hframe
