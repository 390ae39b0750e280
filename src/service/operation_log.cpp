/**
 * @file    operation_log.cpp
 * @brief   CSV audit trail implementation
 * @license MIT
 */

#include "service/operation_log.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cstdio>
#include <exception>
#include <system_error>

namespace dmt {

OperationLog::OperationLog(const std::filesystem::path& log_dir) {
    if (log_dir.empty()) {
        spdlog::debug("Operation log disabled");
        return;
    }

    try {
        std::filesystem::create_directories(log_dir);

        // New or empty files start with the column header
        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* file) {
            std::error_code ec;
            if (std::filesystem::file_size(filename, ec) == 0 && !ec) {
                std::fputs(kCsvHeader, file);
                std::fflush(file);
            }
        };

        // Rotates at midnight: dualmark_YYYY-MM-DD.csv
        auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            to_utf8(log_dir / "dualmark.csv"), 0, 0, false, 0, handlers);

        // Not registered globally: several services may log side by side
        logger_ = std::make_shared<spdlog::logger>("operations", std::move(sink));
        logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e,%v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::info);
    } catch (const std::exception& e) {
        spdlog::error("Operation log unavailable in {}: {}", log_dir, e.what());
        logger_.reset();
    }
}

std::string OperationLog::csv_field(std::string_view value) {
    if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(value);
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void OperationLog::record(const OperationRecord& rec) noexcept {
    if (!logger_) return;

    try {
        logger_->info("{},{},{},{},{:.2f},{}",
                      csv_field(rec.operation),
                      csv_field(rec.description),
                      csv_field(rec.status),
                      csv_field(rec.error),
                      rec.processing_ms,
                      csv_field(rec.extra.dump(-1, ' ', false,
                                                nlohmann::json::error_handler_t::replace)));
    } catch (const std::exception& e) {
        // Audit logging must not break the operation itself
        spdlog::warn("Operation log write failed: {}", e.what());
    }
}

}  // namespace dmt
