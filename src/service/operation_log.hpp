/**
 * @file    operation_log.hpp
 * @brief   CSV audit trail of service operations
 * @license MIT
 *
 * @details
 * One row per operation in a daily file <log_dir>/dualmark_YYYY-MM-DD.csv:
 *
 *   timestamp,operation,description,status,error,processing_ms,extra
 *
 * `status` is "ok" or an error kind tag, `extra` a JSON object. Keys are
 * never written. A failure to log is reported through spdlog and never
 * interrupts the operation being logged.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace dmt {

inline constexpr const char* kCsvHeader =
    "timestamp,operation,description,status,error,processing_ms,extra\n";

struct OperationRecord {
    std::string operation;          // "embed_image", "attack", ...
    std::string description;
    std::string status = "ok";
    std::string error;
    double processing_ms = 0.0;
    nlohmann::json extra = nlohmann::json::object();
};

class OperationLog {
public:
    /**
     * @param log_dir  Directory for the daily CSV files; empty disables the log
     */
    explicit OperationLog(const std::filesystem::path& log_dir);

    void record(const OperationRecord& rec) noexcept;

    bool enabled() const noexcept { return static_cast<bool>(logger_); }

    /**
     * Quote a CSV field if it contains a comma, quote or line break
     */
    static std::string csv_field(std::string_view value);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace dmt
