// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server/logging_init.h"

#include "core/logging.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace server {

LogSettings LogSettings::from_config(const core::Config& config) {
    LogSettings out;
    out.level = core::parse_log_level(
        config.get_or(core::CONF_LOGLEVEL, "info"), core::LogLevel::INFO);
    if (config.has(core::CONF_DEBUG)) {
        std::string cats = config.get_or(core::CONF_DEBUG, "");
        if (cats == "1") cats = "all";
        out.categories = core::parse_log_categories(cats);
        if (out.level > core::LogLevel::DEBUG) {
            out.level = core::LogLevel::DEBUG;
        }
    }
    out.file = config.get_or(core::CONF_LOGFILE, "");
    out.print_to_console = config.get_bool(core::CONF_PRINTTOCONSOLE, true);
    return out;
}

core::Result<void> init_logging(const LogSettings& settings) {
    auto& logger = core::Logger::instance();

    logger.set_level(settings.level);
    logger.set_categories(settings.categories);
    logger.set_print_to_console(settings.print_to_console);

    if (!settings.file.empty()) {
        const auto& log_path = settings.file;

        if (log_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(log_path.parent_path(), ec);
            if (ec) {
                return core::make_error(
                    core::ErrorCode::CONFIG_ERROR,
                    "cannot create log directory '" +
                    log_path.parent_path().string() + "': " + ec.message());
            }
        }

        rotate_log_file(log_path, MAX_LOG_FILE_SIZE);

        if (!logger.set_log_file(log_path)) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "cannot open log file '" +
                                    log_path.string() + "'");
        }
        logger.set_print_to_file(true);
    }

    LOG_DEBUG(core::LogCategory::CONFIG,
              std::string("Logging at level ") +
              std::string(core::log_level_string(settings.level)));
    return core::make_ok();
}

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    std::error_code ec;
    auto size = std::filesystem::file_size(log_path, ec);
    if (ec || size < max_size) {
        return false;
    }

    std::filesystem::path rotated_path = log_path;
    rotated_path += ".1";

    std::filesystem::remove(rotated_path, ec);
    if (ec) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "Failed to remove old rotated log: " +
                 rotated_path.string());
    }

    std::filesystem::rename(log_path, rotated_path, ec);
    if (ec) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "Failed to rotate log file: " + log_path.string() +
                 " (" + ec.message() + ")");
        return false;
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "Rotated log file: " + log_path.string() + " -> " +
             rotated_path.string() + " (was " +
             std::to_string(size / (1024 * 1024)) + " MB)");
    return true;
}

} // namespace server
