#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization.
//
// LogSettings holds the logging keys of a core::Config: level threshold,
// enabled categories, an optional log file (rotated once it grows past
// MAX_LOG_FILE_SIZE) and console (stderr) output.  init_logging() applies
// them to the global Logger singleton.
// ---------------------------------------------------------------------------

#ifndef PKARR_SERVER_LOGGING_INIT_H
#define PKARR_SERVER_LOGGING_INIT_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace server {

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 50 * 1024 * 1024;  // 50 MB

struct LogSettings {
    core::LogLevel        level      = core::LogLevel::INFO;
    uint32_t              categories = static_cast<uint32_t>(core::LogCategory::ALL);
    std::filesystem::path file;      // empty: no file sink
    bool                  print_to_console = true;

    /// Read -loglevel, -debug, -logfile and -printtoconsole.  A bare -debug
    /// enables every category and lowers the level to DEBUG.
    static LogSettings from_config(const core::Config& config);
};

/// Apply @p settings to the global logger.  Fails with CONFIG_ERROR if the
/// log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const LogSettings& settings);

/// Rename @p log_path to "<log_path>.1" if it is at least @p max_size bytes.
/// Any previous ".1" file is replaced.
/// @returns true if rotation was performed.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

} // namespace server

#endif // PKARR_SERVER_LOGGING_INIT_H
