#pragma once

// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <string>
#include <string_view>

namespace core {

/// Set the name of the calling thread (visible in debuggers, `top -H` and
/// log lines).  Names longer than 15 bytes are truncated.
void set_thread_name(std::string_view name);

/// Retrieve the name previously set for the calling thread.
/// Returns an empty string if no name was set or if the OS query fails.
std::string get_thread_name();

/// Return the number of logical CPU cores, at least 1.
int get_num_cores();

}  // namespace core
