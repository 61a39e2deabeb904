// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/thread.h"

#include <thread>

#include <pthread.h>

namespace core {

namespace {

// Empty for threads that never called set_thread_name().
thread_local std::string g_thread_name;

} // anonymous namespace

void set_thread_name(std::string_view name)
{
    // pthread_setname_np accepts at most 15 characters + NUL.
    constexpr size_t MAX_PTHREAD_NAME = 15;
    std::string truncated{name.substr(0, MAX_PTHREAD_NAME)};

#ifdef __APPLE__
    pthread_setname_np(truncated.c_str());
#else
    pthread_setname_np(pthread_self(), truncated.c_str());
#endif
    g_thread_name = std::move(truncated);
}

std::string get_thread_name()
{
    return g_thread_name;
}

int get_num_cores()
{
    unsigned n = std::thread::hardware_concurrency();
    return (n > 0) ? static_cast<int>(n) : 1;
}

}  // namespace core
