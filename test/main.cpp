// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"

#include <iostream>
#include <string_view>

int main(int argc, char* argv[]) {
    // Keep test output readable; failures are reported by the framework.
    core::Logger::instance().set_level(core::LogLevel::ERR);

    std::string_view filter = argc > 1 ? argv[1] : "";

    std::cout << "Pkarr Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    return test::run_all_tests(filter);
}
