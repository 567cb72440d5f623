// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"

// ctwallet_tests [Suite]
int main(int argc, char* argv[]) {
    core::Logger::instance().set_print_to_console(false);
    return test::run_all(argc > 1 ? argv[1] : "");
}
