/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <tessera/common/test.hpp>
#include <tessera/config.hpp>
#include <tessera/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace tessera;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    logger::info("run-test: alloc: {} host_io: {} half: {} legacy: {}",
        capabilities::alloc, capabilities::host_io, capabilities::half, capabilities::legacy);
    bool failed = true;
    const auto ex = logger::run_log_errors([&] {
        failed = boost::ut::cfg<boost::ut::override>.run();
    });
    if (failed || ex) {
        if (const auto last = logger::last_error())
            logger::info("run-test: the last logged error: {}", *last);
    }
    logger::info("run-test finished with {}", failed || ex ? "failures" : "success");
    return failed || ex ? 1 : 0;
}
