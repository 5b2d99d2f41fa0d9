#include "stamp/driver.hpp"
#include "stamp/log.hpp"

#include <filesystem>
#include <iostream>
#include <print>

int main(const int argc, const char *const *argv) {
    auto invocation = stamp::parse_command_line(argc, argv);
    if (!invocation) {
        std::println(std::cerr, "{}", invocation.error());
        stamp::print_help(std::cerr);
        return 1;
    }

    const auto &work_dir = invocation->config.work_dir;
    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    stamp::Log log(invocation->config.verbosity);
    return stamp::run(*invocation, std::cout, log);
}
