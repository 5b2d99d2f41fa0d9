#pragma once

#include "stamp/log.hpp"
#include "stamp/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace stamp {

struct StampConfig {
    std::string manifest = "stamp.json";
    std::filesystem::path cache_dir = ".stamp-cache";
    std::filesystem::path work_dir = ".";
    bool mangle = false;
    bool json = false;
    Verbosity verbosity = Verbosity::NORMAL;
};

enum class Command : uint8_t { HELP, VERSION, KEYS, STATUS, STORE, DIFF };

struct Invocation {
    Command command = Command::HELP;
    StampConfig config;
    std::vector<std::string> operands;
};

/// Parses `stamp [options] <command> [operands]`.
Result<Invocation> parse_command_line(int argc, const char *const *argv);

void print_help(std::ostream &out);

/**
 * @brief Runs a parsed invocation.
 * @return The process exit code: 0 on success, 1 on error, 2 when `diff` found differences.
 */
int run(const Invocation &invocation, std::ostream &out, Log &log);

} // namespace stamp
