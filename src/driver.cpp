#include "stamp/driver.hpp"

#include "stamp/artifact_cache.hpp"
#include "stamp/cache_validity.hpp"
#include "stamp/filesystem.hpp"
#include "stamp/graph.hpp"
#include "stamp/manifest.hpp"
#include "stamp/mmap.hpp"
#include "stamp/report.hpp"

#include <format>
#include <iostream>
#include <nlohmann/json.hpp>
#include <print>

#ifndef STAMP_PROJ_VER
#define STAMP_PROJ_VER "unknown"
#endif

namespace stamp {

namespace {

Result<void> load_keyed_graph(const StampConfig &config, const FileSystem &fs, Log &log, RuleGraph &graph) {
    if (auto res = parse_manifest(graph, config.manifest); !res) {
        return std::unexpected(std::format("Failed to parse {}: {}", config.manifest, res.error()));
    }
    return graph.compute_rule_keys(fs, &log);
}

Result<nlohmann::json> load_report(const std::string &path) {
    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    try {
        return nlohmann::json::parse(file->content());
    } catch (const nlohmann::json::exception &err) {
        return std::unexpected(std::format("Malformed report {}: {}", path, err.what()));
    }
}

Result<int> cmd_keys(const StampConfig &config, std::ostream &out, Log &log) {
    RealFileSystem fs;
    RuleGraph graph;
    if (auto res = load_keyed_graph(config, fs, log, graph); !res) {
        return std::unexpected(res.error());
    }

    if (config.json) {
        std::println(out, "{}", make_key_report(graph, config.mangle).dump(4));
        return 0;
    }
    for (const auto &node : graph.nodes()) {
        std::println(out, "{}  {}", node.rule->rule_key().to_string(config.mangle), node.rule->name());
    }
    return 0;
}

Result<int> cmd_status(const StampConfig &config, std::ostream &out, Log &log) {
    RealFileSystem fs;
    RuleGraph graph;
    if (auto res = load_keyed_graph(config, fs, log, graph); !res) {
        return std::unexpected(res.error());
    }

    DirectoryArtifactCache cache(config.cache_dir);
    CacheValidityOracle oracle(cache, fs, log);

    nlohmann::json report = nlohmann::json::object();
    for (const auto &node : graph.nodes()) {
        const BuildRule &rule = *node.rule;
        CacheVerdict verdict = check_cache_validity(oracle, rule);
        if (config.json) {
            report[rule.name()] = {{"self_cached", verdict.self_cached},
                                   {"inputs_valid", verdict.inputs_valid},
                                   {"has_uncached_descendants", verdict.has_uncached_descendants},
                                   {"decision", verdict.can_skip() ? "skip" : "rebuild"}};
        } else {
            std::println(out,
                         "{:<8} cached={:d} inputs={:d} uncached-deps={:d}  {}",
                         verdict.can_skip() ? "skip" : "rebuild",
                         verdict.self_cached,
                         verdict.inputs_valid,
                         verdict.has_uncached_descendants,
                         rule.name());
        }
    }
    if (config.json) {
        std::println(out, "{}", report.dump(4));
    }
    return 0;
}

Result<int> cmd_store(const StampConfig &config, const std::vector<std::string> &operands, Log &log) {
    if (operands.size() != 2) {
        return std::unexpected("usage: stamp store <rule> <artifact-file>");
    }
    RealFileSystem fs;
    RuleGraph graph;
    if (auto res = load_keyed_graph(config, fs, log, graph); !res) {
        return std::unexpected(res.error());
    }

    const BuildRule *rule = graph.find(operands[0]);
    if (!rule) {
        return std::unexpected(std::format("No such rule: {}", operands[0]));
    }
    auto bytes = fs.read_bytes(operands[1]);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    auto metadata = capture_metadata(*rule, fs);
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    DirectoryArtifactCache cache(config.cache_dir);
    if (auto res = cache.store(rule->rule_key(), *bytes, *metadata); !res) {
        return std::unexpected(res.error());
    }
    log.info("stored {} as {}", rule->name(), rule->rule_key().to_string());
    return 0;
}

Result<int> cmd_diff(const std::vector<std::string> &operands, std::ostream &out) {
    if (operands.size() != 2) {
        return std::unexpected("usage: stamp diff <before.json> <after.json>");
    }
    auto before = load_report(operands[0]);
    if (!before) {
        return std::unexpected(before.error());
    }
    auto after = load_report(operands[1]);
    if (!after) {
        return std::unexpected(after.error());
    }
    auto diffs = diff_key_reports(*before, *after);
    if (!diffs) {
        return std::unexpected(diffs.error());
    }
    for (const auto &d : *diffs) {
        std::println(out, "{}: {} -> {}", d.rule, d.before.value_or("(absent)"), d.after.value_or("(absent)"));
    }
    return diffs->empty() ? 0 : 2;
}

} // namespace

void print_help(std::ostream &out) {
    std::println(out, "Usage: stamp [options] <command> [operands]");
    std::println(out, "Commands:");
    std::println(out, "  keys                   Print the rule key of every rule");
    std::println(out, "  status                 Print the cache verdict of every rule");
    std::println(out, "  store <rule> <file>    Store <file> as the cached artifact of <rule>");
    std::println(out, "  diff <a.json> <b.json> Compare two key reports produced by 'keys --json'");
    std::println(out, "Options:");
    std::println(out, "  -h, --help             Show this help message");
    std::println(out, "  -v, --version          Show version");
    std::println(out, "  -d <dir>               Change working directory before doing anything");
    std::println(out, "  -f <file>              Use <file> as the rule manifest (default: stamp.json)");
    std::println(out, "  -c, --cache-dir <dir>  Artifact cache directory (default: .stamp-cache)");
    std::println(out, "  --mangle               Render non-idempotent keys with 'y' instead of 'x'");
    std::println(out, "  --json                 Emit JSON instead of text");
    std::println(out, "  --trace                Log how every rule key was assembled");
    std::println(out, "  -q, --quiet            Suppress warnings");
}

Result<Invocation> parse_command_line(int argc, const char *const *argv) {
    Invocation inv;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> Result<std::string> {
            if (i + 1 >= argc) {
                return std::unexpected(std::format("Missing argument for {}", arg));
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            inv.command = Command::HELP;
            return inv;
        } else if (arg == "-v" || arg == "--version") {
            inv.command = Command::VERSION;
            return inv;
        } else if (arg == "-d") {
            auto v = next();
            if (!v)
                return std::unexpected(v.error());
            inv.config.work_dir = *v;
        } else if (arg == "-f") {
            auto v = next();
            if (!v)
                return std::unexpected(v.error());
            inv.config.manifest = *v;
        } else if (arg == "-c" || arg == "--cache-dir") {
            auto v = next();
            if (!v)
                return std::unexpected(v.error());
            inv.config.cache_dir = *v;
        } else if (arg == "--mangle") {
            inv.config.mangle = true;
        } else if (arg == "--json") {
            inv.config.json = true;
        } else if (arg == "--trace") {
            inv.config.verbosity = Verbosity::TRACE;
        } else if (arg == "-q" || arg == "--quiet") {
            inv.config.verbosity = Verbosity::QUIET;
        } else if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown argument: {}", arg));
        } else if (!have_command) {
            if (arg == "keys") {
                inv.command = Command::KEYS;
            } else if (arg == "status") {
                inv.command = Command::STATUS;
            } else if (arg == "store") {
                inv.command = Command::STORE;
            } else if (arg == "diff") {
                inv.command = Command::DIFF;
            } else {
                return std::unexpected(std::format("Unknown command: {}", arg));
            }
            have_command = true;
        } else {
            inv.operands.emplace_back(arg);
        }
    }

    if (!have_command) {
        return std::unexpected("No command given");
    }
    return inv;
}

int run(const Invocation &invocation, std::ostream &out, Log &log) {
    const StampConfig &config = invocation.config;
    Result<int> res = 0;

    switch (invocation.command) {
    case Command::HELP:
        print_help(out);
        return 0;
    case Command::VERSION:
        std::println(out, "stamp {}", STAMP_PROJ_VER);
        return 0;
    case Command::KEYS:
        res = cmd_keys(config, out, log);
        break;
    case Command::STATUS:
        res = cmd_status(config, out, log);
        break;
    case Command::STORE:
        res = cmd_store(config, invocation.operands, log);
        break;
    case Command::DIFF:
        res = cmd_diff(invocation.operands, out);
        break;
    }

    if (!res) {
        std::println(std::cerr, "{}", res.error());
        return 1;
    }
    return *res;
}

} // namespace stamp
