#include "nego_config.hpp"
#include "nego_errors.hpp"
#include "nego_logger.hpp"
#include "nego_observer.hpp"
#include "nego_positions.hpp"
#include "nego_suite.hpp"
#include "nego_writer.hpp"

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <algorithm>
#include <stdexcept>

using namespace nego;

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<int(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<int(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - negotiation header layout\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static int parse_int(const std::string& s, const std::string& what) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw ContractViolation("invalid " + what + ": " + s);
    }
    if (used != s.size()) throw ContractViolation("invalid " + what + ": " + s);
    return v;
}

// Positional args, skipping --option value pairs
static std::vector<std::string> positionals(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        out.push_back(args[i]);
    }
    return out;
}

static SuitePtr require_suite(const SuiteRegistry& reg, const std::string& name) {
    SuitePtr s = reg.find(name);
    if (!s) throw ContractViolation("unknown ciphersuite: " + name);
    return s;
}

static void load_config(const std::vector<std::string>& args) {
    Config& cfg = Config::instance();
    std::string path = get_option(args, "--config");
    if (!path.empty() && !cfg.loadFromFile(path)) {
        throw std::runtime_error("cannot read config file " + path);
    }
    if (!apply_logging_config(cfg)) {
        std::cerr << "[!] Cannot open log file " << cfg.get("log.file") << "\n";
    }
}

// ============================================================================
// Handlers
// ============================================================================

static int handle_suites(const std::vector<std::string>&) {
    auto reg = SuiteRegistry::with_standard_suites();
    for (const auto& s : reg.all()) {
        std::cout << std::left << std::setw(32) << s->name()
                  << " point " << s->point_len() << " bytes\n";
    }
    return 0;
}

static int handle_positions(const std::vector<std::string>& args) {
    auto pos = positionals(args);
    if (pos.size() != 2) {
        std::cerr << "Usage: nego-layout positions <suite> <levels>\n";
        return 1;
    }
    auto reg = SuiteRegistry::with_standard_suites();
    SuitePositions sp = derive_positions(require_suite(reg, pos[0]), parse_int(pos[1], "levels"));

    std::cout << "Suite " << sp.suite->name() << " positions:\n";
    for (int i = 0; i < sp.levels(); ++i) {
        std::cout << "  " << i << ": tag " << std::hex << std::setw(8) << std::setfill('0')
                  << sp.tags[i] << std::dec << std::setfill(' ')
                  << " idx " << sp.slot_index(i) << "/" << SuitePositions::slots_at(i)
                  << " pos " << sp.offsets[i] << "\n";
    }
    std::cout << "max " << sp.max << "\n";
    return 0;
}

static int handle_layout(const std::vector<std::string>& args) {
    load_config(args);
    Config& cfg = Config::instance();
    auto reg = SuiteRegistry::with_standard_suites();

    // <suite>[:<levels>] on the command line, else suites from config
    std::vector<SuiteLevel> suites;
    for (const auto& arg : positionals(args)) {
        auto colon = arg.find(':');
        std::string name = arg.substr(0, colon);
        int levels = colon == std::string::npos
            ? cfg.levelsFor(name)
            : parse_int(arg.substr(colon + 1), "levels for " + name);
        suites.push_back(SuiteLevel{require_suite(reg, name), levels});
    }
    if (suites.empty()) suites = cfg.configuredSuites(reg);

    int entry_len = parse_int(get_option(args, "--entry-len",
                                         std::to_string(cfg.getInt("layout.entry_len", 64))),
                              "entry length");
    if (entry_len <= 0) throw ContractViolation("entry length must be positive");

    PlannerOptions opts;
    opts.derive_workers = static_cast<size_t>(std::max(1, cfg.getInt("layout.derive_workers", 1)));

    LoggingObserver observer;
    Writer writer(observer, opts);
    size_t hdrlen = writer.init(suites, static_cast<size_t>(entry_len), {});

    std::cout << "header length " << hdrlen << " bytes\n";
    for (const auto& p : writer.layout().placements) {
        std::cout << "  " << std::left << std::setw(32) << p.suite->name()
                  << " level " << p.level
                  << " offset " << p.offset
                  << " len " << p.length << "\n";
    }
    return 0;
}

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    ArgumentParser parser("nego-layout", "v0.3.0");

    parser.add_command("suites", "List built-in ciphersuites", handle_suites);
    parser.add_command("positions", "Show candidate point positions of a suite", handle_positions,
                       {"<suite>", "<levels>"});
    parser.add_command("layout", "Compute a negotiation header layout", handle_layout,
                       {"[<suite>[:<levels>]...]", "[--config FILE]", "[--entry-len N]"});

    try {
        return parser.parse_and_execute(argc, argv);
    } catch (const PlacementExhausted& e) {
        std::cerr << "[-] " << e.what() << "\n";
    } catch (const ContractViolation& e) {
        std::cerr << "[-] " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[-] Error: " << e.what() << "\n";
    }
    return 1;
}
