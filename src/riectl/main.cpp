// EN: riectl - command line front end for the relic curation session
// FR: riectl - interface en ligne de commande pour la session de curation de reliques

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "relic/errors.hpp"
#include "relic/relic_session.hpp"
#include "relic/session_options.hpp"
#include "relic/text_similarity.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* RIECTL_VERSION = "1.0.0";

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FAILURE_IO = 2;

// EN: Raised for bad command lines, reported with the usage text
// FR: Levée pour une ligne de commande invalide, rapportée avec l'aide
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLine {
    std::string config_file;
    std::string log_level;
    std::string log_file;
    std::string command;
    std::vector<std::string> positionals;
    std::map<std::string, std::string> options;
    bool help{false};
    bool version{false};
};

void printUsage(std::ostream& out) {
    out << "Usage: riectl [--config FILE] [--log-level LEVEL] [--log-file FILE] COMMAND ..." << std::endl;
    out << std::endl;
    out << "Commands:" << std::endl;
    out << "  import CSV [--export OUT.json] [--save OUT.rproj]   Import a relic table" << std::endl;
    out << "  export PROJECT --out OUT.json                       Export a project as JSON" << std::endl;
    out << "  set PROJECT --ids 1,2 --field FIELD [--value V]     Edit a field (no value clears)" << std::endl;
    out << "  sort PROJECT --column COLUMN                        Sort (repeat to reverse)" << std::endl;
    out << "  reconcile PROJECT                                   Re-run standardize, merge and autofill" << std::endl;
    out << "  info PROJECT                                        Print project summary" << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  --config FILE       YAML configuration file" << std::endl;
    out << "  --log-level LEVEL   DEBUG, INFO, WARN or ERROR" << std::endl;
    out << "  --log-file FILE     Write logs to FILE instead of stdout" << std::endl;
    out << "  --help, --version" << std::endl;
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cli;
    auto takeValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--version" || arg == "-v") {
            cli.version = true;
        } else if (arg == "--config") {
            cli.config_file = takeValue(i, arg);
        } else if (arg == "--log-level") {
            cli.log_level = takeValue(i, arg);
        } else if (arg == "--log-file") {
            cli.log_file = takeValue(i, arg);
        } else if (arg.rfind("--", 0) == 0) {
            if (cli.command.empty()) {
                throw UsageError("Unknown option: " + arg);
            }
            cli.options[arg.substr(2)] = takeValue(i, arg);
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else {
            cli.positionals.push_back(arg);
        }
    }
    return cli;
}

std::string requireOption(const CommandLine& cli, const std::string& name) {
    auto it = cli.options.find(name);
    if (it == cli.options.end() || it->second.empty()) {
        throw UsageError(cli.command + " requires --" + name);
    }
    return it->second;
}

std::string optionOr(const CommandLine& cli, const std::string& name, const std::string& fallback) {
    auto it = cli.options.find(name);
    return it == cli.options.end() ? fallback : it->second;
}

const std::string& requirePositional(const CommandLine& cli, const std::string& what) {
    if (cli.positionals.size() != 1) {
        throw UsageError(cli.command + " expects exactly one " + what);
    }
    return cli.positionals.front();
}

void rejectUnknownOptions(const CommandLine& cli, const std::vector<std::string>& allowed) {
    for (const auto& [name, value] : cli.options) {
        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
            throw UsageError("Unknown option for " + cli.command + ": --" + name);
        }
    }
}

std::vector<std::int64_t> parseIds(const std::string& text) {
    std::vector<std::int64_t> ids;
    std::istringstream stream(text);
    std::string piece;
    while (std::getline(stream, piece, ',')) {
        piece = RIE::TextSimilarity::trim(piece);
        if (piece.empty()) {
            continue;
        }
        try {
            size_t consumed = 0;
            long long id = std::stoll(piece, &consumed);
            if (consumed != piece.size()) {
                throw UsageError("Invalid record id: " + piece);
            }
            ids.push_back(id);
        } catch (const std::logic_error&) {
            throw UsageError("Invalid record id: " + piece);
        }
    }
    if (ids.empty()) {
        throw UsageError("--ids needs at least one record id");
    }
    return ids;
}

RIE::SessionOptions configure(const CommandLine& cli) {
    auto& config = RIE::ConfigManager::getInstance();
    config.addValidationRules(RIE::sessionValidationRules());

    if (!cli.config_file.empty() && !config.loadFromFile(cli.config_file)) {
        throw RIE::ParseError("Cannot load configuration file: " + cli.config_file);
    }
    config.loadEnvironmentOverrides("RIE_");
    if (!cli.log_level.empty()) {
        config.set("logging", "level", RIE::ConfigValue(cli.log_level));
    }
    if (!cli.log_file.empty()) {
        config.set("logging", "file", RIE::ConfigValue(cli.log_file));
    }

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::string joined;
        for (const auto& error : errors) {
            joined += (joined.empty() ? "" : "; ") + error;
        }
        throw UsageError("Invalid configuration: " + joined);
    }

    RIE::SessionOptions options = RIE::loadSessionOptions(config);

    auto& logger = RIE::Logger::getInstance();
    if (auto level = RIE::parseLogLevel(options.logLevel)) {
        logger.setLogLevel(*level);
    }
    if (!options.logFile.empty() && !logger.setOutputFile(options.logFile)) {
        throw RIE::ParseError("Cannot open log file: " + options.logFile);
    }
    return options;
}

int runImport(const CommandLine& cli, RIE::RelicSession& session) {
    rejectUnknownOptions(cli, {"export", "save"});
    const std::string& csv_path = requirePositional(cli, "CSV file");

    RIE::ImportSummary summary = session.importCsvFile(csv_path);
    std::cout << "Imported " << summary.importedCount << " relics, skipped "
              << summary.skippedCount << " rows (" << session.getRecords().size()
              << " after merging)" << std::endl;

    std::string export_path = optionOr(cli, "export", "");
    if (!export_path.empty()) {
        session.exportToFile(export_path);
        std::cout << "Exported data to " << export_path << std::endl;
    }
    std::string save_path = optionOr(cli, "save", "");
    if (!save_path.empty()) {
        session.saveSnapshot(save_path);
        std::cout << "Project saved to " << save_path << std::endl;
    }
    return EXIT_OK;
}

int runExport(const CommandLine& cli, RIE::RelicSession& session) {
    rejectUnknownOptions(cli, {"out"});
    const std::string& project = requirePositional(cli, "project file");
    std::string out = requireOption(cli, "out");

    session.loadSnapshot(project);
    session.exportToFile(out);
    std::cout << "Exported " << session.getRecords().size() << " relics to " << out << std::endl;
    return EXIT_OK;
}

int runSet(const CommandLine& cli, RIE::RelicSession& session) {
    rejectUnknownOptions(cli, {"ids", "field", "value"});
    const std::string& project = requirePositional(cli, "project file");
    std::vector<std::int64_t> ids = parseIds(requireOption(cli, "ids"));
    std::string field = requireOption(cli, "field");
    std::string value = optionOr(cli, "value", "");

    session.loadSnapshot(project);
    size_t updated = 0;
    try {
        updated = session.setField(ids, field, value);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
    session.saveSnapshot(project);
    std::cout << "Updated " << field << " on " << updated << " rows" << std::endl;
    return EXIT_OK;
}

int runSort(const CommandLine& cli, RIE::RelicSession& session) {
    rejectUnknownOptions(cli, {"column"});
    const std::string& project = requirePositional(cli, "project file");
    std::string column = requireOption(cli, "column");

    session.loadSnapshot(project);
    try {
        session.sortBy(column);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
    session.saveSnapshot(project);
    std::cout << "Sorted by " << *session.getSortColumn()
              << (session.isSortReversed() ? " (descending)" : " (ascending)") << std::endl;
    return EXIT_OK;
}

int runReconcile(const CommandLine& cli, RIE::RelicSession& session) {
    rejectUnknownOptions(cli, {});
    const std::string& project = requirePositional(cli, "project file");

    session.loadSnapshot(project);
    size_t renamed = session.standardizeNames();
    RIE::MergeStatistics merged = session.mergeDuplicates();
    RIE::AutofillStatistics filled = session.autofillGroups();
    session.saveSnapshot(project);

    std::cout << "Standardized " << renamed << " names, merged " << merged.totalMerges()
              << " records, labelled " << filled.groupsLabelled << " level groups" << std::endl;
    return EXIT_OK;
}

int runInfo(const CommandLine& cli, RIE::RelicSession& session) {
    rejectUnknownOptions(cli, {});
    const std::string& project = requirePositional(cli, "project file");

    session.loadSnapshot(project);
    const RIE::Dataset& dataset = session.getDataset();
    std::cout << "Records:        " << dataset.records.size() << std::endl;
    std::cout << "Next id:        " << dataset.nextId << std::endl;
    std::cout << "Sort:           " << session.getSortColumn().value_or("(none)")
              << (session.isSortReversed() ? " desc" : "") << std::endl;
    for (const char* field : {"category", "displayGroup", "levelGroup", "level", "stacks"}) {
        const auto& used = session.getUsedValues(field);
        std::cout << "Used " << field << ": ";
        bool first = true;
        for (const auto& value : used) {
            std::cout << (first ? "" : ", ") << value;
            first = false;
        }
        std::cout << std::endl;
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    try {
        cli = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "riectl: " << e.what() << std::endl;
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (cli.version) {
        std::cout << "riectl " << RIECTL_VERSION << std::endl;
        return EXIT_OK;
    }
    if (cli.help || cli.command.empty()) {
        printUsage(cli.help ? std::cout : std::cerr);
        return cli.help ? EXIT_OK : EXIT_USAGE;
    }

    auto& logger = RIE::Logger::getInstance();
    logger.setCorrelationId(logger.generateCorrelationId());

    try {
        RIE::RelicSession session(configure(cli));
        LOG_DEBUG("riectl", "Running command: " + cli.command);

        int status = EXIT_USAGE;
        if (cli.command == "import") {
            status = runImport(cli, session);
        } else if (cli.command == "export") {
            status = runExport(cli, session);
        } else if (cli.command == "set") {
            status = runSet(cli, session);
        } else if (cli.command == "sort") {
            status = runSort(cli, session);
        } else if (cli.command == "reconcile") {
            status = runReconcile(cli, session);
        } else if (cli.command == "info") {
            status = runInfo(cli, session);
        } else {
            throw UsageError("Unknown command: " + cli.command);
        }
        logger.flush();
        return status;
    } catch (const UsageError& e) {
        std::cerr << "riectl: " << e.what() << std::endl;
        printUsage(std::cerr);
        return EXIT_USAGE;
    } catch (const RIE::FormatError& e) {
        LOG_ERROR("riectl", std::string("Invalid project file: ") + e.what());
        std::cerr << "riectl: invalid project file: " << e.what() << std::endl;
    } catch (const RIE::ParseError& e) {
        LOG_ERROR("riectl", std::string("Parse failure: ") + e.what());
        std::cerr << "riectl: " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
        LOG_ERROR("riectl", std::string("I/O failure: ") + e.what());
        std::cerr << "riectl: " << e.what() << std::endl;
    }
    logger.flush();
    return EXIT_FAILURE_IO;
}
