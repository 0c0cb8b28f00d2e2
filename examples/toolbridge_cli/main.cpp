/// toolbridge_cli: drive configured tool servers from the shell.
/// Usage:
///   toolbridge_cli <config.json> list [server]
///   toolbridge_cli <config.json> call <server> <tool> [arguments-json]
///   toolbridge_cli <config.json> task <task.json>
/// Results are printed to stdout as JSON; logs go to stderr (level from the
/// config's client.logLevel, overridden by SPDLOG_LEVEL).

#include <toolbridge/toolbridge.hpp>
#include <spdlog/cfg/env.h>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace toolbridge;

namespace {

int usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " <config.json> list [server]\n"
              << "  " << argv0 << " <config.json> call <server> <tool> [arguments-json]\n"
              << "  " << argv0 << " <config.json> task <task.json>\n";
    return 2;
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open '" + path + "'");
    std::stringstream ss;
    ss << in.rdbuf();
    auto doc = nlohmann::json::parse(ss.str(), nullptr, false);
    if (doc.is_discarded()) throw ConfigError("'" + path + "' is not valid JSON");
    return doc;
}

int list(Client& client, int argc, char* argv[]) {
    nlohmann::json out = nlohmann::json::object();
    if (argc > 3) {
        out[argv[3]] = client.discover(argv[3]);
    } else {
        for (auto& [server, tools] : client.discover_all()) out[server] = tools;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
}

int call(Client& client, int argc, char* argv[]) {
    if (argc < 5) return usage(argv[0]);
    nlohmann::json args = nlohmann::json::object();
    if (argc > 5) {
        args = nlohmann::json::parse(argv[5], nullptr, false);
        if (args.is_discarded()) {
            std::cerr << "arguments are not valid JSON\n";
            return 2;
        }
    }
    auto result = client.invoke(argv[3], argv[4], args);
    std::cout << nlohmann::json(result).dump(2) << "\n";
    return result.is_error ? 1 : 0;
}

int task(Client& client, const Config& config, int argc, char* argv[]) {
    if (argc < 4) return usage(argv[0]);
    auto t = parse_task(read_json_file(argv[3]));
    TaskManager manager(client, TaskManager::options_from(config.client));
    auto result = manager.run(t);
    std::cout << result.to_json().dump(2) << "\n";
    return result.ok() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) return usage(argv[0]);

    try {
        auto config = Config::load_file(argv[1]);
        if (!log::set_level(config.client.log_level)) {
            log::logger()->warn("unknown log level '{}'", config.client.log_level);
        }
        // SPDLOG_LEVEL, e.g. "debug" or "toolbridge=trace", overrides the file.
        spdlog::cfg::load_env_levels();

        Client client(config);
        const std::string command = argv[2];
        int rc;
        if (command == "list") {
            rc = list(client, argc, argv);
        } else if (command == "call") {
            rc = call(client, argc, argv);
        } else if (command == "task") {
            rc = task(client, config, argc, argv);
        } else {
            rc = usage(argv[0]);
        }
        client.shutdown();
        return rc;
    } catch (const Error& e) {
        std::cout << nlohmann::json{{"error", to_error_info(e)}}.dump(2) << "\n";
        log::logger()->error("{}", e.what());
        return 1;
    }
}
