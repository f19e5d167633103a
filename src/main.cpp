#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "Clients/BinanceClient.hpp"
#include "Clients/BinanceWSClient.hpp"
#include "Console/CommandInterpreter.hpp"
#include "Console/CommandParser.hpp"
#include "Console/ConsoleOutput.hpp"
#include "Session/LiveSessionManager.hpp"
#include "Session/QueryResolver.hpp"
#include "Utils/Config.hpp"
#include "Utils/QuestDBLogger.hpp"
#include "Utils/StreamLogger.hpp"
#include "Utils/TimeLogger.hpp"

namespace {

std::string config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.starts_with("--config=")) {
            return std::string(arg.substr(9));
        }
    }
    return "appsettings.json";
}

// QuestDB wins over the stderr sink when both are configured.
std::unique_ptr<ILogger> make_logger(const LoggingSettings& settings) {
    if (!settings.questdb_url.empty()) {
        return std::make_unique<QuestDBLogger>(settings.questdb_url);
    }
    if (settings.timing) {
        return std::make_unique<StreamLogger>(std::cerr);
    }
    return nullptr;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const AppConfig config = load_config(config_path(argc, argv));

        BinanceClient api(config.api, config.user);
        ConsoleOutput output(std::cout, config.console.default_symbol, config.console.default_limit);
        BinanceWSClient streams(api, config.api);
        LiveSessionManager sessions(streams, output, LiveSessionManager::Options{config.console.stop_timeout});
        QueryResolver resolver(sessions, api);
        CommandInterpreter interpreter(api, sessions, resolver, output, config.console);
        const std::unique_ptr<ILogger> logger = make_logger(config.logging);

        if (!api.has_credentials()) {
            output.api_notice();
        }
        output.help();

        std::string line;
        while (std::getline(std::cin, line)) {
            CommandResult result;
            {
                std::optional<TimeLogger> timer;
                if (logger) {
                    const Command cmd = parse_line(line);
                    if (!cmd.empty()) timer.emplace(*logger, lowercase(cmd.verb));
                }
                result = interpreter.execute(line);
            }

            if (result.status == CommandStatus::Quit) break;
            output.report(result, line);
        }

        sessions.stop();
    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
