#include "authorizer.hpp"
#include "beast_requestor.hpp"
#include "config.hpp"
#include "models.hpp"
#include "session.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

struct Config {
    apicore::ClientConfig client;
    std::string           method = "GET";
    std::string           path   = "/api/v1/me";
    nlohmann::json        params = nlohmann::json::object();
    nlohmann::json        data   = nullptr;
    nlohmann::json        json   = nullptr;
};

static void printUsage() {
    std::cout
        << "Usage: apicore_cli [options]\n\n"
        << "Options:\n"
        << "  --method M        HTTP method                 (default: GET)\n"
        << "  --path P          Resource path               (default: /api/v1/me)\n"
        << "  --param K=V       Query parameter (repeatable)\n"
        << "  --data K=V        Form field (repeatable)\n"
        << "  --json TEXT       JSON request body\n"
        << "  --token T         Access token                (env: APICORE_ACCESS_TOKEN)\n"
        << "  --oauth-url URL   Base URL                    "
           "(default: https://oauth.reddit.com)\n"
        << "  --user-agent UA   Descriptive user agent      (env: APICORE_USER_AGENT)\n"
        << "  --timeout S       Per-request timeout in s    (default: 16)\n"
        << "  --retries N       Attempts per request        (default: 3)\n"
        << "  --verbose         Enable verbose diagnostics\n"
        << "  --help, -h        Show this message\n";
}

static void addPair(nlohmann::json& target, const std::string& arg) {
    auto equals = arg.find('=');
    if (equals == std::string::npos || equals == 0) {
        throw std::invalid_argument("expected KEY=VALUE, got: " + arg);
    }
    if (target.is_null()) {
        target = nlohmann::json::object();
    }
    target[arg.substr(0, equals)] = arg.substr(equals + 1);
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    cfg.client = apicore::loadConfigFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--method") && i + 1 < argc) {
            cfg.method = argv[++i];
        } else if ((arg == "--path") && i + 1 < argc) {
            cfg.path = argv[++i];
        } else if ((arg == "--param") && i + 1 < argc) {
            addPair(cfg.params, argv[++i]);
        } else if ((arg == "--data") && i + 1 < argc) {
            addPair(cfg.data, argv[++i]);
        } else if ((arg == "--json") && i + 1 < argc) {
            cfg.json = nlohmann::json::parse(argv[++i]);
        } else if ((arg == "--token") && i + 1 < argc) {
            cfg.client.accessToken = argv[++i];
        } else if ((arg == "--oauth-url") && i + 1 < argc) {
            cfg.client.oauthUrl = argv[++i];
        } else if ((arg == "--user-agent") && i + 1 < argc) {
            cfg.client.userAgent = argv[++i];
        } else if ((arg == "--timeout") && i + 1 < argc) {
            cfg.client.timeout = std::stod(argv[++i]);
        } else if ((arg == "--retries") && i + 1 < argc) {
            cfg.client.retries = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.client.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.client.verbose) {
            std::cerr
                << "=== apicore_cli " << apicore::kVersion << " ===\n"
                << "Request:    " << cfg.method << " " << cfg.path << "\n"
                << "Base URL:   " << cfg.client.oauthUrl << "\n"
                << "Timeout:    " << cfg.client.timeout << " s\n"
                << "Retries:    " << cfg.client.retries << "\n"
                << "====================\n\n";
        }

        auto requestor = std::make_shared<apicore::BeastRequestor>(cfg.client.userAgent,
                                                                   cfg.client.oauthUrl);
        requestor->setVerbose(cfg.client.verbose);

        auto authorizer = std::make_shared<apicore::StaticTokenAuthorizer>(
            requestor, cfg.client.accessToken);

        apicore::SessionOptions sessionOptions;
        sessionOptions.retries = cfg.client.retries;
        sessionOptions.verbose = cfg.client.verbose;
        apicore::Session session(authorizer, sessionOptions);

        apicore::RequestOptions options;
        options.params  = cfg.params;
        options.timeout = std::chrono::duration<double>(cfg.client.timeout);
        if (!cfg.data.is_null()) {
            options.data = cfg.data;
        }
        if (!cfg.json.is_null()) {
            options.json = cfg.json;
        }

        const auto result = session.request(cfg.method, cfg.path, options);
        session.close();

        if (result) {
            std::cout << result->dump(2) << "\n";
        } else {
            std::cout << "(no content)\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
