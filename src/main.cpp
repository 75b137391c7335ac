/// @file src/main.cpp
/// @brief efe CLI entry point.
///
/// Usage:
///   efe --serve [options]        Run the HTTP service
///   efe --calc '<json body>'     Evaluate one request body and print the response
///   efe --stream                 Evaluate one JSON request body per stdin line
///   efe --help                   Print usage

#include "efe/cache.hpp"
#include "efe/config.hpp"
#include "efe/dispatcher.hpp"
#include "efe/http.hpp"
#include "efe/log.hpp"
#include "efe/routes.hpp"

#include <drogon/HttpAppFramework.h>

#include <fmt/core.h>

#include <iostream>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  efe --serve [options]        Run the HTTP service\n"
        "  efe --calc '<json body>'     Evaluate one request body\n"
        "  efe --stream                 Evaluate one JSON body per stdin line\n"
        "  efe --help                   Show this help\n"
        "\n"
        "Options:\n"
        "  --host <addr>                Listen address (default 0.0.0.0)\n"
        "  --port <n>                   Listen port (default 8000)\n"
        "  --cache-capacity <n>         Memoized results kept (default 100)\n"
        "  --log-level <level>          debug, info, warn, error or off\n"
        "  --strict                     Answer unimplemented types with 501\n"
        "\n"
        "Request body:\n"
        "  {{\"type\": \"schwarzschild\", \"inputs\": {{\"mass\": 1, \"radius\": 10}}}}\n"
        "\n"
        "Environment: EFE_HOST, EFE_PORT, EFE_CACHE_CAPACITY, EFE_MAX_BODY_BYTES,\n"
        "             EFE_IDLE_TIMEOUT_S, EFE_REJECT_UNIMPLEMENTED, EFE_LOG_LEVEL\n"
    );
}

/// Layer environment and flags argv[first..] over the defaults.
/// Returns false on any invalid value.
bool load_config(efe::ServiceConfig& cfg, int argc, char* argv[], int first) {
    if (!efe::apply_env_overrides(cfg, efe::process_env())) {
        return false;
    }
    for (int i = first; i < argc; ++i) {
        const std::string_view flag(argv[i]);
        if (efe::is_switch_flag(flag)) {
            if (!efe::apply_cli_flag(cfg, flag, {})) return false;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return false;
        }
        if (!efe::apply_cli_flag(cfg, flag, argv[++i])) {
            return false;
        }
    }
    efe::log::set_level(cfg.log_level);
    return true;
}

/// Print one handler response body. Returns 0 for 2xx, 1 otherwise.
int emit(const efe::http::HttpResponse& response) {
    fmt::print("{}\n", response.body);
    return (response.status >= 200 && response.status < 300) ? 0 : 1;
}

int run_serve(const efe::ServiceConfig& cfg) {
    efe::cache::FifoResultCache cache(cfg.cache_capacity);
    efe::dispatch::CalculationDispatcher dispatcher(
        cache, efe::dispatch::make_default_registry(),
        efe::dispatch::DispatcherConfig{.reject_unimplemented = cfg.reject_unimplemented});
    efe::http::RequestHandler handler(dispatcher);

    // drogon stops the loop on SIGINT and SIGTERM.
    auto& app = drogon::app();
    efe::server::configure(app, cfg);
    efe::server::register_routes(app, handler);
    app.run();
    return 0;
}

int run_calc(const efe::ServiceConfig& cfg, std::string_view body) {
    efe::cache::FifoResultCache cache(cfg.cache_capacity);
    efe::dispatch::CalculationDispatcher dispatcher(
        cache, efe::dispatch::make_default_registry(),
        efe::dispatch::DispatcherConfig{.reject_unimplemented = cfg.reject_unimplemented});
    efe::http::RequestHandler handler(dispatcher);

    return emit(handler.calculate(body));
}

/// One JSON request body per stdin line; all lines share one cache.
/// Returns 0 if every line succeeded, 1 otherwise.
int run_stream(const efe::ServiceConfig& cfg) {
    efe::cache::FifoResultCache cache(cfg.cache_capacity);
    efe::dispatch::CalculationDispatcher dispatcher(
        cache, efe::dispatch::make_default_registry(),
        efe::dispatch::DispatcherConfig{.reject_unimplemented = cfg.reject_unimplemented});
    efe::http::RequestHandler handler(dispatcher);

    std::string line;
    std::size_t count  = 0;
    std::size_t failed = 0;

    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        ++count;
        if (emit(handler.calculate(line)) != 0) {
            ++failed;
        }
    }

    const auto stats = cache.stats();
    efe::log::info("processed {} requests ({} failed), cache {}/{} hits={} misses={}",
                   count, failed, stats.entries, stats.capacity, stats.hits, stats.misses);
    return failed == 0 ? 0 : 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    efe::ServiceConfig cfg;

    if (mode == "--serve") {
        if (!load_config(cfg, argc, argv, 2)) return 1;
        return run_serve(cfg);
    }

    if (mode == "--calc") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --calc requires a JSON request body\n");
            print_usage();
            return 1;
        }
        if (!load_config(cfg, argc, argv, 3)) return 1;
        return run_calc(cfg, argv[2]);
    }

    if (mode == "--stream") {
        if (!load_config(cfg, argc, argv, 2)) return 1;
        return run_stream(cfg);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
