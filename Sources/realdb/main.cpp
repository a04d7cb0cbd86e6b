// realdb - serve the query language over TCP, or run a query locally.

#include <RealDBCore.hpp>
#include "realdb/configuration.hpp"
#include "realdb/response.hpp"
#include "realdb/server.hpp"

#include <signal.h>
#include <pthread.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cout
        << "usage: " << argv0 << " [options]\n"
        << "\n"
        << "Serve:\n"
        << "  --config FILE      JSON configuration file\n"
        << "  --host HOST        IPv4 address to bind (default 127.0.0.1)\n"
        << "  --port PORT        TCP port (default 7878, 0 = any)\n"
        << "  --workers N        worker threads (default: hardware threads)\n"
        << "  --log-level LEVEL  off|error|warn|info|debug (default info)\n"
        << "\n"
        << "Run locally against an empty database:\n"
        << "  --file SCRIPT      execute the query in SCRIPT and print the response\n"
        << "  --eval QUERY       execute QUERY and print the response\n"
        << "  --dump             with --file/--eval, print the compiled program instead\n"
        << "\n"
        << "  --help             show this message\n";
}

struct options {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<long> port;
    std::optional<long> workers;
    std::optional<std::string> log_level;
    std::optional<std::string> script_path;
    std::optional<std::string> query;
    bool dump = false;
    bool help = false;
};

long parse_number(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    long n = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0') {
        throw realdb::config_error(flag + " expects a number, got `" + text + "`");
    }
    return n;
}

options parse_options(int argc, char** argv) {
    options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw realdb::config_error(arg + " expects a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--config") {
            opts.config_path = next();
        } else if (arg == "--host") {
            opts.host = next();
        } else if (arg == "--port") {
            opts.port = parse_number(arg, next());
        } else if (arg == "--workers") {
            opts.workers = parse_number(arg, next());
        } else if (arg == "--log-level") {
            opts.log_level = next();
        } else if (arg == "--file") {
            opts.script_path = next();
        } else if (arg == "--eval") {
            opts.query = next();
        } else if (arg == "--dump") {
            opts.dump = true;
        } else {
            throw realdb::config_error("unknown option: " + arg);
        }
    }
    if (opts.script_path && opts.query) {
        throw realdb::config_error("--file and --eval are mutually exclusive");
    }
    if (opts.dump && !opts.script_path && !opts.query) {
        throw realdb::config_error("--dump needs --file or --eval");
    }
    return opts;
}

realdb::configuration build_configuration(const options& opts) {
    realdb::configuration config;
    if (opts.config_path) {
        config = realdb::configuration::from_json_file(*opts.config_path);
    }
    if (opts.host) {
        config.host = *opts.host;
    }
    if (opts.port) {
        if (*opts.port < 0 || *opts.port > std::numeric_limits<uint16_t>::max()) {
            throw realdb::config_error("port out of range: " + std::to_string(*opts.port));
        }
        config.port = static_cast<uint16_t>(*opts.port);
    }
    if (opts.workers) {
        if (*opts.workers < 0) {
            throw realdb::config_error("--workers must not be negative");
        }
        config.worker_count = static_cast<size_t>(*opts.workers);
    }
    if (opts.log_level) {
        auto level = realdb::parse_log_level(*opts.log_level);
        if (!level) {
            throw realdb::config_error("unknown log level: " + *opts.log_level);
        }
        config.level = *level;
    }
    return config;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw realdb::config_error("cannot open script: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Run one query against a fresh database and print the JSON response.
int run_local(const std::string& text, bool dump) {
    realdb::database db;
    realdb::row_generator rows;
    try {
        realdb::program prog = realdb::compile(text, rows);
        if (dump) {
            std::cout << realdb::disassemble(prog);
            return 0;
        }
        auto handle = db.acquire();
        auto ids = realdb::execute(handle, prog);
        std::cout << realdb::render_records(handle, ids) << std::endl;
        return 0;
    } catch (const realdb::query_error& e) {
        std::cout << realdb::render_error(e.what()) << std::endl;
        return 1;
    }
}

int serve(const realdb::configuration& config) {
    // Block termination signals in every thread; the main thread waits for them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    realdb::database db;
    realdb::row_generator rows;
    realdb::tcp_server server(config, db, rows);
    server.start();
    LOG_INFO("realdb", "Serving with %zu worker(s)", config.effective_worker_count());

    int received = 0;
    sigwait(&signals, &received);
    LOG_INFO("realdb", "Received signal %d, shutting down", received);
    server.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        options opts = parse_options(argc, argv);
        if (opts.help) {
            print_usage(argv[0]);
            return 0;
        }

        realdb::configuration config = build_configuration(opts);
        realdb::set_log_level(config.level);

        if (opts.script_path) {
            return run_local(read_file(*opts.script_path), opts.dump);
        }
        if (opts.query) {
            return run_local(*opts.query, opts.dump);
        }
        return serve(config);
    } catch (const realdb::config_error& e) {
        std::cerr << "realdb: " << e.what() << std::endl;
        std::cerr << "Try `" << argv[0] << " --help`." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("realdb", "%s", e.what());
        return 1;
    }
}
