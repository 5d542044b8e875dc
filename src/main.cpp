/*
 * main.cpp - sniff command-line entry point
 *
 * Loads sniff.conf, applies command-line overrides and runs one of the modes:
 * interface listing, capture file dump/info, or headless recording until
 * SIGINT/SIGTERM.
 */

#include "app.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <atomic>
#include <csignal>
#include <getopt.h>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* prog) {
    std::cout <<
        "Usage: " << prog << " [options] -i IFACE\n"
        "       " << prog << " --list-interfaces\n"
        "       " << prog << " --read FILE | --info FILE\n"
        "\n"
        "Capture options:\n"
        "  -i, --interface IFACE      interface to record\n"
        "  -d, --data-dir DIR         data directory (default " << DEFAULT_DATA_DIR << ")\n"
        "  -f, --filter EXPR          BPF capture filter\n"
        "  -s, --snaplen N            bytes stored per frame (default 1518)\n"
        "  -b, --buffer PROFILE       low, balanced, fast or max\n"
        "  -r, --retention DAYS       days of capture files to keep, 0 = forever\n"
        "      --no-promisc           do not enable promiscuous mode\n"
        "  -v, --verbose              print each captured frame\n"
        "\n"
        "Analysis options:\n"
        "      --no-modules           disable analysis of closed files\n"
        "      --modules LIST         comma-separated modules to run (default all)\n"
        "      --workers N            analysis worker threads (default 2)\n"
        "\n"
        "General:\n"
        "  -c, --config FILE          settings file (default $XDG_CONFIG_HOME/sniff/"
        << SETTINGS_FILENAME << ")\n"
        "      --log-level LEVEL      debug, info, warn or error\n"
        "      --log-file FILE        also append log lines to FILE\n"
        "  -h, --help                 show this help\n";
}

enum LongOnly {
    OPT_LIST = 1000,
    OPT_READ,
    OPT_INFO,
    OPT_NO_PROMISC,
    OPT_NO_MODULES,
    OPT_MODULES,
    OPT_WORKERS,
    OPT_LOG_LEVEL,
    OPT_LOG_FILE,
};

}

int main(int argc, char** argv) {
    static const struct option long_options[] = {
        {"interface", required_argument, nullptr, 'i'},
        {"data-dir", required_argument, nullptr, 'd'},
        {"filter", required_argument, nullptr, 'f'},
        {"snaplen", required_argument, nullptr, 's'},
        {"buffer", required_argument, nullptr, 'b'},
        {"retention", required_argument, nullptr, 'r'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"list-interfaces", no_argument, nullptr, OPT_LIST},
        {"read", required_argument, nullptr, OPT_READ},
        {"info", required_argument, nullptr, OPT_INFO},
        {"no-promisc", no_argument, nullptr, OPT_NO_PROMISC},
        {"no-modules", no_argument, nullptr, OPT_NO_MODULES},
        {"modules", required_argument, nullptr, OPT_MODULES},
        {"workers", required_argument, nullptr, OPT_WORKERS},
        {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
        {"log-file", required_argument, nullptr, OPT_LOG_FILE},
        {nullptr, 0, nullptr, 0},
    };

    std::string config_path;
    std::string read_path;
    std::string info_path;
    bool list_mode = false;

    // Overrides are collected first so they win over the settings file
    std::vector<std::pair<std::string, std::string>> overrides;

    int opt;
    while ((opt = getopt_long(argc, argv, "i:d:f:s:b:r:c:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'i': overrides.emplace_back("interface", optarg); break;
            case 'd': overrides.emplace_back("data_dir", optarg); break;
            case 'f': overrides.emplace_back("filter", optarg); break;
            case 's': overrides.emplace_back("snaplen", optarg); break;
            case 'b': overrides.emplace_back("buffer_profile", optarg); break;
            case 'r': overrides.emplace_back("retention_days", optarg); break;
            case 'c': config_path = optarg; break;
            case 'v': overrides.emplace_back("print_packets", "true"); break;
            case 'h': print_usage(argv[0]); return 0;
            case OPT_LIST: list_mode = true; break;
            case OPT_READ: read_path = optarg; break;
            case OPT_INFO: info_path = optarg; break;
            case OPT_NO_PROMISC: overrides.emplace_back("promisc", "false"); break;
            case OPT_NO_MODULES: overrides.emplace_back("modules", "false"); break;
            case OPT_MODULES: overrides.emplace_back("enabled_modules", optarg); break;
            case OPT_WORKERS: overrides.emplace_back("analysis_workers", optarg); break;
            case OPT_LOG_LEVEL: overrides.emplace_back("log_level", optarg); break;
            case OPT_LOG_FILE: overrides.emplace_back("log_file", optarg); break;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }

    Settings settings;
    if (config_path.empty()) {
        std::string default_path = Config::get_config_path(SETTINGS_FILENAME);
        if (!Config::load_settings(default_path, settings)) {
            logger::debug("no settings file at " + default_path + ", using defaults");
        }
    } else if (!Config::load_settings(config_path, settings)) {
        std::cerr << "cannot read config file " << config_path << "\n";
        return 2;
    }

    for (const auto& [key, value] : overrides) {
        std::string error;
        if (!settings.set(key, value, error)) {
            std::cerr << error << "\n";
            return 2;
        }
    }

    if (auto level = logger::parse_level(settings.log_level)) {
        logger::set_level(*level);
    }
    if (!settings.log_file.empty() && !logger::set_log_file(settings.log_file)) {
        std::cerr << "cannot open log file " << settings.log_file << "\n";
        return 2;
    }

    if (list_mode) {
        return list_interfaces(std::cout);
    }
    if (!read_path.empty()) {
        return dump_capture_file(read_path, std::cout);
    }
    if (!info_path.empty()) {
        return print_capture_info(info_path, std::cout);
    }

    if (settings.interface_name.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    App app(settings);
    if (!app.init()) {
        logger::error("startup failed: " + app.get_error());
        app.shutdown();
        return 1;
    }

    bool clean = app.run(g_stop_requested);
    logger::info("shutting down");
    app.shutdown();
    return clean ? 0 : 1;
}
