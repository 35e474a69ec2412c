#include "echo/config.hpp"

#include <getopt.h>

#include <charconv>
#include <sstream>
#include <string_view>

namespace echo {

namespace {

enum long_only_option {
    opt_no_reuse_address = 256,
    opt_no_reuse_port,
};

long long parse_number(std::string_view name, const char* text, long long lo, long long hi) {
    std::string_view value(text);
    long long result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        throw config_error(std::string(name) + ": '" + std::string(value) + "' is not a number");
    }
    if (result < lo || result > hi) {
        throw config_error(std::string(name) + ": " + std::to_string(result) +
                           " is out of range [" + std::to_string(lo) + ", " +
                           std::to_string(hi) + "]");
    }
    return result;
}

dispatch_mode parse_mode(const char* text) {
    std::string_view value(text);
    if (value == "single") return dispatch_mode::single_threaded;
    if (value == "multi") return dispatch_mode::thread_per_connection;
    throw config_error("mode: expected 'single' or 'multi', got '" + std::string(value) + "'");
}

} // namespace

command_line parse_command_line(int argc, char* argv[]) {
    static const option long_options[] = {
        {"address", required_argument, nullptr, 'a'},
        {"backlog", required_argument, nullptr, 'b'},
        {"mode", required_argument, nullptr, 'm'},
        {"max-clients", required_argument, nullptr, 'c'},
        {"poll-ms", required_argument, nullptr, 'p'},
        {"log-level", required_argument, nullptr, 'l'},
        {"no-reuse-address", no_argument, nullptr, opt_no_reuse_address},
        {"no-reuse-port", no_argument, nullptr, opt_no_reuse_port},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    command_line result;
    auto& config = result.config;

    // 0 rather than 1 makes glibc fully reinitialize, so the parser can run
    // more than once per process.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":a:b:m:c:p:l:h", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'a':
            config.listener.address = optarg;
            break;
        case 'b':
            config.listener.backlog = static_cast<int>(parse_number("backlog", optarg, 1, 65535));
            break;
        case 'm':
            config.mode = parse_mode(optarg);
            break;
        case 'c':
            config.max_clients = static_cast<std::size_t>(
                parse_number("max-clients", optarg, 1, 1000000));
            break;
        case 'p':
            config.poll_interval = std::chrono::milliseconds(
                parse_number("poll-ms", optarg, 1, 60000));
            break;
        case 'l': {
            auto lvl = log::parse_level(optarg);
            if (!lvl) {
                throw config_error("log-level: unknown level '" + std::string(optarg) + "'");
            }
            result.log_level = *lvl;
            break;
        }
        case opt_no_reuse_address:
            config.listener.reuse_address = false;
            break;
        case opt_no_reuse_port:
            config.listener.reuse_port = false;
            break;
        case 'h':
            result.show_help = true;
            break;
        case ':':
            throw config_error("missing value for option '" +
                               std::string(argv[optind - 1]) + "'");
        default:
            throw config_error("unknown option '" + std::string(argv[optind - 1]) + "'");
        }
    }

    if (optind < argc) {
        throw config_error("unexpected argument '" + std::string(argv[optind]) + "'");
    }

    validate(config);
    return result;
}

void validate(const server_config& config) {
    if (config.listener.backlog <= 0) {
        throw bind_error(std::make_error_code(std::errc::invalid_argument),
                         "backlog must be positive");
    }
    if (config.poll_interval.count() <= 0) {
        throw config_error("poll interval must be positive");
    }
    if (config.max_clients == 0) {
        throw config_error("max clients must be at least 1");
    }
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  -a, --address HOST:PORT   listen address (default 127.0.0.1:8080)\n"
        << "  -b, --backlog N           pending connection queue (default 42)\n"
        << "      --no-reuse-address    do not set SO_REUSEADDR\n"
        << "      --no-reuse-port       do not set SO_REUSEPORT\n"
        << "  -m, --mode single|multi   inline or thread-per-connection (default multi)\n"
        << "  -c, --max-clients N       registry capacity (default 100)\n"
        << "  -p, --poll-ms N           shutdown latency bound in ms (default 100)\n"
        << "  -l, --log-level LEVEL     debug, info, warn, error or off (default info)\n"
        << "  -h, --help                show this message\n";
    return out.str();
}

} // namespace echo
