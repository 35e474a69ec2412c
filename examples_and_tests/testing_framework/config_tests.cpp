/**
 * @file config_tests.cpp
 * @brief Command line parsing and configuration validation
 */

#include <boost/ut.hpp>

#include "echo/config.hpp"
#include "echo/log.hpp"

#include <string>
#include <vector>

using namespace boost::ut;
using namespace std::chrono_literals;

namespace {

echo::command_line parse(std::vector<std::string> args) {
    args.insert(args.begin(), "echo_server");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return echo::parse_command_line(static_cast<int>(args.size()), argv.data());
}

} // namespace

suite command_line_parsing = [] {
    "no arguments gives the defaults"_test = [] {
        auto options = parse({});
        const auto& config = options.config;
        expect(eq(config.listener.address, std::string("127.0.0.1:8080")));
        expect(config.listener.reuse_address);
        expect(config.listener.reuse_port);
        expect(eq(config.listener.backlog, 42));
        expect(config.mode == echo::dispatch_mode::thread_per_connection);
        expect(config.poll_interval == 100ms);
        expect(eq(config.max_clients, std::size_t{100}));
        expect(options.log_level == echo::log::level::info);
        expect(!options.show_help);
    };

    "every option is applied"_test = [] {
        auto options = parse({"--address", "0.0.0.0:9000", "-b", "128", "--no-reuse-address",
                              "--no-reuse-port", "--mode", "single", "-c", "8", "--poll-ms", "250",
                              "--log-level", "debug"});
        const auto& config = options.config;
        expect(eq(config.listener.address, std::string("0.0.0.0:9000")));
        expect(eq(config.listener.backlog, 128));
        expect(!config.listener.reuse_address);
        expect(!config.listener.reuse_port);
        expect(config.mode == echo::dispatch_mode::single_threaded);
        expect(eq(config.max_clients, std::size_t{8}));
        expect(config.poll_interval == 250ms);
        expect(options.log_level == echo::log::level::debug);
    };

    "the parser can be run repeatedly"_test = [] {
        parse({"-m", "single"});
        auto options = parse({"-m", "multi"});
        expect(options.config.mode == echo::dispatch_mode::thread_per_connection);
    };

    "help is reported"_test = [] {
        expect(parse({"-h"}).show_help);
        expect(parse({"--help"}).show_help);
        expect(echo::usage("echo_server").find("--address") != std::string::npos);
    };

    "malformed values are config errors"_test = [] {
        expect(throws<echo::config_error>([] { parse({"--backlog", "0"}); }));
        expect(throws<echo::config_error>([] { parse({"--backlog", "many"}); }));
        expect(throws<echo::config_error>([] { parse({"--backlog", "12x"}); }));
        expect(throws<echo::config_error>([] { parse({"--mode", "forked"}); }));
        expect(throws<echo::config_error>([] { parse({"--poll-ms", "-1"}); }));
        expect(throws<echo::config_error>([] { parse({"--max-clients", "0"}); }));
        expect(throws<echo::config_error>([] { parse({"--log-level", "loud"}); }));
    };

    "unknown options, missing values and stray arguments are config errors"_test = [] {
        expect(throws<echo::config_error>([] { parse({"--frobnicate"}); }));
        expect(throws<echo::config_error>([] { parse({"--address"}); }));
        expect(throws<echo::config_error>([] { parse({"extra"}); }));
    };
};

suite validation = [] {
    "hand-built configs are checked"_test = [] {
        echo::server_config config;
        expect(nothrow([&] { echo::validate(config); }));

        // Listener options fail the way a bind does
        config.listener.backlog = -1;
        expect(throws<echo::bind_error>([&] { echo::validate(config); }));

        config = echo::server_config{};
        config.poll_interval = 0ms;
        expect(throws<echo::config_error>([&] { echo::validate(config); }));

        config = echo::server_config{};
        config.max_clients = 0;
        expect(throws<echo::config_error>([&] { echo::validate(config); }));
    };
};

suite log_levels = [] {
    "level names round trip through the parser"_test = [] {
        expect(echo::log::parse_level("warn") == echo::log::level::warn);
        expect(echo::log::parse_level("warning") == echo::log::level::warn);
        expect(echo::log::parse_level("off") == echo::log::level::off);
        expect(!echo::log::parse_level("verbose").has_value());
        expect(echo::log::to_string(echo::log::level::error) == "ERROR");
    };

    "messages below the threshold are dropped"_test = [] {
        auto previous = echo::log::get_level();
        echo::log::set_level(echo::log::level::off);
        expect(nothrow([] { echo::log::error("suppressed ", 42); }));
        expect(echo::log::get_level() == echo::log::level::off);
        echo::log::set_level(previous);
    };
};

int main() {}
