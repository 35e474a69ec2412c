/**
 * @file connection_handler_tests.cpp
 * @brief Read-echo-write loop on a real loopback connection
 */

#include <boost/ut.hpp>

#include "echo/connection_handler.hpp"
#include "echo/server_state.hpp"
#include "test_support.hpp"

#include <asio.hpp>
#include <array>
#include <future>
#include <string>

using namespace boost::ut;
using namespace std::chrono_literals;

namespace {

std::future<echo::handler_result> run_async(echo::connection_handler& handler) {
    return std::async(std::launch::async, [&handler] { return handler.run(); });
}

std::string read_exactly(asio::ip::tcp::socket& socket, std::size_t count) {
    std::string data(count, '\0');
    asio::read(socket, asio::buffer(data));
    return data;
}

} // namespace

suite connection_handler_tests = [] {
    echo_tests::quiet_logs();

    "ping comes back and EOF ends the connection cleanly"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        asio::write(pair.client, asio::buffer(std::string("ping")));
        expect(eq(read_exactly(pair.client, 4), std::string("ping")));

        pair.client.shutdown(asio::ip::tcp::socket::shutdown_send);
        expect(done.wait_for(2s) == std::future_status::ready);
        auto result = done.get();

        expect(result.reason == echo::close_reason::peer_closed);
        expect(eq(result.cycles, std::size_t{1}));
        expect(eq(result.bytes_echoed, std::size_t{4}));
    };

    "a full 1024 byte chunk is echoed unchanged"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        auto message = echo_tests::pattern(echo::max_chunk_size, 'a');
        asio::write(pair.client, asio::buffer(message));
        expect(read_exactly(pair.client, message.size()) == message);

        pair.client.shutdown(asio::ip::tcp::socket::shutdown_send);
        auto result = done.get();
        expect(eq(result.bytes_echoed, message.size()));
    };

    "messages over 1024 bytes are echoed in several chunks"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        auto message = echo_tests::pattern(3000, 'A');
        asio::write(pair.client, asio::buffer(message));
        expect(read_exactly(pair.client, message.size()) == message);

        pair.client.shutdown(asio::ip::tcp::socket::shutdown_send);
        auto result = done.get();
        expect(result.reason == echo::close_reason::peer_closed);
        expect(result.cycles >= std::size_t{3}) << "cycles:" << result.cycles;
        expect(eq(result.bytes_echoed, std::size_t{3000}));
    };

    "echoes preserve order within a connection"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        std::string expected;
        for (int i = 0; i < 20; ++i) {
            auto piece = "message-" + std::to_string(i) + ";";
            asio::write(pair.client, asio::buffer(piece));
            expected += piece;
        }
        expect(read_exactly(pair.client, expected.size()) == expected);

        pair.client.shutdown(asio::ip::tcp::socket::shutdown_send);
        done.get();
    };

    "an idle connection notices shutdown within the poll interval"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        asio::write(pair.client, asio::buffer(std::string("hello")));
        expect(eq(read_exactly(pair.client, 5), std::string("hello")));

        running.clear();
        expect(done.wait_for(1s) == std::future_status::ready);
        auto result = done.get();
        expect(result.reason == echo::close_reason::shutdown);
        expect(eq(result.cycles, std::size_t{1}));

        // The handler closed its end
        std::array<char, 16> buffer;
        std::error_code ec;
        pair.client.read_some(asio::buffer(buffer), ec);
        expect(ec == asio::error::eof) << ec.message();
    };

    "a peer that never reads cannot hold the handler past shutdown"_test = [] {
        echo_tests::loopback_pair pair;
        pair.client.set_option(asio::socket_base::receive_buffer_size(4096));
        pair.server.set_option(asio::socket_base::send_buffer_size(4096));

        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        // Keeps sending until the handler's end goes away
        auto flood = std::async(std::launch::async, [&pair] {
            std::string block = echo_tests::pattern(64 * 1024, 'f');
            std::error_code ec;
            for (int i = 0; i < 512 && !ec; ++i) {
                asio::write(pair.client, asio::buffer(block), ec);
            }
            return ec;
        });

        expect(done.wait_for(300ms) == std::future_status::timeout)
            << "handler should still be blocked on the unread peer";

        running.clear();
        expect(done.wait_for(1s) == std::future_status::ready);
        auto result = done.get();
        expect(result.reason == echo::close_reason::shutdown);

        expect(flood.wait_for(2s) == std::future_status::ready);
        expect(static_cast<bool>(flood.get())) << "the sender sees the connection go away";
    };

    "a cleared flag stops the handler before its first read"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        running.clear();
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto result = handler.run();
        expect(result.reason == echo::close_reason::shutdown);
        expect(eq(result.cycles, std::size_t{0}));
    };

    "a peer reset ends only this connection"_test = [] {
        echo_tests::loopback_pair pair;
        echo::running_flag running;
        echo::connection_handler handler(std::move(pair.server), running, 20ms);
        auto done = run_async(handler);

        asio::write(pair.client, asio::buffer(std::string("x")));
        expect(eq(read_exactly(pair.client, 1), std::string("x")));

        pair.client.set_option(asio::socket_base::linger(true, 0));
        pair.client.close();

        expect(done.wait_for(2s) == std::future_status::ready);
        auto result = done.get();
        expect(result.reason == echo::close_reason::io_error);
        expect(running.is_set());
    };
};

int main() {}
