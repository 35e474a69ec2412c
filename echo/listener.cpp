#include "echo/listener.hpp"

#include "echo/log.hpp"

#include <charconv>

namespace echo {

void split_address(const std::string& address, std::string& host, unsigned short& port) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon + 1 == address.size()) {
        throw bind_error(std::make_error_code(std::errc::invalid_argument),
                         "address '" + address + "' has no port");
    }

    host = address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        host = "0.0.0.0";
    }

    const char* first = address.data() + colon + 1;
    const char* last = address.data() + address.size();
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value > 65535) {
        throw bind_error(std::make_error_code(std::errc::invalid_argument),
                         "address '" + address + "' has an invalid port");
    }
    port = static_cast<unsigned short>(value);
}

asio::ip::tcp::endpoint resolve_listen_endpoint(asio::io_context& io_context,
                                                const std::string& address) {
    std::string host;
    unsigned short port = 0;
    split_address(address, host, port);

    std::error_code ec;
    auto ip = asio::ip::make_address(host, ec);
    if (!ec) {
        return asio::ip::tcp::endpoint(ip, port);
    }

    asio::ip::tcp::resolver resolver(io_context);
    auto results = resolver.resolve(host, std::to_string(port),
                                    asio::ip::resolver_base::passive, ec);
    if (ec) {
        throw bind_error(ec, "resolve " + host);
    }
    if (results.empty()) {
        throw bind_error(std::make_error_code(std::errc::address_not_available),
                         "resolve " + host);
    }
    return results.begin()->endpoint();
}

asio::ip::tcp::acceptor make_listener(asio::io_context& io_context,
                                      const listener_config& config) {
    if (config.backlog <= 0) {
        throw bind_error(std::make_error_code(std::errc::invalid_argument),
                         "backlog must be positive, got " + std::to_string(config.backlog));
    }

    auto endpoint = resolve_listen_endpoint(io_context, config.address);
    asio::ip::tcp::acceptor acceptor(io_context);

    std::error_code ec;
    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw bind_error(ec, "open");
    }

    // Both options must be in place before bind
    acceptor.set_option(asio::socket_base::reuse_address(config.reuse_address), ec);
    if (ec) {
        throw bind_error(ec, "setsockopt SO_REUSEADDR");
    }
    acceptor.set_option(reuse_port(config.reuse_port), ec);
    if (ec) {
        throw bind_error(ec, "setsockopt SO_REUSEPORT");
    }

    acceptor.bind(endpoint, ec);
    if (ec) {
        throw bind_error(ec, "bind " + config.address);
    }

    acceptor.listen(config.backlog, ec);
    if (ec) {
        throw bind_error(ec, "listen " + config.address);
    }

    log::debug("Listener bound to ", acceptor.local_endpoint(), " (reuse_address=",
               config.reuse_address, ", reuse_port=", config.reuse_port,
               ", backlog=", config.backlog, ")");
    return acceptor;
}

} // namespace echo
