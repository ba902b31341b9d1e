/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <optional>
#include <seastar/core/circular_buffer.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/reactor.hh>
#include <seastar/core/seastar.hh>
#include <seastar/net/dns.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/util/log.hh>
#include <fmt/format.h>

#include "s3/connection.hh"

namespace s3 {

static seastar::logger connlog("s3_connection");

future<> connection::close() {
    _closed = true;
    co_await _out.close();
    co_await _in.close();
}

connection_ptr::~connection_ptr() {
    if (!_ptr || !_ptr.owned() || _ptr->closed()) {
        return;
    }
    auto ptr = std::move(_ptr);
    connlog.debug("conn {}: not closed, closing in background", fmt::ptr(&*ptr));
    (void)ptr->close()
        .then([ptr] {
            connlog.debug("conn {}: closed", fmt::ptr(&*ptr));
        }).handle_exception([ptr](auto ep) {
            connlog.error("conn {}: failed to close: {}", fmt::ptr(&*ptr), ep);
        });
}

class basic_connection_factory : public connection_factory {
    sstring _host;
    uint16_t _port;
    std::optional<seastar::socket_address> _addr;
    circular_buffer<connection_ptr> _pool;
private:
    future<seastar::socket_address> address() {
        if (!_addr) {
            auto numeric = net::inet_address::parse_numerical(_host);
            auto ip = numeric ? *numeric : co_await net::dns::resolve_name(_host, net::inet_address::family::INET);
            _addr = seastar::socket_address(ip, _port);
            connlog.debug("resolved {} to {}", _host, *_addr);
        }
        co_return *_addr;
    }
public:
    basic_connection_factory(sstring host, uint16_t port)
        : _host(std::move(host))
        , _port(port)
    { }

    sstring host_name() override {
        return _host;
    }

    future<connection_ptr> connect(allow_pooled pooled) override {
        if (pooled && !_pool.empty()) {
            auto con = std::move(_pool.front());
            _pool.pop_front();
            connlog.debug("conn {}: returning from pool", fmt::ptr(&*con));
            co_return con;
        }
        auto addr = co_await address();
        auto cs = co_await seastar::connect(addr);
        auto con = connection_ptr(seastar::make_lw_shared<connection>(std::move(cs)));
        connlog.debug("conn {}: connected to {}", fmt::ptr(&*con), addr);
        co_return con;
    }

    void take_back(connection_ptr con) override {
        connlog.debug("conn {}: returning to pool ({} total)", fmt::ptr(&*con), _pool.size() + 1);
        con->mark_reused();
        _pool.emplace_back(std::move(con));
    }

    future<> close() override {
        while (!_pool.empty()) {
            auto con = std::move(_pool.front());
            _pool.pop_front();
            try {
                co_await con->close();
            } catch (...) {
                connlog.warn("conn {}: failed to close: {}", fmt::ptr(&*con), std::current_exception());
            }
        }
    }
};

connection_factory_ptr make_basic_connection_factory(sstring host, uint16_t port) {
    return seastar::make_shared<basic_connection_factory>(std::move(host), port);
}

} // namespace s3
