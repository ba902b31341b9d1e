/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/net/api.hh>
#include <seastar/util/bool_class.hh>

namespace s3 {

using namespace seastar;

class connection {
    seastar::connected_socket _cs;
    seastar::output_stream<char> _out;
    seastar::input_stream<char> _in;
    bool _closed = false; // close() was called
    bool _reused = false; // has been in the pool
public:
    explicit connection(seastar::connected_socket cs)
        : _cs(std::move(cs))
        , _out(_cs.output())
        , _in(_cs.input())
    { }
public:
    seastar::output_stream<char>& out() { return _out; }
    seastar::input_stream<char>& in() { return _in; }
    future<> close();
    bool closed() const { return _closed; }
    bool reused() const { return _reused; }
    void mark_reused() { _reused = true; }
};

// Has a scope independent of other objects.
// Can outlive connection_factory.
// Can be destroyed without prior call to ->close().
class connection_ptr {
    lw_shared_ptr<connection> _ptr;
public:
    using value_type = connection;
    connection_ptr() = default;
    connection_ptr(connection_ptr&&) = default;
    connection_ptr(const connection_ptr&) = default;
    connection_ptr(lw_shared_ptr<connection> ptr) : _ptr(std::move(ptr)) {}
    ~connection_ptr();
    connection_ptr& operator=(connection_ptr&& other) noexcept {
        if (this != &other) {
            this->~connection_ptr();
            new (this) connection_ptr(std::move(other));
        }
        return *this;
    }
    connection_ptr& operator=(const connection_ptr& other) noexcept {
        if (this != &other) {
            this->~connection_ptr();
            new (this) connection_ptr(other);
        }
        return *this;
    }
    connection& operator*() { return *_ptr; }
    connection* operator->() { return &*_ptr; }
    explicit operator bool() const { return bool(_ptr); }
};

class connection_factory {
public:
    virtual ~connection_factory() = default;

    using allow_pooled = bool_class<struct allow_pooled_tag>;

    // Returns a connection which can be used exclusively by the caller.
    // It's not returned by later connect() calls until take_back().
    // With allow_pooled::no a new connection is opened even when idle ones
    // are available.
    // Returned connection_ptr can outlive this instance.
    virtual future<connection_ptr> connect(allow_pooled) = 0;

    // Signals that a given connection is no longer used
    // and can be returned by later connect() calls.
    virtual void take_back(connection_ptr) {};

    // Returns the name of the S3 host which connect() connects to.
    // The name should be globally-recognizable by the network stack
    // as it is put in the HTTP "Host" header.
    virtual sstring host_name() = 0;

    // Closes pooled connections.
    virtual future<> close() { return make_ready_future<>(); }
};

using connection_factory_ptr = seastar::shared_ptr<connection_factory>;

// Connects over plain TCP. No SSL.
// The host name is resolved on the first connect(), unless it is an
// IP address.
connection_factory_ptr make_basic_connection_factory(seastar::sstring host, uint16_t port);

} // namespace s3
