#include "comm/AsioTransport.hpp"
#include "protocol/exceptions/ConnectionError.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "spdlog/spdlog.h"

#include <atomic>
#include <future>
#include <thread>

namespace ircconn::comm {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using boost::system::error_code;

namespace {
    static bool is_ip_literal(const std::string& host) {
        error_code ec;
        asio::ip::make_address(host, ec);
        return !ec;
    }

    static std::unique_ptr<ssl::context> make_ssl_context(const TlsOptions& tls) {
        auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
        if (tls.skipVerify) {
            ctx->set_verify_mode(ssl::verify_none);
        } else {
            ctx->set_verify_mode(ssl::verify_peer);
            ctx->set_default_verify_paths();
            if (!tls.caFile.empty()) {
                ctx->load_verify_file(tls.caFile);
            }
        }
        return ctx;
    }
} // namespace

struct AsioTransport::Impl {
    explicit Impl(TransportOptions opts)
        : options(std::move(opts)),
          ioContext(),
          workGuard(asio::make_work_guard(ioContext)),
          strand(asio::make_strand(ioContext)),
          readBuffer(options.maxLineLength),
          connected{false} {}

    TransportOptions options;
    asio::io_context ioContext;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard;
    asio::strand<asio::io_context::executor_type> strand;

    std::unique_ptr<ssl::context> sslContext;
    std::unique_ptr<tcp::socket> plainSocket;
    std::unique_ptr<ssl::stream<tcp::socket>> tlsStream;
    asio::streambuf readBuffer;

    std::thread thread;
    std::atomic<bool> connected;

    tcp::socket& lowest() { return tlsStream ? tlsStream->next_layer() : *plainSocket; }

    void startIoThread() {
        if (thread.joinable()) return;
        thread = std::thread([this]() {
            try {
                ioContext.run();
            } catch (const std::exception& ex) {
                spdlog::error("[AsioTransport] io_context.run() threw: {}", ex.what());
            }
        });
    }

    void stopIoThread() {
        workGuard.reset();
        ioContext.stop();
        if (thread.joinable()) thread.join();
    }

    // must run on the strand
    void closeOnStrand() {
        if (!plainSocket && !tlsStream) return;
        auto& sock = lowest();
        if (!sock.is_open()) return;
        error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            spdlog::debug("[AsioTransport] socket shutdown: {}", ec.message());
        }
        sock.close(ec);
        if (ec) {
            spdlog::debug("[AsioTransport] socket close: {}", ec.message());
        }
    }

    /**
     * Starts an operation on the strand and blocks the calling thread until it completes.
     * `start` receives a completion callback taking the operation's error_code.
     * With a positive timeout a stalled operation is aborted by closing the socket.
     */
    template <typename Start>
    error_code runBlocking(Start start, std::chrono::milliseconds timeout) {
        auto done = std::make_shared<std::promise<error_code>>();
        auto fut = done->get_future();
        asio::post(strand, [start = std::move(start), done]() mutable {
            start([done](const error_code& ec) { done->set_value(ec); });
        });

        bool timedOut = false;
        if (timeout.count() > 0 && fut.wait_for(timeout) != std::future_status::ready) {
            timedOut = true;
            asio::post(strand, [this]() { closeOnStrand(); });
        }

        error_code result;
        try {
            result = fut.get();
        } catch (const std::future_error& fe) {
            // handler destroyed without running: the io_context went away under us
            spdlog::debug("[AsioTransport] operation abandoned: {}", fe.what());
            result = asio::error::operation_aborted;
        }
        return timedOut ? error_code(asio::error::timed_out) : result;
    }
};

AsioTransport::AsioTransport(TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

AsioTransport::~AsioTransport() {
    shutdown();
    impl_->stopIoThread();
}

std::shared_ptr<AsioTransport> AsioTransport::open(const Endpoint& endpoint, const TransportOptions& options) {
    auto transport = std::make_shared<AsioTransport>(options);
    transport->connect(endpoint);
    return transport;
}

void AsioTransport::connect(const Endpoint& endpoint) {
    if (impl_->plainSocket || impl_->tlsStream) {
        throw ConnectionError("transport already used for " + endpoint.address());
    }
    const auto& opts = impl_->options;
    impl_->startIoThread();

    error_code ec;
    tcp::resolver resolver(impl_->ioContext);
    auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        throw ConnectionError("resolve " + endpoint.address() + " failed: " + ec.message());
    }

    if (opts.tls) {
        try {
            impl_->sslContext = make_ssl_context(opts.tlsOptions);
        } catch (const boost::system::system_error& e) {
            throw ConnectionError("TLS setup failed: " + std::string(e.what()));
        }
        impl_->tlsStream = std::make_unique<ssl::stream<tcp::socket>>(impl_->ioContext, *impl_->sslContext);
    } else {
        impl_->plainSocket = std::make_unique<tcp::socket>(impl_->ioContext);
    }

    ec = impl_->runBlocking([this, results](auto complete) {
        asio::async_connect(impl_->lowest(), results,
            asio::bind_executor(impl_->strand, [complete](const error_code& ec, const tcp::endpoint&) {
                complete(ec);
            }));
    }, opts.connectTimeout);
    if (ec) {
        asio::post(impl_->strand, [impl = impl_.get()]() { impl->closeOnStrand(); });
        throw ConnectionError("connect to " + endpoint.address() + " failed: " + ec.message());
    }

    if (impl_->tlsStream) {
        const std::string& name = opts.tlsOptions.serverName.empty() ? endpoint.host : opts.tlsOptions.serverName;
        if (!is_ip_literal(name)) {
            // SNI
            if (!SSL_set_tlsext_host_name(impl_->tlsStream->native_handle(), name.c_str())) {
                spdlog::warn("[AsioTransport] could not set SNI host name {}", name);
            }
        }
        if (!opts.tlsOptions.skipVerify) {
            impl_->tlsStream->set_verify_callback(ssl::host_name_verification(name));
        }

        ec = impl_->runBlocking([this](auto complete) {
            impl_->tlsStream->async_handshake(ssl::stream_base::client,
                asio::bind_executor(impl_->strand, [complete](const error_code& ec) { complete(ec); }));
        }, opts.connectTimeout);
        if (ec) {
            asio::post(impl_->strand, [impl = impl_.get()]() { impl->closeOnStrand(); });
            throw ConnectionError("TLS handshake with " + endpoint.address() + " failed: " + ec.message());
        }
    }

    impl_->connected.store(true);
    spdlog::info("Successfully connected to the server: {} ({})", endpoint.address(), opts.tls ? "tls" : "plaintext");
}

bool AsioTransport::readLine(std::string& line, error_code& ec) {
    if (!impl_->connected.load()) {
        ec = asio::error::not_connected;
        return false;
    }

    std::string result;
    ec = impl_->runBlocking([this, &result](auto complete) {
        auto handler = asio::bind_executor(impl_->strand,
            [this, &result, complete](const error_code& ec, std::size_t n) {
                if (!ec) {
                    auto data = impl_->readBuffer.data();
                    result.assign(asio::buffers_begin(data), asio::buffers_begin(data) + n);
                    impl_->readBuffer.consume(n);
                }
                complete(ec);
            });
        if (impl_->tlsStream) {
            asio::async_read_until(*impl_->tlsStream, impl_->readBuffer, '\n', std::move(handler));
        } else {
            asio::async_read_until(*impl_->plainSocket, impl_->readBuffer, '\n', std::move(handler));
        }
    }, impl_->options.readTimeout);
    if (ec) return false;

    // CRLF 제거 (a bare LF terminator is accepted too)
    if (!result.empty() && result.back() == '\n') result.pop_back();
    if (!result.empty() && result.back() == '\r') result.pop_back();
    line = std::move(result);
    return true;
}

void AsioTransport::writeLine(const std::string& line, error_code& ec) {
    if (!impl_->connected.load()) {
        ec = asio::error::not_connected;
        return;
    }

    auto data = std::make_shared<std::string>(line);
    ec = impl_->runBlocking([this, data](auto complete) {
        auto handler = asio::bind_executor(impl_->strand,
            [data, complete](const error_code& ec, std::size_t) { complete(ec); });
        if (impl_->tlsStream) {
            asio::async_write(*impl_->tlsStream, asio::buffer(*data), std::move(handler));
        } else {
            asio::async_write(*impl_->plainSocket, asio::buffer(*data), std::move(handler));
        }
    }, impl_->options.writeTimeout);
}

void AsioTransport::shutdown() noexcept {
    if (!impl_->connected.exchange(false)) return;
    try {
        asio::post(impl_->strand, [impl = impl_.get()]() { impl->closeOnStrand(); });
    } catch (const std::exception& e) {
        spdlog::warn("[AsioTransport] shutdown could not be scheduled: {}", e.what());
    }
}

bool AsioTransport::isOpen() const noexcept {
    return impl_->connected.load();
}

} // namespace ircconn::comm
