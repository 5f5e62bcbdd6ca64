#pragma once

/**
 * AsioTransport.hpp
 *
 * Boost.Asio 기반 ILineTransport 구현 (헤더): plaintext TCP or TLS over TCP.
 *
 * 변경/설계 요약:
 *  - 생성자에서는 io_context/strand 생성까지만 수행(실제 io thread는 connect()에서 실행)
 *  - connect(): resolve, dial and (with TLS) handshake; any failure throws ConnectionError
 *  - readLine()/writeLine(): the asynchronous operation is started on the strand and the
 *    calling thread blocks on its completion, so one reader thread and one writer thread
 *    can share a TLS stream (one outstanding read + one outstanding write, both on the strand)
 *  - a timed-out operation closes the socket; the session is dead after that
 *  - shutdown(): closes the socket, which aborts blocked reads/writes
 *
 * 주의:
 *  - 이 헤더는 구현(.cpp)에 비동기 로직을 두고, 여기서는 API/멤버 선언 및 동작 문서를 제공함.
 */

#include "Endpoint.hpp"
#include "ILineTransport.hpp"
#include "TransportOptions.hpp"

#include <memory>
#include <string>

namespace ircconn::comm {

class AsioTransport : public ILineTransport {
public:
    explicit AsioTransport(TransportOptions options);
    ~AsioTransport() override;

    AsioTransport(const AsioTransport&) = delete;
    AsioTransport& operator=(const AsioTransport&) = delete;

    // 동기 연결(예외 던짐). May be called once per transport.
    void connect(const Endpoint& endpoint);

    // Creates a transport and connects it; the usual way to obtain one.
    static std::shared_ptr<AsioTransport> open(const Endpoint& endpoint, const TransportOptions& options);

    bool readLine(std::string& line, boost::system::error_code& ec) override;
    void writeLine(const std::string& line, boost::system::error_code& ec) override;
    void shutdown() noexcept override;
    bool isOpen() const noexcept override;

private:
    // 비공개: 구현(.cpp)에서 정의
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ircconn::comm
