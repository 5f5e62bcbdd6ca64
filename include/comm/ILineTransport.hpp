#pragma once

/**
 * ILineTransport.hpp
 *
 * 통신 추상 인터페이스: one connected, line-delimited byte stream.
 *
 * 핵심 포인트:
 *  - readLine(): blocks for the next CRLF-terminated line (terminator removed)
 *  - writeLine(): blocks until the whole line (already CRLF-terminated) is written
 *  - shutdown(): closes the stream; a blocked readLine()/writeLine() fails promptly
 *
 * 설계 의도:
 *  - 한 개의 reader 스레드와 한 개의 writer 스레드가 동시에 사용할 수 있어야 한다.
 *    readLine is only ever called by the reader, writeLine only by the writer,
 *    so implementations need no locking between the two directions.
 *  - Failures are reported through error_code and never thrown; the loops that
 *    call these run on their own threads.
 */

#include <boost/system/error_code.hpp>

#include <string>

namespace ircconn::comm {

class ILineTransport {
public:
    virtual ~ILineTransport() = default;

    /// Reads the next line into `line`. Returns false and sets `ec` on failure (EOF included).
    virtual bool readLine(std::string& line, boost::system::error_code& ec) = 0;

    /// Writes `line` verbatim. Sets `ec` on failure.
    virtual void writeLine(const std::string& line, boost::system::error_code& ec) = 0;

    /// Closes the stream. Idempotent, safe from any thread.
    virtual void shutdown() noexcept = 0;

    /// 현재 연결 상태를 스레드-안전하게 반환
    virtual bool isOpen() const noexcept = 0;
};

} // namespace ircconn::comm
