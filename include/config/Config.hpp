#pragma once
#include <chrono>
#include <cstddef>

namespace ircconn::config {

using ms = std::chrono::milliseconds;

// Protocol default ports, applied only when the address carries none
constexpr const char* DEFAULT_PORT = "6667";
constexpr const char* DEFAULT_TLS_PORT = "6697";

// Transport timeouts (0 disables the bound)
constexpr ms DEFAULT_CONNECT_TIMEOUT_MS = ms(10000);
constexpr ms DEFAULT_WRITE_TIMEOUT_MS = ms(10000);
constexpr ms DEFAULT_READ_TIMEOUT_MS = ms(0);

// Longest inbound line accepted before the read is treated as a failure
constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

// Writer 기본 최대 큐 크기
constexpr std::size_t DEFAULT_WRITER_MAX_QUEUE = 1000;

// 재연결 간격 (Manager 기본): starts at the interval and doubles up to the max
constexpr ms DEFAULT_RECONNECT_INTERVAL_MS = ms(1000);
constexpr ms DEFAULT_MAX_RECONNECT_INTERVAL_MS = ms(60000);

} // namespace ircconn::config
