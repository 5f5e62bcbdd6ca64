// src/app/cli_main.cpp
#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <thread>
#include <atomic>
#include <csignal>
#include <memory>

#include <sys/select.h>
#include <unistd.h>

#include "client/Client.hpp"
#include "client/ClientManager.hpp"
#include "client/MessageLog.hpp"
#include "protocol/CommandBuilder.hpp"
#include "protocol/exceptions/ConnectionError.h"
#include "spdlog/spdlog.h"

using namespace ircconn::client;
using ircconn::protocol::CommandBuilder;
using ircconn::protocol::Message;

static std::atomic<bool> g_stop{false};

void sigint_handler(int /*signum*/) {
    // 시그널 핸들러에서는 안전한 동작(atomic flag 설정)만 수행
    g_stop.store(true);
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

// text after the first `count` whitespace-separated tokens, leading blanks removed
static std::string rest_after(const std::string& line, size_t count) {
    size_t pos = 0;
    for (size_t i = 0; i < count; ++i) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) return {};
        pos = line.find_first_of(" \t", pos);
        if (pos == std::string::npos) return {};
    }
    pos = line.find_first_not_of(" \t", pos);
    return pos == std::string::npos ? std::string() : line.substr(pos);
}

static void print_usage(const char* prog) {
    std::cerr << "usage: " << prog
              << " <server[:port]> <nick> [--tls] [--insecure] [--ca <file>]"
                 " [--password <pass>] [--reconnect] [--verbose]\n";
}

static void print_help() {
    std::cout << "Commands:\n"
              << "  /join <chan>            : join a channel\n"
              << "  /part <chan>            : leave a channel\n"
              << "  /msg <target> <text>    : send a message\n"
              << "  /raw <line>             : send a raw protocol line\n"
              << "  /connect                : reconnect after a lost connection\n"
              << "  /quit [message]         : disconnect and exit\n"
              << "  /help                   : show this help\n";
}

static void print_message(const Message& msg) {
    std::cout << "\n";
    if (msg.prefix) std::cout << "<" << *msg.prefix << "> ";
    std::cout << msg.command;
    for (const auto& p : msg.params) std::cout << " " << p;
    if (msg.trailing) std::cout << " :" << *msg.trailing;
    std::cout << std::endl << "> " << std::flush; // prompt
}

/**
 * attemptConnectWithPrompt:
 *  - manager.connectOnce() 를 시도
 *  - 실패 시 사용자에게 재시도 여부(y/n)를 물어봄. y -> 재시도, n -> false 반환
 *
 *  ※ g_stop 플래그를 수시로 체크하여 사용자가 Ctrl+C 누르면 루프를 탈출하도록 함.
 */
bool attemptConnectWithPrompt(ClientManager& manager) {
    bool ok = manager.connectOnce();
    while (!ok && !g_stop.load()) {
        std::cerr << "[CLI] connect failed.\n";
        std::cout << "Do you want to retry connection? (y/n): " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            std::cerr << "[CLI] input error or EOF, exiting connect attempt.\n";
            return false;
        }
        if (g_stop.load()) return false;
        if (answer != "y" && answer != "Y") {
            return false;
        }
        std::cout << "[CLI] retrying connection...\n";
        ok = manager.connectOnce();
    }
    if (ok) std::cout << "[CLI] connected\n";
    return ok;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    std::string address = argv[1];
    ClientConfig config;
    config.nick = argv[2];
    config.quitMessage = "bye";
    bool autoReconnect = false;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tls") {
            config.transport.tls = true;
        } else if (arg == "--insecure") {
            config.transport.tlsOptions.skipVerify = true;
        } else if (arg == "--ca" && i + 1 < argc) {
            config.transport.tlsOptions.caFile = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            config.password = argv[++i];
        } else if (arg == "--reconnect") {
            autoReconnect = true;
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            std::cerr << "[CLI] unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    auto client = std::make_shared<Client>(config);
    ClientManager manager(client, address, autoReconnect);
    SpdlogMessageLog history;

    // install SIGINT handler for graceful shutdown (handler only sets flag)
    std::signal(SIGINT, sigint_handler);

    // inbound printer: runs until the client closes its message stream
    std::thread printer([&]() {
        while (auto msg = client->messages().pop()) {
            print_message(*msg);
            forwardToLog(*msg, client->serverAddress(), history);
        }
    });

    // connect or start manager depending on autoReconnect
    if (autoReconnect) {
        std::cout << "[CLI] Starting manager with autoReconnect ON\n";
        manager.startAsync();
    } else {
        std::cout << "[CLI] Attempting single connect to " << address << " ...\n";
        if (!attemptConnectWithPrompt(manager)) {
            manager.stop();
            printer.join();
            return 1;
        }
    }

    std::cout << "ircconn CLI\n";
    std::cout << "Type '/help' for commands.\n";

    // Main interactive loop using select() so we can wake periodically and check g_stop
    const int STDIN_FD = fileno(stdin);
    std::string line;
    while (!g_stop.load()) {
        if (!autoReconnect) {
            // without the manager loop nobody else watches the reconnect signal
            ircconn::comm::LinkEvent event;
            if (client->reconnects().try_pop(event, 0) == ircconn::common::WaitStatus::Ready) {
                std::cerr << "\n[CLI] connection lost. Type '/connect' to reconnect.\n> " << std::flush;
            }
        }

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FD, &readfds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200000; // 200 ms

        int rv = select(STDIN_FD + 1, &readfds, NULL, NULL, &tv);
        if (rv <= 0) {
            // timeout or interrupted by signal: re-check stop flag
            continue;
        }
        if (!FD_ISSET(STDIN_FD, &readfds)) continue;

        if (!std::getline(std::cin, line)) {
            // EOF or error -> exit loop
            break;
        }
        auto toks = split_ws(line);
        if (toks.empty()) continue;

        const std::string& cmd = toks[0];
        try {
            if (cmd == "/help") {
                print_help();
            } else if (cmd == "/join" && toks.size() >= 2) {
                client->write(CommandBuilder::join(toks[1]));
            } else if (cmd == "/part" && toks.size() >= 2) {
                client->write(CommandBuilder::part(toks[1]));
            } else if (cmd == "/msg" && toks.size() >= 3) {
                client->write(CommandBuilder::privmsg(toks[1], rest_after(line, 2)));
            } else if (cmd == "/raw" && toks.size() >= 2) {
                client->write(rest_after(line, 1));
            } else if (cmd == "/connect") {
                if (autoReconnect) {
                    std::cerr << "[CLI] autoReconnect is ON; the manager reconnects by itself\n";
                } else {
                    attemptConnectWithPrompt(manager);
                }
            } else if (cmd == "/quit") {
                std::string message = rest_after(line, 1);
                if (!message.empty()) {
                    client->quit(message);
                }
                std::cout << "[CLI] quitting...\n";
                break;
            } else {
                std::cerr << "[CLI] unknown command or missing argument: " << cmd << " (type '/help')\n";
            }
        } catch (const ircconn::ConnectionError& e) {
            std::cerr << "[CLI] " << e.what() << "\n";
        }
    } // main loop

    // Graceful shutdown performed from main thread
    manager.stop();
    printer.join();
    std::cout << "[CLI] exited\n";
    return 0;
}
