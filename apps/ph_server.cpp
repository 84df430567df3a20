// SPDX-License-Identifier: MIT
// Part of PageHost (PH) project.
// apps/ph_server.cpp

#include "ph/event_log.hpp"
#include "ph/log.hpp"
#include "ph/server.hpp"
#include "ph/server_config.hpp"
#include "ph/internal/time.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--port 8443] [--bind 0.0.0.0]\n"
         "  [--identity server.p12] [--passphrase <secret>]\n"
         "  [--document webRTC.html] [--iface " << ph::kDefaultWifiInterface << "]\n"
         "  [--max_conns 64] [--idle_timeout 10]\n"
         "  [--log_file log.txt]\n"
         "  [--quiet 0|1]                    (suppress all console logs when 1)\n"
         "Commands on stdin: start | stop | status | url | logs | clear | quit\n";
}

static void print_status(const ph::Server& srv) {
    ph::ServerStatus st = srv.status();
    std::string line = std::string("[STATUS] ") + ph::to_string(st.state);
    if (!st.url.empty()) line += " " + st.url;
    if (!st.reason.empty()) line += " (" + st.reason + ")";
    line += " active=" + std::to_string(srv.active_connections());
    ph::log_line(line);
}

int main(int argc, char** argv) {
    ph::ServerConfig cfg;
    std::string log_file;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--bind" && i+1 < argc) cfg.bind_addr = argv[++i];
            else if (a == "--identity" && i+1 < argc) cfg.identity_file = argv[++i];
            else if (a == "--passphrase" && i+1 < argc) cfg.identity_passphrase = argv[++i];
            else if (a == "--document" && i+1 < argc) cfg.document_file = argv[++i];
            else if (a == "--iface" && i+1 < argc) cfg.wifi_interface = argv[++i];
            else if (a == "--max_conns" && i+1 < argc) cfg.max_connections = (std::size_t)std::stoul(argv[++i]);
            else if (a == "--idle_timeout" && i+1 < argc) cfg.idle_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        // std::stoi / std::stoul on a malformed number
        usage(argv[0]);
        return 2;
    }

    if (cfg.max_connections == 0 || cfg.idle_timeout_sec <= 0) {
        std::cerr << "--max_conns and --idle_timeout must be positive\n";
        return 2;
    }

    // A peer vanishing mid-response must fail the write, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    if (!log_file.empty()) {
        ph::set_log_file(log_file);
    }
    ph::log_line("[INFO] PageHost starting at " + ph::utc_iso8601_now());

    try {
        ph::EventLog events(cfg.log_cap);
        ph::Server srv(cfg, &events);
        srv.start();

        std::string cmd;
        while (std::getline(std::cin, cmd)) {
            if (cmd == "start") srv.start();
            else if (cmd == "stop") srv.stop();
            else if (cmd == "status") print_status(srv);
            else if (cmd == "url") {
                ph::ServerStatus st = srv.status();
                ph::log_line(st.url.empty() ? "[URL] (not running)" : "[URL] " + st.url);
            }
            else if (cmd == "logs") {
                for (const auto& e : events.entries()) {
                    std::cout << e.text << '\n';
                }
                std::cout.flush();
            }
            else if (cmd == "clear") events.clear();
            else if (cmd == "quit" || cmd == "exit") break;
            else if (!cmd.empty()) ph::log_line("[WARN] unknown command: " + cmd);
        }
        // ~Server stops the listener and waits for in-flight connections
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
