#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "net/EventQueue.hpp"
#include "net/GnsTransport.hpp"
#include "net/NetCommon.hpp"
#include "session/ChatSession.hpp"

static std::atomic<bool> g_quit{ false };

static void onSignal(int) { g_quit.store(true); }

int main(int argc, char** argv)
{
    SessionConfig cfg;
    std::vector<std::string> rest;
    if (!parseSessionArgs(argc, argv, cfg, rest)) return 2;
    if (!rest.empty()) {
        std::cerr << "Unknown argument: " << rest.front() << "\n";
        printSessionUsage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, &onSignal);
    std::signal(SIGTERM, &onSignal);

    NetRuntime rt;
    if (!rt.init()) {
        std::cerr << "NetRuntime init failed\n";
        return 1;
    }

    int rc = 0;
    {
        EventQueue events;
        GnsTransport transport(rt.iface(), events);
        rt.setSink(&transport);

        ChatSession session(transport, events, cfg);
        if (!session.startHosting()) {
            std::cerr << "Failed to host on port " << cfg.listenPort << "\n";
            rc = 3;
        }

        while (rc == 0 && !g_quit.load()) {
            rt.pumpCallbacks();
            session.pump();

            SessionNotice n;
            while (session.popNotice(n)) {
                if (n.kind == SessionNotice::Kind::Disconnected) g_quit.store(true);
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        session.stop("host shutting down");
        rt.setSink(nullptr);
    }

    rt.shutdown();
    return rc;
}
