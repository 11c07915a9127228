// print what arrives on one resource of an entity until Ctrl-C
//
#include "upbus/Upbus.hpp"
#include "upbus/os/Signals.hpp"
#include "CmdLine.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace std;
using namespace upbus;

int main(int argc, char** argv) {
    pattern::SingletonGuardian<app::SyncLogger> logGuard(std::cerr);
    auto helpStr =
    R"|(
This program listens to //<authority>/<entityId>/<version>/<resourceId> over the network and prints the messages.
)|";
    auto cfgString =
R"|(
{
    "authority"         : "my-vehicle",         "__authority"           : "authority of the publishing entity",
    "entityId"          : "a34b",               "__entityId"            : "entity id in hex",
    "version"           : "1",                  "__version"             : "entity version in hex",
    "resourceId"        : "8001",               "__resourceId"          : "resource id in hex",
    "ifaceAddr"         : "127.0.0.1",          "__ifaceAddr"           : "ip address for the NIC interface for IO",
    "udpcastDests"      : "232.43.212.234:4321","__udpcastDests"        : "where sent messages go",
    "udpcastListenAddr" : "232.43.212.234",     "__udpcastListenAddr"   : "where messages are received",
    "udpcastListenPort" : 4321,                 "__udpcastListenPort"   : "where messages are received",
    "logLevel"          : 1,                    "__logLevel"            : "0 debug, 1 notice, 2 warning, 3 critical"
}
)|";
    try {
        auto config = example::parseCmdLine(argc, argv, helpStr, cfgString);
        if (!config) return 0;
        app::SyncLogger::instance().setMinLogLevel((app::SyncLogger::Level)config->getExt<int>("logLevel"));

        auto authority = config->getExt<string>("authority");
        auto transport = net::NetworkTransport::builder(authority)
            .withConfig(example::netConfig(*config)).build();
        auto uriProvider = StaticUriProvider::create(authority
            , config->getHex<uint32_t>("entityId"), config->getHex<uint8_t>("version"));
        auto topic = uriProvider->resourceUri(config->getHex<uint32_t>("resourceId"));

        transport->registerListener(topic, makeListener([](UMessage const& m) {
            auto text = m.extractString();
            if (text) {
                cout << "received: " << *text << endl;
            } else {
                cout << "received " << m << " (non-string payload)" << endl;
            }
        }));
        cout << "waiting for messages on " << topic << " (Ctrl-C to stop)" << endl;

        static atomic<bool> stopped{false};
        os::HandleSignals::onTermIntDo([]() { stopped = true; });
        while (!stopped) {
            this_thread::sleep_for(chrono::milliseconds(200));
        }
        transport->stop();
    } catch (std::exception const& e) {
        UPBUS_LOG_C(e.what());
        return 1;
    }
    return 0;
}
