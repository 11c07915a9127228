// publish a few text messages on one resource of an entity
// to try it over the network, start simple-subscribe first, then
// ./simple-publish --transport network
//
#include "upbus/Upbus.hpp"
#include "CmdLine.hpp"

#include <chrono>
#include <iostream>
#include <thread>

using namespace std;
using namespace upbus;

int main(int argc, char** argv) {
    pattern::SingletonGuardian<app::SyncLogger> logGuard(std::cerr);
    auto helpStr =
    R"|(
This program publishes "Message #1" .. "Message #<count>" on //<authority>/<entityId>/<version>/<resourceId>.
)|";
    auto cfgString =
R"|(
{
    "transport"         : "local",              "__transport"           : "local or network",
    "authority"         : "my-vehicle",         "__authority"           : "authority of the publishing entity",
    "entityId"          : "a34b",               "__entityId"            : "entity id in hex",
    "version"           : "1",                  "__version"             : "entity version in hex",
    "resourceId"        : "8001",               "__resourceId"          : "resource id in hex",
    "count"             : 5,                    "__count"               : "how many messages to publish",
    "intervalMillisec"  : 1000,                 "__intervalMillisec"    : "pause between messages",
    "ifaceAddr"         : "127.0.0.1",          "__ifaceAddr"           : "(network) ip address for the NIC interface for IO",
    "udpcastDests"      : "232.43.212.234:4321","__udpcastDests"        : "(network) where the messages go",
    "udpcastListenAddr" : "232.43.212.234",     "__udpcastListenAddr"   : "(network) where messages are received",
    "udpcastListenPort" : 4321,                 "__udpcastListenPort"   : "(network) where messages are received",
    "logLevel"          : 1,                    "__logLevel"            : "0 debug, 1 notice, 2 warning, 3 critical"
}
)|";
    try {
        auto config = example::parseCmdLine(argc, argv, helpStr, cfgString);
        if (!config) return 0;
        app::SyncLogger::instance().setMinLogLevel((app::SyncLogger::Level)config->getExt<int>("logLevel"));
        UPBUS_LOG_N(" in effect config: ", *config);

        auto authority = config->getExt<string>("authority");
        Transport::ptr transport;
        if (config->getExt<string>("transport") == "network") {
            transport = net::NetworkTransport::builder(authority)
                .withConfig(example::netConfig(*config)).build();
        } else {
            transport = LocalTransport::create();
        }
        auto uriProvider = StaticUriProvider::create(authority
            , config->getHex<uint32_t>("entityId"), config->getHex<uint8_t>("version"));
        communication::SimplePublisher publisher(transport, uriProvider);

        auto resourceId = config->getHex<uint32_t>("resourceId");
        auto count = config->getExt<int>("count");
        auto interval = chrono::milliseconds(config->getExt<int>("intervalMillisec"));
        for (auto i = 1; i <= count; ++i) {
            auto text = "Message #" + to_string(i);
            publisher.publish(resourceId, UPayload::fromString(text));
            cout << "published " << text << " on " << uriProvider->resourceUri(resourceId) << endl;
            if (i != count) this_thread::sleep_for(interval);
        }
    } catch (std::exception const& e) {
        UPBUS_LOG_C(e.what());
        return 1;
    }
    return 0;
}
