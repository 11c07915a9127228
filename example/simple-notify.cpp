// an entity notifies itself through a LocalTransport
//
#include "upbus/Upbus.hpp"

#include <iostream>

using namespace std;
using namespace upbus;

int main() {
    pattern::SingletonGuardian<app::SyncLogger> logGuard(std::cerr);
    uint32_t const originResourceId = 0xd100;
    auto uriProvider = StaticUriProvider::create("my-vehicle", 0xa34b, 0x01);
    auto transport = LocalTransport::create();
    communication::SimpleNotifier notifier(transport, uriProvider);

    auto topic = uriProvider->resourceUri(originResourceId);
    auto listener = makeListener([](UMessage const& m) {
        cout << "notified by " << m.source() << ": " << m.extractString().value_or("") << endl;
    });
    try {
        notifier.startListening(topic, listener);
        notifier.notify(originResourceId, uriProvider->sourceUri(), UPayload::fromString("hello"));
        notifier.stopListening(topic, listener);
        // nobody listens anymore
        notifier.notify(originResourceId, uriProvider->sourceUri(), UPayload::fromString("unheard"));
        notifier.stopListening(topic, listener);
    } catch (ListenerNotFound const& e) {
        cout << "second stopListening: " << e.code() << endl;
    }
    return 0;
}
