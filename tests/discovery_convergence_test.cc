#include <boost/asio/io_context.hpp>
#include <cassert>
#include <core/model.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/util/config.h>
#include <vector>

using namespace lanbeam::core;

namespace {

DeviceInfo identity(const std::string& alias, const std::string& fingerprint, uint16_t port) {
    DeviceInfo info;
    info.alias = alias;
    info.fingerprint = fingerprint;
    info.device_model = "Linux";
    info.port = port;
    info.https = true;
    return info;
}

void twoPeersLearnEachOther() {
    boost::asio::io_context ioc;
    Settings settings;
    DeviceRegistry registry_a;
    DeviceRegistry registry_b;

    std::vector<Feedback> seen_by_b;
    DiscoveryManager a(ioc, registry_a, settings, identity("Alice", "fa", 40001));
    DiscoveryManager b(ioc, registry_b, settings, identity("Bob", "fb", 40002),
                       [&seen_by_b](const Feedback& event) { seen_by_b.push_back(event); });

    auto reply = b.HandleDatagram(a.Announcement(), "10.0.0.1");
    assert(reply.has_value());

    auto alice = registry_b.GetDevice("fa");
    assert(alice && alice->alias == "Alice");
    assert(alice->ip == "10.0.0.1");
    assert(alice->port == 40001);
    assert(seen_by_b.size() == 1 && seen_by_b.front().type == FeedbackType::kFoundDevice);

    // a reply is not answered again
    assert(!a.HandleDatagram(*reply, "10.0.0.2"));
    auto bob = registry_a.GetDevice("fb");
    assert(bob && bob->alias == "Bob");
    assert(bob->ip == "10.0.0.2");

    // a repeat announcement refreshes without another found event
    assert(b.HandleDatagram(a.Announcement(), "10.0.0.1"));
    assert(seen_by_b.size() == 1);
    assert(registry_b.size() == 1);
}

void ownAndMalformedDatagramsAreDropped() {
    boost::asio::io_context ioc;
    Settings settings;
    DeviceRegistry registry;
    DiscoveryManager self(ioc, registry, settings, identity("Self", "ff", 40003));

    assert(!self.HandleDatagram(self.Announcement(), "10.0.0.3"));
    assert(!self.HandleDatagram("{not json", "10.0.0.4"));
    assert(!self.HandleDatagram(R"({"alias":"NoFingerprint"})", "10.0.0.4"));
    assert(registry.size() == 0);
}

void missingPortFallsBackToReceiverDefaults() {
    boost::asio::io_context ioc;
    Settings settings;
    DeviceRegistry registry;
    DiscoveryManager receiver(ioc, registry, settings, identity("Recv", "r1", 40004));

    receiver.HandleDatagram(R"({"alias":"Bare","fingerprint":"b1","announce":true})", "10.0.0.5");
    auto bare = registry.GetDevice("b1");
    assert(bare && bare->port == 40004);
    assert(bare->https);
}

void silentModeRecordsButDoesNotAnswer() {
    boost::asio::io_context ioc;
    Settings settings;
    DeviceRegistry registry_a;
    DeviceRegistry registry_b;
    DiscoveryManager a(ioc, registry_a, settings, identity("Alice", "fa", 40001));
    DiscoveryManager b(ioc, registry_b, settings, identity("Bob", "fb", 40002));
    b.set_answer_announcements(false);

    assert(!b.HandleDatagram(a.Announcement(), "10.0.0.1"));
    assert(registry_b.GetDevice("fa"));
}

} // namespace

int main() {
    twoPeersLearnEachOther();
    ownAndMalformedDatagramsAreDropped();
    missingPortFallsBackToReceiverDefaults();
    silentModeRecordsButDoesNotAnswer();
    return 0;
}
