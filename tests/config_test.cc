#include <cassert>
#include <core/util/config.h>
#include <toml++/toml.h>

using namespace lanbeam::core;
using namespace std::chrono_literals;

namespace {

void settingsAreOverridden() {
    auto table = toml::parse(R"(
        [setting]
        alias = "workstation"
        port = 40123
        https = false
        save-dir = "/srv/inbox"
        quick-save = true
        multicast-group = "224.0.0.200"
        multicast-port = 40124
        announce-interval = 2
        device-ttl = 7
        upload-concurrency = 8
        chunk-size = 131072
        decision-timeout = 15
        session-timeout = 90
        device-type = "server"
        device-model = "Debian"
    )");

    Settings target;
    ApplyConfig(table, target);
    assert(target.alias == "workstation");
    assert(target.port == 40123);
    assert(!target.https);
    assert(target.save_dir == "/srv/inbox");
    assert(target.quick_save);
    assert(target.multicast_group == "224.0.0.200");
    assert(target.multicast_port == 40124);
    assert(target.announce_interval == 2s);
    assert(target.device_ttl == 7s);
    assert(target.upload_concurrency == 8);
    assert(target.chunk_size == 131072);
    assert(target.decision_timeout == 15s);
    assert(target.session_timeout == 90s);
    assert(target.device_type == DeviceType::kServer);
    assert(target.device_model == "Debian");
}

void invalidValuesKeepDefaults() {
    auto table = toml::parse(R"(
        [setting]
        port = 70000
        https = "yes"
        upload-concurrency = 0
        chunk-size = 10
        announce-interval = -1
        device-type = "toaster"
        alias = 42
    )");

    Settings defaults;
    Settings target;
    ApplyConfig(table, target);
    assert(target.port == defaults.port);
    assert(target.https == defaults.https);
    assert(target.upload_concurrency == defaults.upload_concurrency);
    assert(target.chunk_size == defaults.chunk_size);
    assert(target.announce_interval == defaults.announce_interval);
    assert(target.device_type == defaults.device_type);
    assert(target.alias == defaults.alias);
}

void missingSectionChangesNothing() {
    auto table = toml::parse(R"(
        [other]
        port = 1
    )");
    Settings target;
    ApplyConfig(table, target);
    assert(target.port == protocol::kDefaultHttpPort);
    assert(target.https);
    assert(target.multicast_group == protocol::kDefaultMulticastGroup);
}

} // namespace

int main() {
    settingsAreOverridden();
    invalidValuesKeepDefaults();
    missingSectionChangesNothing();
    return 0;
}
