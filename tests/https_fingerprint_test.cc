#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>
#include <cassert>
#include <cctype>
#include <chrono>
#include <core/network/client/http_client.h>
#include <core/network/client/session_negotiator.h>
#include <core/network/client/transfer_executor.h>
#include <core/network/client/transfer_manifest.h>
#include <core/network/server/controller/receive_controller.h>
#include <core/network/server/decision_provider.h>
#include <core/network/server/http_server.h>
#include <core/network/server/session_registry.h>
#include <core/security/certificate_manager.h>
#include <core/security/open_ssl_provider.h>
#include <filesystem>
#include <thread>

using namespace lanbeam::core;
namespace fs = std::filesystem;

namespace {

fs::path makeTempDir(const std::string& tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() / ("lanbeam-" + tag + "-" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

DeviceInfo sender() {
    DeviceInfo info;
    info.alias = "Sender";
    info.fingerprint = "sender-fp";
    info.port = 40000;
    info.https = true;
    return info;
}

void certificateIsPersisted(const fs::path& cert_dir, const std::string& fingerprint) {
    CertificateManager reloaded(cert_dir);
    bool ready = reloaded.InitSecurityContext();
    assert(ready);
    assert(reloaded.fingerprint() == fingerprint);
    assert(CertificateManager::FingerprintOfPem(reloaded.security_context().certificate_pem)
           == fingerprint);
}

} // namespace

int main() {
    OpenSSLProvider::InitOpenSSL();

    auto cert_dir = makeTempDir("certs");
    auto save_dir = makeTempDir("tls-inbox");
    CertificateManager cert_manager(cert_dir);
    bool ready = cert_manager.InitSecurityContext();
    assert(ready);
    const std::string fingerprint = cert_manager.fingerprint();
    assert(fingerprint.size() == 64);
    certificateIsPersisted(cert_dir, fingerprint);

    net::io_context ioc;
    auto work = net::make_work_guard(ioc);
    SessionRegistry registry;
    QuickSaveDecisionProvider decisions;
    HttpServer server(ioc, cert_manager);
    ReceiveController controller(ioc, server, registry, decisions, ReceiveOptions{save_dir});
    bool started = server.Start(0);
    assert(started);
    assert(server.https());
    std::thread io_thread([&ioc] { ioc.run(); });

    auto await = [&ioc](auto op) { return net::co_spawn(ioc, std::move(op), net::use_future).get(); };

    DeviceInfo peer;
    peer.alias = "Receiver";
    peer.fingerprint = fingerprint;
    peer.ip = "127.0.0.1";
    peer.port = server.port();
    peer.https = true;

    auto manifest = TransferManifestBuilder(true).AddText("over tls").Build();
    SessionNegotiator negotiator(ioc, sender());

    // the announced fingerprint matches the presented certificate
    auto outcome = await(negotiator.Negotiate(peer, manifest));
    auto& handle = std::get<SessionHandle>(outcome);
    ProgressChannel channel(16);
    TransferExecutor executor(ioc, channel, TransferOptions{1, 1024});
    auto result = await(executor.Run(handle, manifest, CancellationSignal{}));
    assert(result.completed == 1);
    assert(registry.GetStatus(handle.session_id) == SessionStatus::kCompleted);
    assert(registry.GetSender(handle.session_id)->https);

    // upper case hex still identifies the same key
    std::string upper = fingerprint;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    HttpClient upper_client(ioc, upper);
    assert(await(upper_client.Connect("127.0.0.1", server.port())));
    await(upper_client.Disconnect());

    // a different fingerprint is refused during the handshake
    HttpClient impostor(ioc, std::string(64, '0'));
    assert(!await(impostor.Connect("127.0.0.1", server.port())));
    assert(impostor.verification_failed());
    assert(!impostor.IsConnected());

    DeviceInfo spoofed = peer;
    spoofed.fingerprint = std::string(64, 'a');
    auto refused = await(negotiator.Negotiate(spoofed, manifest));
    assert(std::get<NegotiationError>(refused).kind == NegotiationError::Kind::kUntrustedPeer);
    assert(registry.active_count() == 0);

    // a plain client cannot speak to the TLS listener
    DeviceInfo plain_peer = peer;
    plain_peer.https = false;
    auto plain_outcome = await(negotiator.Negotiate(plain_peer, manifest));
    assert(std::holds_alternative<NegotiationError>(plain_outcome));

    net::post(ioc, [&] {
        controller.Stop();
        server.Stop();
    });
    work.reset();
    io_thread.join();

    fs::remove_all(save_dir);
    fs::remove_all(cert_dir);
    return 0;
}
