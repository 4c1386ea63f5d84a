#include <cassert>
#include <chrono>
#include <core/network/client/session_negotiator.h>
#include <core/network/client/transfer_manifest.h>
#include <core/security/file_hasher.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <variant>

using namespace lanbeam::core;
namespace fs = std::filesystem;

namespace {

fs::path makeTempDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() / ("lanbeam-manifest-" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void write(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

std::string readAll(ByteSource& source) {
    std::string out;
    char buffer[3];
    while (std::size_t n = source.Read(buffer, sizeof(buffer))) {
        out.append(buffer, n);
    }
    return out;
}

const FileDto& byName(const TransferManifest& manifest, const std::string& name) {
    for (const auto& [id, file] : manifest.files()) {
        if (file.file_name == name) {
            return file;
        }
    }
    assert(false && "file missing from manifest");
    return manifest.files().begin()->second;
}

void filesAndDirectories() {
    auto dir = makeTempDir();
    write(dir / "single.png", "png-bytes");
    write(dir / "album" / "a.jpg", "aaaa");
    write(dir / "album" / "nested" / "b.txt", "bb");
    write(dir / "album" / "empty.bin", "");

    auto manifest = TransferManifestBuilder(true)
                        .AddPath(dir / "single.png")
                        .AddPath(dir / "album")
                        .Build();

    assert(manifest.files().size() == 3);
    assert(manifest.total_size() == 9 + 4 + 2);

    const auto& single = byName(manifest, "single.png");
    assert(single.size == 9);
    assert(single.file_type == FileType::kImage);
    assert(single.sha256 == FileHasher::CalculateDataChecksum("png-bytes"));
    assert(!single.preview);

    const auto& nested = byName(manifest, "album/nested/b.txt");
    assert(nested.file_type == FileType::kText);
    auto source = manifest.Open(nested);
    assert(readAll(*source) == "bb");

    byName(manifest, "album/a.jpg");

    std::set<std::string> ids;
    for (const auto& [id, file] : manifest.files()) {
        assert(id == file.id);
        ids.insert(id);
    }
    assert(ids.size() == 3);

    bool threw = false;
    try {
        TransferManifestBuilder().AddFile(dir / "missing.txt");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
}

void textMessages() {
    auto manifest = TransferManifestBuilder().AddText("hello").AddText("").Build();
    assert(manifest.files().size() == 1);

    const auto& text = manifest.files().begin()->second;
    assert(text.file_name == "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824.txt");
    assert(text.file_type == FileType::kText);
    assert(text.size == 5);
    assert(text.preview == "hello");
    assert(!text.sha256);

    auto source = manifest.Open(text);
    assert(readAll(*source) == "hello");

    auto large = TransferManifestBuilder().AddText(std::string(4096, 'x')).Build();
    assert(!large.files().begin()->second.preview);

    bool threw = false;
    try {
        manifest.Open(FileDto{"unknown", "x.txt", 1});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
}

void interpretingPrepareUploadResponses() {
    DeviceInfo peer;
    peer.alias = "Receiver";
    peer.fingerprint = "rf";
    std::map<std::string, FileDto> offered{{"f1", FileDto{"f1", "a.txt", 3}},
                                           {"f2", FileDto{"f2", "b.txt", 4}}};

    using Kind = NegotiationError::Kind;
    auto kind = [](const NegotiationOutcome& outcome) {
        return std::get<NegotiationError>(outcome).kind;
    };

    auto partial = SessionNegotiator::InterpretResponse(
        peer, offered, 200, R"({"sessionId":"s1","files":{"f1":"t1","ghost":"t9"}})");
    const auto& handle = std::get<SessionHandle>(partial);
    assert(handle.session_id == "s1");
    assert(handle.files.size() == 2);
    assert(handle.tokens.size() == 1);
    assert(handle.Accepted("f1"));
    assert(!handle.Accepted("f2"));
    assert(handle.peer.alias == "Receiver");

    auto declined = SessionNegotiator::InterpretResponse(peer, offered, 403, "declined");
    assert(kind(declined) == Kind::kRejected);
    assert(std::get<NegotiationError>(declined).status == 403u);
    assert(kind(SessionNegotiator::InterpretResponse(peer, offered, 204, "")) == Kind::kRejected);
    assert(kind(SessionNegotiator::InterpretResponse(peer, offered, 409, "")) == Kind::kRejected);
    assert(kind(SessionNegotiator::InterpretResponse(peer, offered, 200, "{oops"))
           == Kind::kMalformedResponse);
    assert(kind(SessionNegotiator::InterpretResponse(peer, offered, 200, R"({"files":{}})"))
           == Kind::kMalformedResponse);
    assert(kind(SessionNegotiator::InterpretResponse(
               peer, offered, 200, R"({"sessionId":"","files":{"f1":"t1"}})"))
           == Kind::kMalformedResponse);
    assert(kind(SessionNegotiator::InterpretResponse(
               peer, offered, 200, R"({"sessionId":"s2","files":{"ghost":"t9"}})"))
           == Kind::kRejected);
}

} // namespace

int main() {
    filesAndDirectories();
    textMessages();
    interpretingPrepareUploadResponses();
    return 0;
}
