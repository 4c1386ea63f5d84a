#include <cassert>
#include <core/model.h>
#include <nlohmann/json.hpp>
#include <string>

using namespace lanbeam::core;
using json = nlohmann::json;

namespace {

DeviceInfo sampleDevice() {
    DeviceInfo device;
    device.alias = "Desk";
    device.fingerprint = "ab12cd";
    device.device_model = "Linux";
    device.device_type = DeviceType::kDesktop;
    device.port = 53317;
    device.https = true;
    return device;
}

void announcementRoundTrip() {
    MulticastDto dto{sampleDevice(), true};
    auto parsed = MulticastDto::Parse(dto.Serialize(), DeviceInfoDefaults{});
    assert(parsed.has_value());
    assert(*parsed == dto);

    auto wire = json::parse(dto.Serialize());
    assert(wire["protocol"] == "https");
    assert(wire["deviceType"] == "desktop");
    assert(wire["announce"] == true);
    assert(!wire.contains("ip"));
}

void optionalFieldsFallBack() {
    auto parsed = MulticastDto::Parse(R"({"alias":"Phone","fingerprint":"ff00"})",
                                      DeviceInfoDefaults{40000, true});
    assert(parsed.has_value());
    assert(parsed->device.version == "1.0");
    assert(parsed->device.port == 40000);
    assert(parsed->device.https);
    assert(parsed->device.device_type == DeviceType::kDesktop);
    assert(!parsed->device.download);
    assert(!parsed->announce);

    auto legacy = MulticastDto::Parse(R"({"alias":"Old","fingerprint":"01","announcement":true})",
                                      DeviceInfoDefaults{});
    assert(legacy && legacy->announce);

    auto unknown_type = MulticastDto::Parse(R"({"alias":"X","fingerprint":"02","deviceType":"toaster"})",
                                            DeviceInfoDefaults{});
    assert(unknown_type && unknown_type->device.device_type == DeviceType::kDesktop);
}

void malformedAnnouncementsAreRejected() {
    assert(!MulticastDto::Parse("not json", DeviceInfoDefaults{}));
    assert(!MulticastDto::Parse("[1,2,3]", DeviceInfoDefaults{}));
    assert(!MulticastDto::Parse(R"({"fingerprint":"ff"})", DeviceInfoDefaults{}));
    assert(!MulticastDto::Parse(R"({"alias":"NoId"})", DeviceInfoDefaults{}));
    assert(!MulticastDto::Parse(R"({"alias":"A","fingerprint":""})", DeviceInfoDefaults{}));
    assert(!MulticastDto::Parse(R"({"alias":"A","fingerprint":"f","port":"x"})",
                                DeviceInfoDefaults{}));
    assert(!MulticastDto::Parse(R"({"alias":"A","fingerprint":"f","protocol":"ftp"})",
                                DeviceInfoDefaults{}));
}

void prepareUploadRoundTrip() {
    FileDto file;
    file.id = "f1";
    file.file_name = "a.txt";
    file.size = 11;
    file.file_type = FileType::kText;
    file.preview = "hello world";

    PrepareUploadRequestDto request{sampleDevice(), {{"f1", file}}};
    json wire = request;
    assert(wire["files"]["f1"]["fileName"] == "a.txt");
    assert(wire["files"]["f1"]["fileType"] == "text");
    assert(!wire["files"]["f1"].contains("sha256"));

    auto parsed = ParsePrepareUploadRequest(json::parse(wire.dump()), DeviceInfoDefaults{});
    assert(parsed == request);

    PrepareUploadResponseDto response{"s1", {{"f1", "tok1"}}};
    json response_wire = response;
    assert(response_wire["sessionId"] == "s1");
    assert(response_wire.get<PrepareUploadResponseDto>() == response);
}

void prepareUploadRejectsBadEntries() {
    bool threw = false;
    try {
        ParsePrepareUploadRequest(
            json::parse(R"({"info":{"alias":"A","fingerprint":"f"},
                            "files":{"f1":{"id":"other","fileName":"a","size":1}}})"),
            DeviceInfoDefaults{});
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ParsePrepareUploadRequest(
            json::parse(R"({"info":{"alias":"A","fingerprint":"f"},
                            "files":{"f1":{"id":"f1","size":1}}})"),
            DeviceInfoDefaults{});
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
}

void statusTransitionsOnlyMoveForward() {
    assert(CanTransition(SessionStatus::kNegotiating, SessionStatus::kAccepted));
    assert(CanTransition(SessionStatus::kAccepted, SessionStatus::kTransferring));
    assert(CanTransition(SessionStatus::kTransferring, SessionStatus::kCompleted));
    assert(CanTransition(SessionStatus::kTransferring, SessionStatus::kCancelled));
    assert(!CanTransition(SessionStatus::kAccepted, SessionStatus::kNegotiating));
    assert(!CanTransition(SessionStatus::kTransferring, SessionStatus::kAccepted));
    assert(!CanTransition(SessionStatus::kCompleted, SessionStatus::kFailed));
    assert(!CanTransition(SessionStatus::kCancelled, SessionStatus::kTransferring));
    assert(!CanTransition(SessionStatus::kRejected, SessionStatus::kAccepted));
}

} // namespace

int main() {
    announcementRoundTrip();
    optionalFieldsFallBack();
    malformedAnnouncementsAreRejected();
    prepareUploadRoundTrip();
    prepareUploadRejectsBadEntries();
    statusTransitionsOnlyMoveForward();
    return 0;
}
