#include <cassert>
#include <chrono>
#include <core/util/progress_channel.h>
#include <thread>

using namespace lanbeam::core;
using namespace std::chrono_literals;

namespace {

TransferEvent event(const std::string& file_id, TransferEventKind kind, uint64_t bytes = 0) {
    TransferEvent e;
    e.session_id = "s";
    e.file_id = file_id;
    e.kind = kind;
    e.bytes_transferred = bytes;
    e.bytes_total = 100;
    return e;
}

void eventsComeOutInOrder() {
    ProgressChannel channel(8);
    channel.Push(event("a", TransferEventKind::kProgress, 10));
    channel.Push(event("a", TransferEventKind::kCompleted, 100));
    assert(channel.size() == 2);

    auto first = channel.Poll();
    assert(first && first->kind == TransferEventKind::kProgress && first->bytes_transferred == 10);
    auto second = channel.Poll();
    assert(second && second->IsTerminal());
    assert(!channel.Poll());
}

void fullChannelDropsProgressButKeepsTerminalEvents() {
    ProgressChannel channel(2);
    channel.Push(event("a", TransferEventKind::kProgress, 1));
    channel.Push(event("a", TransferEventKind::kProgress, 2));
    channel.Push(event("a", TransferEventKind::kProgress, 3));
    assert(channel.size() == 2);
    assert(channel.dropped() == 1);

    channel.Push(event("a", TransferEventKind::kCompleted, 100));
    channel.Push(event("b", TransferEventKind::kFailed));
    channel.Push(event("c", TransferEventKind::kRejected));
    // no progress left to evict, terminal events grow past capacity
    channel.Push(event("d", TransferEventKind::kProgress, 5));

    auto events = channel.Drain();
    assert(events.size() == 3);
    assert(events[0].kind == TransferEventKind::kCompleted);
    assert(events[1].kind == TransferEventKind::kFailed);
    assert(events[2].kind == TransferEventKind::kRejected);
    assert(channel.dropped() == 4);
}

void waitPopWakesOnPushAndClose() {
    ProgressChannel channel(4);
    assert(!channel.WaitPop(10ms));

    std::thread producer([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.Push(event("a", TransferEventKind::kCancelled));
    });
    auto popped = channel.WaitPop(5s);
    producer.join();
    assert(popped && popped->kind == TransferEventKind::kCancelled);

    std::thread closer([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.Close();
    });
    auto start = std::chrono::steady_clock::now();
    assert(!channel.WaitPop(5s));
    closer.join();
    assert(std::chrono::steady_clock::now() - start < 5s);
    assert(channel.closed());

    channel.Push(event("b", TransferEventKind::kCompleted));
    assert(channel.size() == 0);
}

} // namespace

int main() {
    eventsComeOutInOrder();
    fullChannelDropsProgressButKeepsTerminalEvents();
    waitPopWakesOnPushAndClose();
    return 0;
}
