#include <cli/progress_display.h>
#include <fmt/format.h>

namespace lanbeam::cli {

using core::TransferEvent;
using core::TransferEventKind;

ProgressDisplay::ProgressDisplay(Terminal& terminal)
    : terminal_(terminal) {}

void ProgressDisplay::Update(const TransferEvent& event) {
    if (event.IsTerminal()) {
        printOutcome(event);
        last_percent_.erase(event.file_id);
        return;
    }
    printProgress(event);
}

void ProgressDisplay::printProgress(const TransferEvent& event) {
    int percent = event.bytes_total == 0
                      ? 100
                      : static_cast<int>(event.bytes_transferred * 100 / event.bytes_total);
    auto [it, inserted] = last_percent_.try_emplace(event.file_id, -1);
    if (!inserted && it->second == percent) {
        return;
    }
    it->second = percent;
    terminal_.Overwrite(fmt::format("{} | {:3d}% | {} / {} bytes",
                                    event.file_name,
                                    percent,
                                    event.bytes_transferred,
                                    event.bytes_total));
    line_dirty_ = true;
}

void ProgressDisplay::printOutcome(const TransferEvent& event) {
    Clear();
    std::string line = fmt::format("{}: {}",
                                   event.file_name,
                                   core::TransferEventKindToString(event.kind));
    if (!event.error.empty()) {
        line += " (" + event.error + ")";
    }
    if (event.kind == TransferEventKind::kCompleted) {
        terminal_.PrintInfo(line);
    } else {
        terminal_.PrintError(line);
    }
}

void ProgressDisplay::Clear() {
    if (line_dirty_) {
        terminal_.Overwrite("");
        line_dirty_ = false;
    }
}

} // namespace lanbeam::cli
