#pragma once

#include "terminal.h"
#include <core/model/transfer_event.h>
#include <string>
#include <unordered_map>

namespace lanbeam::cli {

// Renders the sender's event stream: one rewritten status line for progress
// and one permanent line per finished file.
class ProgressDisplay {
public:
    explicit ProgressDisplay(Terminal& terminal);

    void Update(const core::TransferEvent& event);

    void Clear();

private:
    void printProgress(const core::TransferEvent& event);
    void printOutcome(const core::TransferEvent& event);

    Terminal& terminal_;
    std::unordered_map<std::string, int> last_percent_;
    bool line_dirty_ = false;
};

} // namespace lanbeam::cli
