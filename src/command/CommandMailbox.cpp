#include "command/CommandMailbox.h"

#include <utility>

void CommandMailbox::post(ControlCommand command) {
    std::lock_guard<std::mutex> lock(mutex);
    pending.push_back(std::move(command));
}

std::vector<ControlCommand> CommandMailbox::drain() {
    std::vector<ControlCommand> out;
    {
        std::lock_guard<std::mutex> lock(mutex);
        out.swap(pending);
    }
    return out;
}

bool CommandMailbox::empty() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.empty();
}
