#include "core/HistoryBuffer.h"
#include "util/Logger.h"

#include <stdexcept>

HistorySnapshot HistorySnapshot::capture(const WorldState& world) {
    HistorySnapshot snap;
    snap.tick = world.tick;
    snap.drones = world.drones;
    snap.bases = world.bases;
    snap.groups = world.groups;
    return snap;
}

void HistorySnapshot::restoreInto(WorldState& world) const {
    world.tick = tick;
    world.drones = drones;
    world.bases = bases;
    world.groups = groups;
}

HistoryBuffer::HistoryBuffer(std::size_t capacity)
    : slots(capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("HistoryBuffer: capacity must be > 0");
    }
}

void HistoryBuffer::push(const WorldState& world) {
    if (isRewound()) {
        Log::history("[HISTORY] discarding ", count - cursor - 1,
            " snapshots after tick ", at(cursor).tick, "\n");
        count = cursor + 1;
    }

    if (count < slots.size()) {
        slots[physical(count)] = HistorySnapshot::capture(world);
        ++count;
    }
    else {
        // Full: overwrite the oldest and advance the head.
        slots[head] = HistorySnapshot::capture(world);
        head = (head + 1) % slots.size();
    }

    cursor = count - 1;
}

bool HistoryBuffer::stepBack(WorldState& world) {
    if (count == 0 || cursor == 0) {
        return false;
    }

    --cursor;
    at(cursor).restoreInto(world);
    return true;
}

bool HistoryBuffer::jumpBack(std::size_t ticks, WorldState& world) {
    if (count == 0) {
        return false;
    }

    cursor = (ticks > cursor) ? 0 : cursor - ticks;
    at(cursor).restoreInto(world);
    Log::history("[HISTORY] jumped back to tick ", at(cursor).tick, "\n");
    return true;
}

const HistorySnapshot& HistoryBuffer::at(std::size_t index) const {
    if (index >= count) {
        throw std::out_of_range("HistoryBuffer::at: index out of range");
    }
    return slots[physical(index)];
}
