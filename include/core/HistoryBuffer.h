#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/WorldState.h"

// Independent value copy of the simulated part of the world at one tick.
struct HistorySnapshot {
    int64_t tick = 0;
    std::map<std::string, Drone> drones;
    std::map<std::string, Base> bases;
    std::map<int, CommandGroup> groups;

    static HistorySnapshot capture(const WorldState& world);

    // Copy this snapshot's contents into `world`. Clock flags and the group id
    // counter are left alone so ids stay monotonic across a rewind.
    void restoreInto(WorldState& world) const;
};

// Fixed-capacity ring of snapshots with a playback cursor.
//
// Storage is allocated once at construction and reused cyclically. While not
// rewound the cursor sits on the newest snapshot. Rewinding moves it back;
// the next push() first discards everything after the cursor (the abandoned
// future) and then appends.
class HistoryBuffer {
public:
    explicit HistoryBuffer(std::size_t capacity);

    // Record a snapshot of `world`, evicting the oldest when full.
    void push(const WorldState& world);

    // Move the cursor back one snapshot and restore it. Returns false (and
    // leaves `world` untouched) when already at the oldest snapshot.
    bool stepBack(WorldState& world);

    // Restore the snapshot `ticks` entries behind the cursor, clamped to the
    // oldest. Returns false only when the buffer is empty.
    bool jumpBack(std::size_t ticks, WorldState& world);

    std::size_t size() const { return count; }
    std::size_t capacity() const { return slots.size(); }
    bool empty() const { return count == 0; }

    // Logical index 0 = oldest retained snapshot.
    const HistorySnapshot& at(std::size_t index) const;
    const HistorySnapshot& oldest() const { return at(0); }
    const HistorySnapshot& newest() const { return at(count - 1); }

    std::size_t getCursor() const { return cursor; }
    bool isRewound() const { return count > 0 && cursor + 1 < count; }

private:
    std::vector<HistorySnapshot> slots;
    std::size_t head = 0;     // physical index of the oldest snapshot
    std::size_t count = 0;
    std::size_t cursor = 0;   // logical index of the snapshot in play

    std::size_t physical(std::size_t logical) const {
        return (head + logical) % slots.size();
    }
};
