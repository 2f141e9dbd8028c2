#pragma once

#include <iostream>
#include <string>

// =============================================================================
// Simple Logging System for the Swarm Simulator
//
// Provides toggleable console output for debugging the behavior controllers.
// Off by default so headless runs and tests stay quiet; the viewer flips the
// switches from its control panel.
// =============================================================================

namespace Log {

    // Global logging enable flag - toggled via UI
    inline bool enabled = false;

    // Log categories for fine-grained control
    inline bool showCommands = true;
    inline bool showControl = true;
    inline bool showCollisions = true;
    inline bool showHistory = true;

    // Core logging function
    template<typename... Args>
    inline void print(Args&&... args) {
        if (!enabled) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    // Category-specific logging helpers
    template<typename... Args>
    inline void command(Args&&... args) {
        if (!enabled || !showCommands) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void control(Args&&... args) {
        if (!enabled || !showControl) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void collision(Args&&... args) {
        if (!enabled || !showCollisions) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void history(Args&&... args) {
        if (!enabled || !showHistory) return;
        (std::cout << ... << std::forward<Args>(args));
    }

} // namespace Log
