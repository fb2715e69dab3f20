#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <session/simulation.hpp>

enum class PlaybackEvent {
    SimulationLoaded,
    SimulationCleared,
    RoundChanged,
};

// Shared playback state: N simulation slots viewed side by side at one
// current round. Not thread-safe; owned by the UI thread.
class PlaybackModel {
public:
    // slot = the affected slot for load/clear events, -1 for RoundChanged.
    using Listener = std::function<void(PlaybackEvent event, int slot)>;

    explicit PlaybackModel(size_t slots = 2);

    size_t slot_count() const { return slots_.size(); }

    // Throws std::out_of_range for a bad slot. Re-clamps the current round.
    void load(size_t slot, std::shared_ptr<Simulation> sim);
    void clear(size_t slot);

    // nullptr when the slot is empty. Throws std::out_of_range for a bad slot.
    std::shared_ptr<Simulation> simulation(size_t slot) const;
    bool any_loaded() const;

    // Largest round count over loaded slots, 0 when nothing is loaded.
    uint32_t max_rounds() const;

    uint32_t current_round() const { return current_round_; }

    // Clamp to [0, max_rounds - 1] (0 with nothing loaded). Listeners hear
    // RoundChanged only when the clamped value differs.
    void set_current_round(int64_t round);
    void step(int64_t delta) { set_current_round(static_cast<int64_t>(current_round_) + delta); }

    void on_change(Listener listener);

private:
    void notify(PlaybackEvent event, int slot);
    void check_slot(size_t slot) const;

    std::vector<std::shared_ptr<Simulation>> slots_;
    std::vector<Listener> listeners_;
    uint32_t current_round_ = 0;
};
