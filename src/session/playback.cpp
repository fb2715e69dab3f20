#include "playback.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

PlaybackModel::PlaybackModel(size_t slots) : slots_(slots) {}

void PlaybackModel::check_slot(size_t slot) const {
    if (slot >= slots_.size()) {
        throw std::out_of_range(fmt::format("Slot {} out of range (have {})", slot, slots_.size()));
    }
}

void PlaybackModel::load(size_t slot, std::shared_ptr<Simulation> sim) {
    check_slot(slot);
    slots_[slot] = std::move(sim);
    notify(PlaybackEvent::SimulationLoaded, static_cast<int>(slot));
    set_current_round(current_round_);
}

void PlaybackModel::clear(size_t slot) {
    check_slot(slot);
    if (!slots_[slot]) return;
    slots_[slot].reset();
    notify(PlaybackEvent::SimulationCleared, static_cast<int>(slot));
    set_current_round(current_round_);
}

std::shared_ptr<Simulation> PlaybackModel::simulation(size_t slot) const {
    check_slot(slot);
    return slots_[slot];
}

bool PlaybackModel::any_loaded() const {
    return std::any_of(slots_.begin(), slots_.end(),
                       [](const std::shared_ptr<Simulation>& s) { return s != nullptr; });
}

uint32_t PlaybackModel::max_rounds() const {
    uint32_t most = 0;
    for (const auto& sim : slots_) {
        if (sim) most = std::max(most, sim->num_rounds());
    }
    return most;
}

void PlaybackModel::set_current_round(int64_t round) {
    uint32_t total = max_rounds();
    int64_t upper = total > 0 ? static_cast<int64_t>(total) - 1 : 0;
    auto clamped = static_cast<uint32_t>(std::clamp<int64_t>(round, 0, upper));
    if (clamped == current_round_) return;
    current_round_ = clamped;
    notify(PlaybackEvent::RoundChanged, -1);
}

void PlaybackModel::on_change(Listener listener) {
    listeners_.push_back(std::move(listener));
}

void PlaybackModel::notify(PlaybackEvent event, int slot) {
    for (const auto& listener : listeners_) {
        listener(event, slot);
    }
}
