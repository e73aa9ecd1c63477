#pragma once

#include "base_thread.hh"
#include "navigation_state.hh"

// Prints a line per published navigation snapshot
class ConsoleRenderer : public os::BaseThread
{
public:
    explicit ConsoleRenderer(NavigationState& state);

private:
    std::optional<milliseconds> OnActivation() final;

    NavigationState& m_state;
    std::unique_ptr<NavigationState::IListener> m_state_listener;
    std::shared_ptr<const NavigationState::State> m_last_drawn;
};
