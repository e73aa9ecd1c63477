#include "console_renderer.hh"

#include "display_format.hh"

#include <fmt/format.h>

ConsoleRenderer::ConsoleRenderer(NavigationState& state)
    : m_state(state)
{
    m_state_listener = m_state.AttachListener(GetSemaphore());
}

std::optional<milliseconds>
ConsoleRenderer::OnActivation()
{
    auto state = m_state.CheckoutReadonly();

    if (state == m_last_drawn)
    {
        return std::nullopt;
    }
    m_last_drawn = state;

    if (state->session == NavigationState::SessionState::kIdle)
    {
        fmt::print("[idle]\n");
        return std::nullopt;
    }

    auto position = state->position.value_or(GpsPosition {0, 0});

    fmt::print("[{:4}] {:.6f},{:.6f} {:>5} | {:>8} | {:>7} | {}\n",
               state->route_index,
               position.latitude,
               position.longitude,
               display::FormatBearing(state->bearing),
               display::FormatDistance(state->distance_to_destination),
               display::FormatDuration(state->estimated_time_remaining),
               state->next_instruction);

    return std::nullopt;
}
