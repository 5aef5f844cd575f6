#pragma once

/// @file clock.hpp
/// @brief Frame-to-simulation time conversion for the sandbox driver
///
/// Frame gaps (a stalled frame, a resumed pause) are capped before the time
/// scale is applied so one update never integrates an unbounded step.

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace impulse_sandbox {

// =============================================================================
// Simulation Clock
// =============================================================================

class SimulationClock {
public:
    /// Largest frame time handed to a single update, before scaling
    static constexpr float k_default_max_step = 0.05f;

    explicit SimulationClock(float max_step = k_default_max_step, float time_scale = 1.0f)
        : m_max_step(max_step > 0.0f ? max_step : k_default_max_step)
        , m_time_scale(std::max(time_scale, 0.0f))
    {
    }

    // =========================================================================
    // Controls
    // =========================================================================

    void pause() noexcept { m_paused = true; }
    void resume() noexcept { m_paused = false; }
    void toggle_pause() noexcept { m_paused = !m_paused; }
    [[nodiscard]] bool is_paused() const noexcept { return m_paused; }

    /// Negative or non-finite scales are clamped to 0
    void set_time_scale(float scale) noexcept {
        m_time_scale = std::isfinite(scale) ? std::max(scale, 0.0f) : 0.0f;
    }
    [[nodiscard]] float time_scale() const noexcept { return m_time_scale; }

    [[nodiscard]] float max_step() const noexcept { return m_max_step; }

    // =========================================================================
    // Stepping
    // =========================================================================

    /// Convert a measured frame time into a simulation step
    /// @return min(frame, max_step) * time_scale, or 0 when paused or invalid
    [[nodiscard]] float step_delta(float frame_seconds) const noexcept {
        if (m_paused || !std::isfinite(frame_seconds) || frame_seconds <= 0.0f) {
            return 0.0f;
        }
        return std::min(frame_seconds, m_max_step) * m_time_scale;
    }

    /// Record that a step of @p dt was simulated
    void advance(float dt) noexcept {
        m_simulated_time += static_cast<double>(dt);
        ++m_step_count;
    }

    /// Total simulated time
    [[nodiscard]] double simulated_time() const noexcept { return m_simulated_time; }

    /// Number of simulated steps
    [[nodiscard]] std::uint64_t step_count() const noexcept { return m_step_count; }

    void reset() noexcept {
        m_simulated_time = 0.0;
        m_step_count = 0;
    }

private:
    float m_max_step;
    float m_time_scale;
    bool m_paused = false;
    double m_simulated_time = 0.0;
    std::uint64_t m_step_count = 0;
};

} // namespace impulse_sandbox
