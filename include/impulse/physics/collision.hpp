/// @file collision.hpp
/// @brief Narrow phase detection and impulse response for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/math/types.hpp>

#include <cstdint>
#include <optional>

namespace impulse_physics {

// =============================================================================
// Contact
// =============================================================================

/// How a contact pushes its bodies apart
enum class CorrectionMode : std::uint8_t {
    Penetration,  ///< Move by the measured penetration depth
    Fixed,        ///< Move by k_fixed_correction regardless of depth
};

/// Contact between two bodies
struct Contact {
    /// Points from body B towards body A; zero when the centres coincide
    impulse_math::Vec3 normal{0.0f};

    /// Separation distance distributed between the bodies
    float correction = 0.0f;

    CorrectionMode mode = CorrectionMode::Penetration;
};

/// Outcome of testing one candidate pair
enum class PairOutcome : std::uint8_t {
    Separated,    ///< Supported pair, no overlap
    Resolved,     ///< Overlap found and response applied
    Unsupported,  ///< Mixed kinds or a compound shape; not tested
    Immovable,    ///< Overlap between two immovable bodies; nothing to do
};

// =============================================================================
// Collision Resolver
// =============================================================================

/// Same-kind narrow phase: sphere-sphere, box-box and cylinder-cylinder
///
/// Mixed-kind pairs and any pair involving a compound shape are reported
/// as Unsupported and left untouched.
class CollisionResolver {
public:
    /// Whether a pair of shape kinds has a detection routine
    [[nodiscard]] static bool supports(ShapeKind a, ShapeKind b) noexcept;

    /// Overlap test
    /// @return Contact if the shapes overlap, nullopt otherwise or if unsupported
    [[nodiscard]] static std::optional<Contact> detect(const RigidBody& a, const RigidBody& b) noexcept;

    /// Apply the restitution impulse and positional correction for a contact
    ///
    /// The impulse magnitude is -(1 + min(eA, eB)) * vRel / (invMassA + invMassB)
    /// along the normal, applied to every overlapping pair.
    static void apply(RigidBody& a, RigidBody& b, const Contact& contact) noexcept;

    /// Detect and respond in one call
    static PairOutcome resolve(RigidBody& a, RigidBody& b) noexcept;
};

} // namespace impulse_physics
