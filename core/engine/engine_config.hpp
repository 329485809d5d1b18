#pragma once

#include "fusion/fusion_engine.hpp"
#include "fusion/priority_tiers.hpp"
#include "graph/topology.hpp"
#include "weighting/entropy_weighting.hpp"

namespace hdfm {

/// Scoring policy for one analysis run. Passed by value into the engine,
/// so runs with different policies can coexist.
struct EngineConfig {
    TopologyConfig topology;
    EntropyConfig entropy;
    FusionConfig fusion;
    TierConfig tiers;

    void validate() const {
        topology.validate();
        entropy.validate();
        fusion.validate();
        tiers.validate();
    }
};

} // namespace hdfm
