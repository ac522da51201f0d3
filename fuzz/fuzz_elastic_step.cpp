/**
 * @file  fuzz_elastic_step.cpp
 * @brief libFuzzer target for ElasticSystem<Scalar> configuration and stepping.
 *
 * Build:
 *   cmake -DELASTIC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_elastic_step
 *
 * Run for 60 seconds:
 *   ./fuzz_elastic_step -max_total_time=60
 *
 * Input layout (little-endian floats, missing bytes read as zero):
 *   [0..5]  mass, hand_k, end_k, snap_k, snap_radius, drag
 *   [6..7]  min_stretch, max_stretch
 *   [8]     initial value
 *   [9..]   pairs of (forcing, delta_time); the first 4 floats after the
 *           header with |v| < 10 also become snap points
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any byte sequence.
 *   2. create() succeeds iff validate() accepts the configuration.
 *   3. A rejected step input leaves value and velocity bit-identical.
 *   4. Once non-finite, the state is reported by is_finite() and reset()
 *      restores a finite state.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <vector>

#include "elastic/elastic_system.hpp"

using namespace elastic;

namespace {

float read_float(const uint8_t* data, size_t size, size_t index) {
    float v = 0.0f;
    if ((index + 1) * sizeof(float) <= size) {
        std::memcpy(&v, data + index * sizeof(float), sizeof(float));
    }
    return v;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t count = size / sizeof(float);

    ElasticProperties props{
        .mass        = read_float(data, size, 0),
        .hand_k      = read_float(data, size, 1),
        .end_k       = read_float(data, size, 2),
        .snap_k      = read_float(data, size, 3),
        .snap_radius = read_float(data, size, 4),
        .drag        = read_float(data, size, 5),
    };
    ElasticExtentProperties<Scalar> extent{
        .min_stretch = read_float(data, size, 6),
        .max_stretch = read_float(data, size, 7),
        .snap_to_end = (size % 2) == 1,
    };
    for (size_t i = 9; i < count && extent.snap_points.size() < 4; ++i) {
        const float p = read_float(data, size, i);
        if (std::isfinite(p) && std::abs(p) < 10.0f) {
            extent.snap_points.push_back(p);
        }
    }
    const float x0 = read_float(data, size, 8);

    const bool valid = !validate(props) && !validate(extent) && std::isfinite(x0);

    auto sys = LinearElasticSystem::create(x0, 0.0f, extent, props);

    // Invariant 2
    assert(sys.has_value() == valid);
    if (!sys) {
        return 0;
    }

    for (size_t i = 9; i + 1 < count; i += 2) {
        const float forcing = read_float(data, size, i);
        const float dt      = read_float(data, size, i + 1);

        const float x_before = sys->current_value();
        const float v_before = sys->current_velocity();
        sys->step(forcing, dt);

        // Invariant 3
        if (!std::isfinite(dt) || dt < 0.0f || !std::isfinite(forcing)) {
            const float x_after = sys->current_value();
            const float v_after = sys->current_velocity();
            assert(std::memcmp(&x_before, &x_after, sizeof(float)) == 0);
            assert(std::memcmp(&v_before, &v_after, sizeof(float)) == 0);
        }

        // Invariant 4
        if (!sys->is_finite()) {
            const bool accepted = sys->reset(0.0f, 0.0f);
            assert(accepted && sys->is_finite());
            const float nan = std::numeric_limits<float>::quiet_NaN();
            assert(!sys->reset(nan, 0.0f) && sys->is_finite());
        }
    }

    return 0;
}
