#pragma once
#include <cmath>
#include <cstdint>

namespace ef {

// Stream ids keep the per-purpose sequences independent for the same seed.
constexpr uint64_t kTerrainStream = 0x7465727261696eULL;  // "terrain"
constexpr uint64_t kThermalStream = 0x746865726d616cULL;  // "thermal"
constexpr uint64_t kPhotoStream   = 0x70686f746fULL;      // "photo"

class PCG32 {
    uint64_t state_ = 0x853c49e6748fea9bULL;
    uint64_t inc_   = 0xda3e39cb94b95bdbULL;
    bool   has_spare_ = false;
    double spare_     = 0.0;
public:
    PCG32() = default;
    PCG32(uint64_t initstate, uint64_t initseq){ seed(initstate, initseq); }
    void seed(uint64_t initstate, uint64_t initseq){
        state_ = 0U; inc_ = (initseq<<1u) | 1u;
        operator()(); state_ += initstate; operator()();
        has_spare_ = false; spare_ = 0.0;
    }
    uint32_t operator()() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + (inc_ | 1);
        uint32_t xorshifted = (uint32_t)(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = (uint32_t)(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    // 53-bit double in [0,1) from two draws.
    double uniform_double(){
        uint64_t hi = operator()() >> 5, lo = operator()() >> 6;
        return (double(hi) * 67108864.0 + double(lo)) * (1.0/9007199254740992.0);
    }
    double uniform(double lo, double hi){ return lo + (hi - lo) * uniform_double(); }

    // Unbiased integer in [0, bound).
    uint32_t bounded(uint32_t bound){
        if (bound <= 1) return 0;
        uint32_t threshold = (0u - bound) % bound;
        for (;;) {
            uint32_t r = operator()();
            if (r >= threshold) return r % bound;
        }
    }
    // Integer in [lo, hi); collapses to lo when the range is empty.
    int range(int lo, int hi){
        if (hi <= lo) return lo;
        return lo + (int)bounded((uint32_t)(hi - lo));
    }

    // Marsaglia polar method; the second variate is cached for the next call.
    double normal(double mean, double stddev){
        if (has_spare_) { has_spare_ = false; return mean + stddev * spare_; }
        double u, v, s;
        do {
            u = 2.0 * uniform_double() - 1.0;
            v = 2.0 * uniform_double() - 1.0;
            s = u*u + v*v;
        } while (s >= 1.0 || s == 0.0);
        double f = std::sqrt(-2.0 * std::log(s) / s);
        spare_ = u * f; has_spare_ = true;
        return mean + stddev * (v * f);
    }
};

} // namespace ef
