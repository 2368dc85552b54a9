#include "qkdsim/simulation.h"
#include "qkdsim/debug_log.h"

namespace qkdsim::sifting {
    SiftingResult sift(const TraceRecord &trace) {
        log::section("SIFTING: Public basis comparison");
        SiftingResult result;
        for (const PhotonEvent &event : trace) {
            if (!event.bases_match()) {
                continue;
            }
            result.matched_indices.push_back(event.index);
            result.alice_key.push_back(event.alice_bit);
            result.bob_key.push_back(event.bob_bit);
            if (event.eve_intercepted && event.eve_bit.has_value()) {
                result.eve_key.push_back(*event.eve_bit);
            }
        }
        log::count("matched indices", result.matched_indices.size());
        log::count("eve key length", result.eve_key.size());
        return result;
    }

    double estimate_qber(const SiftingResult &sifting) noexcept {
        const size_t length = sifting.alice_key.size();
        if (length == 0 || sifting.bob_key.size() != length) {
            return 0.0;
        }
        size_t errors = 0;
        for (size_t i = 0; i < length; ++i) {
            if (sifting.alice_key[i] != sifting.bob_key[i]) {
                ++errors;
            }
        }
        const double qber = static_cast<double>(errors) / static_cast<double>(length);
        log::ratio("qber", qber);
        return qber;
    }
}
