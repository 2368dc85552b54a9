#pragma once
#include "qkdsim.h"
#include "randomness.h"

namespace qkdsim {

    struct SimulationParameters {
        size_t photon_count = 0;
        double eve_intercept_probability = 0.0;
    };

    namespace channel {
        [[nodiscard]] Photon prepare(Bit bit, Basis basis) noexcept;

        /*
         * BB84 measurement: a matching basis returns the photon's bit, a
         * mismatched basis returns a fair coin drawn from `source`.
         */
        [[nodiscard]] Bit measure(const Photon &photon, Basis measurement_basis, BitBasisSource &source);
    }

    namespace eavesdropper {
        struct Interception {
            Basis basis;
            Bit bit;
            Photon resent;
        };

        [[nodiscard]] bool decides_to_intercept(double intercept_probability, BitBasisSource &source);

        /* Measure in a random basis and prepare a fresh photon from the outcome. */
        [[nodiscard]] Interception intercept(const Photon &photon, BitBasisSource &source);
    }

    /**
     * Lazily produced, finite, non-restartable sequence of photon events.
     * Each call to next() simulates exactly one photon; pacing belongs to
     * the consumer.
     */
    class PhotonStream {
    public:
        PhotonStream();

        ~PhotonStream();

        PhotonStream(PhotonStream &&other) noexcept;

        PhotonStream &operator=(PhotonStream &&other) noexcept;

        PhotonStream(const PhotonStream &) = delete;

        PhotonStream &operator=(const PhotonStream &) = delete;

        [[nodiscard]] bool has_next() const noexcept;

        [[nodiscard]] size_t emitted() const noexcept;

        [[nodiscard]] size_t photon_count() const noexcept;

        [[nodiscard]] Result next(PhotonEvent &event);

        [[nodiscard]] static Result open(const SimulationParameters &parameters,
                                         std::unique_ptr<BitBasisSource> source,
                                         PhotonStream &stream);

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    namespace simulation {
        [[nodiscard]] Result validate(const SimulationParameters &parameters) noexcept;

        [[nodiscard]] PhotonEvent simulate_photon(size_t index, double eve_intercept_probability,
                                                  BitBasisSource &source);

        [[nodiscard]] Result run(const SimulationParameters &parameters, BitBasisSource &source,
                                 TraceRecord &trace);

        [[nodiscard]] Result open_stream(const SimulationParameters &parameters,
                                         std::unique_ptr<BitBasisSource> source,
                                         PhotonStream &stream);
    }

    namespace sifting {
        [[nodiscard]] SiftingResult sift(const TraceRecord &trace);

        [[nodiscard]] double estimate_qber(const SiftingResult &sifting) noexcept;
    }
}
