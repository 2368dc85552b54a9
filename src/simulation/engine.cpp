#include "qkdsim/simulation.h"
#include "qkdsim/debug_log.h"
#include <cmath>
#include <exception>
#include <new>

namespace qkdsim {
    namespace simulation {
        Result validate(const SimulationParameters &parameters) noexcept {
            if (parameters.photon_count == 0 || parameters.photon_count > MAX_PHOTON_COUNT) {
                return Result::InvalidParameter;
            }
            const double p = parameters.eve_intercept_probability;
            if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
                return Result::InvalidParameter;
            }
            return Result::Success;
        }

        PhotonEvent simulate_photon(const size_t index, const double eve_intercept_probability,
                                    BitBasisSource &source) {
            PhotonEvent event;
            event.index = index;
            event.alice_bit = source.next_bit();
            event.alice_basis = source.next_basis();

            Photon in_flight = channel::prepare(event.alice_bit, event.alice_basis);

            if (eavesdropper::decides_to_intercept(eve_intercept_probability, source)) {
                const eavesdropper::Interception interception = eavesdropper::intercept(in_flight, source);
                event.eve_intercepted = true;
                event.eve_basis = interception.basis;
                event.eve_bit = interception.bit;
                in_flight = interception.resent;
            }

            event.bob_basis = source.next_basis();
            event.bob_bit = channel::measure(in_flight, event.bob_basis, source);
            return event;
        }

        Result run(const SimulationParameters &parameters, BitBasisSource &source, TraceRecord &trace) {
            log::section("SIMULATION: Run");
            trace.clear();
            if (const Result result = validate(parameters); result != Result::Success) {
                return result;
            }
            log::count("photon_count", parameters.photon_count);
            log::ratio("eve_intercept_probability", parameters.eve_intercept_probability);

            TraceRecord produced;
            try {
                produced.reserve(parameters.photon_count);
                for (size_t i = 0; i < parameters.photon_count; ++i) {
                    produced.push_back(simulate_photon(i, parameters.eve_intercept_probability, source));
                }
            } catch (const std::bad_alloc &) {
                return Result::MemoryError;
            } catch (const std::exception &) {
                return Result::CryptoError;
            }
            trace = std::move(produced);
            log::count("events produced", trace.size());
            return Result::Success;
        }

        Result open_stream(const SimulationParameters &parameters,
                           std::unique_ptr<BitBasisSource> source,
                           PhotonStream &stream) {
            return PhotonStream::open(parameters, std::move(source), stream);
        }
    }

    class PhotonStream::Impl {
    public:
        Impl(const SimulationParameters &parameters, std::unique_ptr<BitBasisSource> source)
            : parameters_(parameters), source_(std::move(source)) {
        }

        [[nodiscard]] bool has_next() const noexcept {
            return next_index_ < parameters_.photon_count;
        }

        [[nodiscard]] size_t emitted() const noexcept {
            return next_index_;
        }

        [[nodiscard]] size_t photon_count() const noexcept {
            return parameters_.photon_count;
        }

        Result next(PhotonEvent &event) {
            if (!has_next()) {
                return Result::StreamExhausted;
            }
            try {
                event = simulation::simulate_photon(next_index_, parameters_.eve_intercept_probability, *source_);
            } catch (const std::exception &) {
                return Result::CryptoError;
            }
            ++next_index_;
            if (!has_next()) {
                /* The generator is not needed once the last photon is out. */
                source_.reset();
            }
            return Result::Success;
        }

    private:
        SimulationParameters parameters_;
        std::unique_ptr<BitBasisSource> source_;
        size_t next_index_ = 0;
    };

    PhotonStream::PhotonStream() = default;

    PhotonStream::~PhotonStream() = default;

    PhotonStream::PhotonStream(PhotonStream &&other) noexcept = default;

    PhotonStream &PhotonStream::operator=(PhotonStream &&other) noexcept = default;

    bool PhotonStream::has_next() const noexcept {
        return impl_ && impl_->has_next();
    }

    size_t PhotonStream::emitted() const noexcept {
        return impl_ ? impl_->emitted() : 0;
    }

    size_t PhotonStream::photon_count() const noexcept {
        return impl_ ? impl_->photon_count() : 0;
    }

    Result PhotonStream::next(PhotonEvent &event) {
        if (!impl_) {
            return Result::StreamExhausted;
        }
        return impl_->next(event);
    }

    Result PhotonStream::open(const SimulationParameters &parameters,
                              std::unique_ptr<BitBasisSource> source,
                              PhotonStream &stream) {
        log::section("SIMULATION: Open photon stream");
        if (const Result result = simulation::validate(parameters); result != Result::Success) {
            return result;
        }
        if (!source) {
            return Result::InvalidInput;
        }
        try {
            stream.impl_ = std::make_unique<Impl>(parameters, std::move(source));
        } catch (const std::bad_alloc &) {
            return Result::MemoryError;
        }
        log::count("photon_count", parameters.photon_count);
        return Result::Success;
    }
}
