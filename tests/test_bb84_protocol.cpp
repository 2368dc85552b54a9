#include <catch2/catch_test_macros.hpp>
#include "qkdsim/qkdsim.h"
#include "qkdsim/simulation.h"
#include "qkdsim/randomness.h"
#include <cmath>
#include <cstring>
#include <limits>
#include <memory>
#include <string>

using namespace qkdsim;

namespace {
constexpr uint64_t kFixedSeed = 0x5EED0000000000B8ULL;
constexpr size_t kSmallRun = 64;
constexpr size_t kStatisticalRun = 4000;
constexpr double kFullInterceptQberLow = 0.15;
constexpr double kFullInterceptQberHigh = 0.35;

/* Serves the same byte forever: 0x00 gives all-zero draws, 0xFF all-one draws. */
class ConstantSource final : public BitBasisSource {
public:
    explicit ConstantSource(const uint8_t fill) : fill_(fill) {}

protected:
    void refill(uint8_t *block, const size_t length) override {
        std::memset(block, fill_, length);
    }

private:
    uint8_t fill_;
};

TraceRecord RunSeeded(const size_t photon_count, const double p, const uint64_t seed) {
    SeededBitBasisSource source(seed);
    TraceRecord trace;
    const Result result = simulation::run(SimulationParameters{photon_count, p}, source, trace);
    REQUIRE(result == Result::Success);
    return trace;
}

}

TEST_CASE("BB84 trace shape", "[bb84][simulation]") {
    REQUIRE(crypto::init());

    SECTION("Run produces one event per photon in ascending index order") {
        for (const size_t count : {size_t{1}, size_t{4}, kSmallRun, size_t{1000}}) {
            INFO("photon_count = " << count);
            const TraceRecord trace = RunSeeded(count, 0.3, kFixedSeed + count);
            REQUIRE(trace.size() == count);
            for (size_t i = 0; i < trace.size(); ++i) {
                REQUIRE(trace[i].index == i);
            }
        }
    }

    SECTION("Eve fields are present exactly on interception") {
        const TraceRecord trace = RunSeeded(500, 0.5, kFixedSeed);
        size_t intercepted = 0;
        for (const PhotonEvent &event : trace) {
            REQUIRE(event.eve_basis.has_value() == event.eve_intercepted);
            REQUIRE(event.eve_bit.has_value() == event.eve_intercepted);
            if (event.eve_intercepted) {
                ++intercepted;
            }
        }
        REQUIRE(intercepted > 0);
        REQUIRE(intercepted < trace.size());
    }

    SECTION("Interception rate follows the configured probability") {
        const TraceRecord trace = RunSeeded(kStatisticalRun, 0.3, kFixedSeed);
        size_t intercepted = 0;
        for (const PhotonEvent &event : trace) {
            if (event.eve_intercepted) {
                ++intercepted;
            }
        }
        const double rate = static_cast<double>(intercepted) / static_cast<double>(trace.size());
        INFO("interception rate " << rate);
        REQUIRE(rate >= 0.25);
        REQUIRE(rate <= 0.35);
    }

    SECTION("System source runs satisfy the same shape") {
        SystemBitBasisSource source;
        TraceRecord trace;
        REQUIRE(simulation::run(SimulationParameters{kSmallRun, 0.3}, source, trace) == Result::Success);
        REQUIRE(trace.size() == kSmallRun);
        for (const PhotonEvent &event : trace) {
            REQUIRE(event.eve_bit.has_value() == event.eve_intercepted);
        }
    }
}

TEST_CASE("BB84 measurement rule", "[bb84][channel]") {
    const Photon one_rectilinear = channel::prepare(Bit::One, Basis::Rectilinear);

    SECTION("Matching basis returns the encoded bit without consuming a coin") {
        ConstantSource zeros(0x00);
        REQUIRE(channel::measure(one_rectilinear, Basis::Rectilinear, zeros) == Bit::One);
        ConstantSource ones(0xFF);
        const Photon zero_diagonal = channel::prepare(Bit::Zero, Basis::Diagonal);
        REQUIRE(channel::measure(zero_diagonal, Basis::Diagonal, ones) == Bit::Zero);
    }

    SECTION("Mismatched basis returns the coin drawn from the source") {
        ConstantSource zeros(0x00);
        REQUIRE(channel::measure(one_rectilinear, Basis::Diagonal, zeros) == Bit::Zero);
        ConstantSource ones(0xFF);
        const Photon zero_rectilinear = channel::prepare(Bit::Zero, Basis::Rectilinear);
        REQUIRE(channel::measure(zero_rectilinear, Basis::Diagonal, ones) == Bit::One);
    }

    SECTION("Interception resends in the eavesdropper basis with the measured bit") {
        ConstantSource ones(0xFF);
        const Photon zero_rectilinear = channel::prepare(Bit::Zero, Basis::Rectilinear);
        const eavesdropper::Interception interception = eavesdropper::intercept(zero_rectilinear, ones);
        REQUIRE(interception.basis == Basis::Diagonal);
        REQUIRE(interception.bit == Bit::One);
        REQUIRE(interception.resent.basis == Basis::Diagonal);
        REQUIRE(interception.resent.bit == Bit::One);
    }

    SECTION("Interception trial compares a unit draw against the probability") {
        ConstantSource zeros(0x00);
        REQUIRE_FALSE(eavesdropper::decides_to_intercept(0.0, zeros));
        REQUIRE(eavesdropper::decides_to_intercept(0.5, zeros));
        ConstantSource ones(0xFF);
        REQUIRE(eavesdropper::decides_to_intercept(1.0, ones));
        REQUIRE_FALSE(eavesdropper::decides_to_intercept(0.999, ones));
    }

    SECTION("Scripted source yields a fully determined event") {
        ConstantSource ones(0xFF);
        const PhotonEvent event = simulation::simulate_photon(3, 1.0, ones);
        REQUIRE(event.index == 3);
        REQUIRE(event.alice_bit == Bit::One);
        REQUIRE(event.alice_basis == Basis::Diagonal);
        REQUIRE(event.eve_intercepted);
        REQUIRE(event.eve_basis == Basis::Diagonal);
        REQUIRE(event.eve_bit == Bit::One);
        REQUIRE(event.bob_basis == Basis::Diagonal);
        REQUIRE(event.bob_bit == Bit::One);
        REQUIRE(event.bases_match());
    }
}

TEST_CASE("BB84 error rate", "[bb84][qber]") {
    REQUIRE(crypto::init());

    SECTION("No eavesdropper means no interception and a clean sifted key") {
        const TraceRecord trace = RunSeeded(2000, 0.0, kFixedSeed);
        for (const PhotonEvent &event : trace) {
            REQUIRE_FALSE(event.eve_intercepted);
            if (event.bases_match()) {
                REQUIRE(event.alice_bit == event.bob_bit);
            }
        }
        const SiftingResult sifted = sifting::sift(trace);
        REQUIRE_FALSE(sifted.alice_key.empty());
        REQUIRE(sifted.eve_key.empty());
        REQUIRE(sifting::estimate_qber(sifted) == 0.0);
    }

    SECTION("Full interception disturbs about a quarter of the sifted key") {
        const TraceRecord trace = RunSeeded(kStatisticalRun, 1.0, kFixedSeed);
        for (const PhotonEvent &event : trace) {
            REQUIRE(event.eve_intercepted);
        }
        const SiftingResult sifted = sifting::sift(trace);
        const double qber = sifting::estimate_qber(sifted);
        INFO("qber = " << qber << " over " << sifted.alice_key.size() << " sifted bits");
        REQUIRE(qber >= kFullInterceptQberLow);
        REQUIRE(qber <= kFullInterceptQberHigh);
        REQUIRE(sifted.eve_key.size() == sifted.alice_key.size());
    }

    SECTION("QBER of an empty sifted key is zero") {
        const SiftingResult empty;
        REQUIRE(sifting::estimate_qber(empty) == 0.0);
    }

    SECTION("QBER counts every mismatching position") {
        SiftingResult sifted;
        sifted.alice_key = {Bit::Zero, Bit::One, Bit::One, Bit::Zero};
        sifted.bob_key = {Bit::Zero, Bit::Zero, Bit::One, Bit::One};
        REQUIRE(sifting::estimate_qber(sifted) == 0.5);
    }
}

TEST_CASE("BB84 sifting", "[bb84][sifting]") {
    REQUIRE(crypto::init());
    const TraceRecord trace = RunSeeded(300, 0.4, kFixedSeed);

    SECTION("Sifting is pure") {
        REQUIRE(sifting::sift(trace) == sifting::sift(trace));
    }

    SECTION("Sifted keys keep exactly the matching events in trace order") {
        const SiftingResult sifted = sifting::sift(trace);
        REQUIRE(sifted.alice_key.size() == sifted.matched_indices.size());
        REQUIRE(sifted.bob_key.size() == sifted.matched_indices.size());

        size_t position = 0;
        size_t eve_position = 0;
        for (const PhotonEvent &event : trace) {
            if (!event.bases_match()) {
                continue;
            }
            REQUIRE(sifted.matched_indices[position] == event.index);
            REQUIRE(sifted.alice_key[position] == event.alice_bit);
            REQUIRE(sifted.bob_key[position] == event.bob_bit);
            if (event.eve_intercepted) {
                REQUIRE(sifted.eve_key[eve_position] == *event.eve_bit);
                ++eve_position;
            }
            ++position;
        }
        REQUIRE(position == sifted.matched_indices.size());
        REQUIRE(eve_position == sifted.eve_key.size());
    }

    SECTION("A trace with no matching bases sifts to nothing") {
        TraceRecord mismatched(3);
        for (size_t i = 0; i < mismatched.size(); ++i) {
            mismatched[i].index = i;
            mismatched[i].alice_basis = Basis::Rectilinear;
            mismatched[i].bob_basis = Basis::Diagonal;
        }
        const SiftingResult sifted = sifting::sift(mismatched);
        REQUIRE(sifted.matched_indices.empty());
        REQUIRE(sifted.alice_key.empty());
        REQUIRE(sifted.bob_key.empty());
        REQUIRE(sifted.eve_key.empty());
        REQUIRE(sifting::estimate_qber(sifted) == 0.0);
    }
}

TEST_CASE("BB84 parameter validation", "[bb84][validation]") {
    REQUIRE(crypto::init());
    SeededBitBasisSource source(kFixedSeed);

    const SimulationParameters invalid[] = {
        {0, 0.3},
        {10, -0.01},
        {10, 1.01},
        {10, std::numeric_limits<double>::quiet_NaN()},
        {10, std::numeric_limits<double>::infinity()},
        {MAX_PHOTON_COUNT + 1, 0.3},
    };

    for (const SimulationParameters &parameters : invalid) {
        INFO("photon_count = " << parameters.photon_count
             << ", p = " << parameters.eve_intercept_probability);
        TraceRecord trace(2);
        REQUIRE(simulation::run(parameters, source, trace) == Result::InvalidParameter);
        REQUIRE(trace.empty());
    }

    SECTION("Boundary probabilities are accepted") {
        TraceRecord trace;
        REQUIRE(simulation::run(SimulationParameters{1, 0.0}, source, trace) == Result::Success);
        REQUIRE(simulation::run(SimulationParameters{1, 1.0}, source, trace) == Result::Success);
        REQUIRE(trace.size() == 1);
    }
}

TEST_CASE("BB84 seeded reproducibility", "[bb84][seed]") {
    REQUIRE(crypto::init());

    SECTION("Same seed reproduces the trace") {
        REQUIRE(RunSeeded(kSmallRun, 0.3, 42) == RunSeeded(kSmallRun, 0.3, 42));
    }

    SECTION("Different seeds diverge") {
        REQUIRE(RunSeeded(kSmallRun, 0.3, 42) != RunSeeded(kSmallRun, 0.3, 43));
    }
}

TEST_CASE("BB84 photon stream", "[bb84][stream]") {
    REQUIRE(crypto::init());
    constexpr size_t kStreamLength = 50;
    constexpr uint64_t kStreamSeed = 7;

    SECTION("Stream yields the same events as a batch run") {
        PhotonStream stream;
        REQUIRE(simulation::open_stream(SimulationParameters{kStreamLength, 0.3},
                                        std::make_unique<SeededBitBasisSource>(kStreamSeed),
                                        stream) == Result::Success);
        REQUIRE(stream.photon_count() == kStreamLength);

        TraceRecord streamed;
        while (stream.has_next()) {
            PhotonEvent event;
            REQUIRE(stream.next(event) == Result::Success);
            streamed.push_back(event);
            REQUIRE(stream.emitted() == streamed.size());
        }
        REQUIRE(streamed == RunSeeded(kStreamLength, 0.3, kStreamSeed));

        PhotonEvent extra;
        REQUIRE(stream.next(extra) == Result::StreamExhausted);
        REQUIRE(stream.emitted() == kStreamLength);
    }

    SECTION("Stream keeps its position across a move") {
        PhotonStream stream;
        REQUIRE(simulation::open_stream(SimulationParameters{3, 0.0},
                                        std::make_unique<SeededBitBasisSource>(kStreamSeed),
                                        stream) == Result::Success);
        PhotonStream moved = std::move(stream);
        REQUIRE_FALSE(stream.has_next());
        REQUIRE(moved.has_next());
        PhotonEvent event;
        REQUIRE(moved.next(event) == Result::Success);
        REQUIRE(event.index == 0);
    }

    SECTION("Unopened stream reports exhaustion") {
        PhotonStream stream;
        PhotonEvent event;
        REQUIRE_FALSE(stream.has_next());
        REQUIRE(stream.next(event) == Result::StreamExhausted);
    }

    SECTION("Open rejects bad parameters before a missing source") {
        PhotonStream stream;
        REQUIRE(simulation::open_stream(SimulationParameters{0, 0.3}, nullptr, stream) ==
                Result::InvalidParameter);
        REQUIRE(simulation::open_stream(SimulationParameters{5, 0.3}, nullptr, stream) ==
                Result::InvalidInput);
        REQUIRE_FALSE(stream.has_next());
    }
}

TEST_CASE("BB84 short run feeds the cipher", "[bb84][cipher][scenario]") {
    REQUIRE(crypto::init());
    constexpr char kMessage[] = "hello";

    TraceRecord trace;
    SiftingResult sifted;
    for (uint64_t seed = 1; seed <= 64 && sifted.bob_key.empty(); ++seed) {
        trace = RunSeeded(4, 0.0, seed);
        sifted = sifting::sift(trace);
    }
    REQUIRE_FALSE(sifted.bob_key.empty());

    REQUIRE(trace.size() == 4);
    for (const PhotonEvent &event : trace) {
        REQUIRE_FALSE(event.eve_intercepted);
    }

    DerivedKey key;
    REQUIRE(key_derivation::derive(sifted.bob_key, key) == Result::Success);

    CipherEnvelope envelope;
    REQUIRE(cipher::encrypt(reinterpret_cast<const uint8_t *>(kMessage), std::strlen(kMessage), key,
                            envelope) == Result::Success);

    DerivedKey alice_key;
    REQUIRE(key_derivation::derive(sifted.alice_key, alice_key) == Result::Success);

    secure_bytes plaintext;
    REQUIRE(cipher::decrypt(envelope, alice_key, plaintext) == Result::Success);
    REQUIRE(std::string(plaintext.begin(), plaintext.end()) == kMessage);
}
