#include "qkdsim/simulation.h"

namespace qkdsim::channel {
    Photon prepare(const Bit bit, const Basis basis) noexcept {
        return Photon{bit, basis};
    }

    Bit measure(const Photon &photon, const Basis measurement_basis, BitBasisSource &source) {
        if (photon.basis == measurement_basis) {
            return photon.bit;
        }
        return source.next_bit();
    }
}

namespace qkdsim::eavesdropper {
    bool decides_to_intercept(const double intercept_probability, BitBasisSource &source) {
        return source.next_unit() < intercept_probability;
    }

    Interception intercept(const Photon &photon, BitBasisSource &source) {
        const Basis basis = source.next_basis();
        const Bit bit = channel::measure(photon, basis, source);
        return Interception{basis, bit, channel::prepare(bit, basis)};
    }
}
