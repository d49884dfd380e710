#include "alcove/nonce/granularity.hpp"

namespace alcove::nonce {

    uint64_t NowMicros() {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count());
    }

    uint64_t ElapsedMicros(const uint64_t epoch_us) {
        const uint64_t now = NowMicros();
        return now > epoch_us ? now - epoch_us : 0;
    }

}
