#include <rcache/time/clock.hpp>

namespace rcache::clock {

    const Clock& system() {
        static const SystemClock c{};
        return c;
    }

} // namespace rcache::clock
