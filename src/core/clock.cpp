#include "folio/core/clock.hpp"

#include <thread>

namespace folio {

Sleeper make_thread_sleeper() {
    return [](std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    };
}

}  // namespace folio
