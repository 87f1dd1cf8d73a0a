#include "agentspace/core/scheduler.hpp"

namespace agentspace::core {

std::string_view to_string(ScheduleOrder order) noexcept {
    switch (order) {
        case ScheduleOrder::ById:
            return "by-id";
        case ScheduleOrder::Randomly:
            return "random";
    }
    return "unknown";
}

} // namespace agentspace::core
