#include "FleetError.hpp"

namespace TaskFleet {

namespace {

class FleetCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "taskfleet"; }

    std::string message(int ev) const override {
        switch (static_cast<FleetErrc>(ev)) {
            case FleetErrc::LockTimeout:        return "lock wait timed out";
            case FleetErrc::StillBlocked:       return "task dependencies not satisfied";
            case FleetErrc::InvalidLevel:       return "bloom level must be between 1 and 6";
            case FleetErrc::NotConfigured:      return "capability routing not configured";
            case FleetErrc::NoTask:             return "worker has no task";
            case FleetErrc::InvalidTransition:  return "invalid task status transition";
            case FleetErrc::DuplicateTask:      return "task id already registered";
            case FleetErrc::WorkerBusy:         return "worker already holds an unfinished task";
            case FleetErrc::LineageMismatch:    return "redo_of does not reference the completed task";
            case FleetErrc::InvalidKey:         return "invalid store key";
            case FleetErrc::CorruptDocument:    return "stored document is not valid JSON";
            case FleetErrc::IoFailure:          return "atomic document write failed";
            case FleetErrc::NotFound:           return "item not found";
            case FleetErrc::UnknownWorker:      return "unknown worker";
            case FleetErrc::ContextUnavailable: return "execution context unavailable";
            case FleetErrc::ChannelFailure:     return "notification channel send failed";
        }
        return "unknown taskfleet error";
    }
};

} // namespace

const std::error_category& fleet_category() noexcept {
    static const FleetCategory category;
    return category;
}

} // namespace TaskFleet
