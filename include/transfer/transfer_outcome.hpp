#ifndef DATASTORE_TRANSFER_OUTCOME_HPP
#define DATASTORE_TRANSFER_OUTCOME_HPP

namespace datastore {
namespace transfer {

enum class TransferOutcome {
    COMPLETED = 0,
    // Task record vanished: explicit abort or TTL expiry
    ABORTED,
    // Engine shut down while the task was still live
    INTERRUPTED
};

inline const char* to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::COMPLETED: return "Completed";
        case TransferOutcome::ABORTED: return "Aborted";
        case TransferOutcome::INTERRUPTED: return "Interrupted";
        default: return "Undefined outcome";
    }
}

} // namespace transfer
} // namespace datastore

#endif // DATASTORE_TRANSFER_OUTCOME_HPP
