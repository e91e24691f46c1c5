// events.h
#ifndef HEAL_EVENTS_H
#define HEAL_EVENTS_H

#include <array>
#include <cstdint>
#include <string>

/**
   LedgerEventType. Audit events emitted by the ledger. Dashboards and audit
   logs observe the ledger only through these.
**/
enum class LedgerEventType : uint8_t {
    SUBMISSION_ACCEPTED = 0,
    DECRYPTION_REQUESTED = 1,
    DATA_REVEALED = 2,
    SUM_DECRYPTION_REQUESTED = 3,
    SUM_REVEALED = 4,
    DECRYPTION_EXPIRED = 5,
    SUBMISSION_REJECTED = 6,
    SIZE = 7,
};

inline static constexpr std::array<const char*, static_cast<unsigned>(LedgerEventType::SIZE)>
    event_type_names{
        "SubmissionAccepted", "DecryptionRequested",    "DataRevealed",
        "SumDecryptionRequested", "SumRevealed",        "DecryptionExpired",
        "SubmissionRejected",
    };

inline const char* to_string(LedgerEventType type) {
    return event_type_names[static_cast<unsigned>(type)];
}

struct LedgerEvent {
    LedgerEventType type = LedgerEventType::SUBMISSION_ACCEPTED;
    // Submission id; 0 for aggregate events.
    uint64_t id = 0;
    // Set for aggregate events only.
    std::string system_key;
    uint64_t timestamp = 0;
    uint64_t request_id = 0;
};

// Sinks are invoked while the ledger holds its state lock. They must not call
// back into the ledger.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const LedgerEvent& event) = 0;
};

#endif
