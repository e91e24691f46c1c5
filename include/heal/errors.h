// errors.h
#ifndef HEAL_ERRORS_H
#define HEAL_ERRORS_H

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
   HEALErrorKind. Recoverable failures of ledger operations. Each is reported
   to the caller of the failing operation; none leaves partial state behind.
**/
enum class HEALErrorKind : uint8_t {
    // Submission id is zero or above the current counter.
    NOT_FOUND = 0,
    // No accumulator exists for the system key.
    UNKNOWN_SYSTEM = 1,
    // Callback names a request id that was never issued, has expired, or
    // belongs to the other target space.
    UNKNOWN_REQUEST = 2,
    // The submission (or request) is already settled.
    ALREADY_REVEALED = 3,
    // A decryption request for the same target is still outstanding.
    ALREADY_REQUESTED = 4,
    INVALID_PROOF = 5,
    // The oracle handed back a request id that is already mapped.
    REQUEST_COLLISION = 6,
    INVALID_ARGUMENT = 7,
    // The submission was rejected by its tenant and can no longer be revealed.
    ALREADY_REJECTED = 8,
    // Caller is not the tenant that submitted the reading.
    NOT_TENANT = 9,
    SIZE = 10,
};

inline static constexpr std::array<const char*, static_cast<unsigned>(HEALErrorKind::SIZE)>
    error_kind_names{
        "NotFound",        "UnknownSystem",  "UnknownRequest",   "AlreadyRevealed",
        "AlreadyRequested", "InvalidProof",  "RequestCollision", "InvalidArgument",
        "AlreadyRejected",  "NotTenant",
    };

inline const char* to_string(HEALErrorKind kind) {
    return error_kind_names[static_cast<unsigned>(kind)];
}

class HEALError : public std::runtime_error {
public:
    HEALError(HEALErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    HEALErrorKind kind() const noexcept { return kind_; }

private:
    HEALErrorKind kind_;
};

#endif
