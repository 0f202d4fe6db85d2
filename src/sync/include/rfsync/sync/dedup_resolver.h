#pragma once

#include "rfsync/core/types.h"
#include "rfsync/store/device_repository.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace sync {

/**
 * @brief Identity keys in matching priority order
 */
enum class IdentityKey {
    VENDOR_ID, // within the vendor, exact
    SERIAL,    // within the vendor, exact
    MAC,       // global, exact
    ADDRESS    // address + vendor + kind, heuristic
};

std::string identityKeyToString(IdentityKey key);

enum class MatchOutcome {
    MATCHED,   // existing record, address unchanged
    RELOCATED, // existing record whose address changed
    CREATE_NEW,
    CONFLICT
};

std::string matchOutcomeToString(MatchOutcome outcome);

/**
 * @brief Outcome of resolving one normalized record
 */
struct ResolveResult {
    MatchOutcome outcome = MatchOutcome::CREATE_NEW;
    std::optional<core::DeviceRecord> device;
    std::optional<IdentityKey> matchedKey;
    std::string previousAddress;
    std::vector<std::string> conflictingIds;
    std::string detail;
};

/**
 * @brief Matches incoming records to tracked devices
 *
 * Pure decision function: reads the repository, never writes to it.
 * Exact keys are consulted together; if they point at two or more distinct
 * records the result is a conflict. A MAC held by a device of another
 * vendor is also a conflict, since one record cannot carry two vendor
 * identities. The address heuristic is only tried when no exact key
 * matched, and skips candidates whose vendor id, serial or MAC contradicts
 * the incoming record.
 */
class DeduplicationResolver {
public:
    explicit DeduplicationResolver(std::shared_ptr<const store::IDeviceRepository> repository);

    ResolveResult resolve(const core::NormalizedRecord& record,
                          const std::string& vendorCode) const;

private:
    std::shared_ptr<const store::IDeviceRepository> repository_;
};

} // namespace sync
} // namespace rfsync
