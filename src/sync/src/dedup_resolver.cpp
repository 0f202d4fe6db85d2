#include "rfsync/sync/dedup_resolver.h"
#include "rfsync/core/logging.h"
#include "rfsync/core/utils.h"

#include <utility>

namespace rfsync {
namespace sync {

using core::DeviceRecord;
using core::NormalizedRecord;

std::string identityKeyToString(IdentityKey key) {
    switch (key) {
        case IdentityKey::VENDOR_ID: return "vendor_id";
        case IdentityKey::SERIAL: return "serial";
        case IdentityKey::MAC: return "mac";
        case IdentityKey::ADDRESS: return "address";
        default: return "unknown";
    }
}

std::string matchOutcomeToString(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::MATCHED: return "matched";
        case MatchOutcome::RELOCATED: return "relocated";
        case MatchOutcome::CREATE_NEW: return "create_new";
        case MatchOutcome::CONFLICT: return "conflict";
        default: return "unknown";
    }
}

namespace {

bool contradicts(const std::optional<std::string>& stored,
                 const std::optional<std::string>& incoming) {
    return stored && incoming && *stored != *incoming;
}

bool contradicts(const std::string& stored, const std::string& incoming) {
    return !stored.empty() && !incoming.empty() && stored != incoming;
}

} // namespace

DeduplicationResolver::DeduplicationResolver(
    std::shared_ptr<const store::IDeviceRepository> repository)
    : repository_(std::move(repository)) {}

ResolveResult DeduplicationResolver::resolve(const NormalizedRecord& record,
                                             const std::string& vendorCode) const {
    auto logger = core::getLogger(core::loggers::DEDUP);
    ResolveResult result;

    std::optional<std::string> mac;
    if (record.mac) {
        mac = core::string_utils::normalizeMac(*record.mac);
    }

    // Exact keys, highest priority first
    std::vector<std::pair<IdentityKey, DeviceRecord>> hits;
    if (!record.vendorId.empty()) {
        if (auto found = repository_->findByVendorId(vendorCode, record.vendorId)) {
            hits.emplace_back(IdentityKey::VENDOR_ID, *found);
        }
    }
    if (record.serial) {
        if (auto found = repository_->findBySerial(vendorCode, *record.serial)) {
            hits.emplace_back(IdentityKey::SERIAL, *found);
        }
    }
    if (mac) {
        if (auto found = repository_->findByMac(*mac)) {
            hits.emplace_back(IdentityKey::MAC, *found);
        }
    }

    if (!hits.empty()) {
        std::vector<std::string> distinctIds;
        for (const auto& hit : hits) {
            bool seen = false;
            for (const auto& id : distinctIds) {
                seen = seen || id == hit.second.id;
            }
            if (!seen) {
                distinctIds.push_back(hit.second.id);
            }
        }

        if (distinctIds.size() > 1) {
            result.outcome = MatchOutcome::CONFLICT;
            result.conflictingIds = distinctIds;
            result.detail = "Identity keys of " + vendorCode + ":" + record.vendorId +
                            " match " + std::to_string(distinctIds.size()) + " distinct devices";
            logger->debug(result.detail);
            return result;
        }

        const auto& match = hits.front();
        if (match.second.vendorCode != vendorCode) {
            result.outcome = MatchOutcome::CONFLICT;
            result.conflictingIds = distinctIds;
            result.detail = "MAC " + *mac + " of " + vendorCode + ":" + record.vendorId +
                            " is tracked as " + match.second.vendorCode + ":" +
                            match.second.vendorId + " (" + match.second.id + ")";
            logger->debug(result.detail);
            return result;
        }

        result.device = match.second;
        result.matchedKey = match.first;
        if (!record.address.empty() && match.second.address != record.address) {
            result.outcome = MatchOutcome::RELOCATED;
            result.previousAddress = match.second.address;
        } else {
            result.outcome = MatchOutcome::MATCHED;
        }
        return result;
    }

    // Heuristic: same address, vendor and kind, without contradicting identity
    std::vector<DeviceRecord> candidates;
    for (auto& candidate : repository_->findByAddress(record.address, vendorCode, record.kind)) {
        if (contradicts(candidate.vendorId, record.vendorId) ||
            contradicts(candidate.serial, record.serial) || contradicts(candidate.mac, mac)) {
            logger->debug("Address candidate {} for {}:{} skipped, identity differs", candidate.id,
                          vendorCode, record.vendorId);
            continue;
        }
        candidates.push_back(std::move(candidate));
    }

    if (candidates.size() > 1) {
        result.outcome = MatchOutcome::CONFLICT;
        for (const auto& candidate : candidates) {
            result.conflictingIds.push_back(candidate.id);
        }
        result.detail = "Address " + record.address + " matches " +
                        std::to_string(candidates.size()) + " devices of " + vendorCode;
        logger->debug(result.detail);
        return result;
    }

    if (candidates.size() == 1) {
        result.outcome = MatchOutcome::MATCHED;
        result.device = candidates.front();
        result.matchedKey = IdentityKey::ADDRESS;
        return result;
    }

    result.outcome = MatchOutcome::CREATE_NEW;
    return result;
}

} // namespace sync
} // namespace rfsync
