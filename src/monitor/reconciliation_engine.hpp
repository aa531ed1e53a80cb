#pragma once

#include "common/models.hpp"

namespace bluemeter {

/**
 * Diffs two snapshots and classifies every change.
 *
 * Records are compared structurally, so a device whose battery moved appears
 * once in each direction of the raw difference; pairing by address turns that
 * into one update. Unpaired records are additions or removals.
 *
 * Low-battery alerts use hysteresis: a device alerts once when it falls below
 * the threshold, and is re-armed when its level rises or it reaches the
 * threshold again. A threshold of 0 never alerts.
 *
 * When nothing changed the report has updateNeeded == false, unless `force`
 * is set, in which case updateNeeded is true with no events.
 */
ChangeReport reconcile(const Snapshot &previous,
                       const Snapshot &current,
                       NotifiedLowBatterySet &notified,
                       const EventConfig &config,
                       bool force = false);

// Owns the alert set across passes. Only the monitor's consumer thread calls it.
class ReconciliationEngine {
public:
    ChangeReport reconcile(const Snapshot &previous,
                           const Snapshot &current,
                           const EventConfig &config,
                           bool force = false);

    const NotifiedLowBatterySet &notified() const { return m_notified; }
    bool isAlerted(Address address) const;

private:
    NotifiedLowBatterySet m_notified;
};

} // namespace bluemeter
