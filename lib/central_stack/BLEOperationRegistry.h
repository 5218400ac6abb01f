/**
 * @file BLEOperationRegistry.h
 * @brief Ledger of in-flight scan/connect/disconnect operations
 *
 * The radio layer does not deduplicate requests, and a second connect to a
 * peripheral that is already being connected would leave two callers waiting
 * on one outcome. The registry holds at most one pending operation per
 * (instruction, peripheral) pair, and each entry carries the error callback
 * owed to the caller that created it. Terminal radio events look the entry
 * up again to route their outcome back to that caller.
 */
#pragma once

#include "BLETypes.h"
#include "BLEStateContainer.h"

#include <vector>

namespace CentralStack { namespace BLE {

/**
 * @brief A pending instruction and, for peripheral operations, its caller
 */
struct PendingOperation {
    struct Addressee {
        Bytes peripheral;
        Callbacks::OnError on_error;
        ConnectionRoutes routes;        // CONNECTING only
    };

    Instruction instruction = Instruction::SCANNING;
    bool has_addressee = false;
    Addressee addressee;

    static PendingOperation scanning();
    static PendingOperation connecting(const Bytes& peripheral, const ConnectionRoutes& routes,
                                       Callbacks::OnError on_error);
    static PendingOperation disconnecting(const Bytes& peripheral, Callbacks::OnError on_error);

    /**
     * @brief Check for the same (instruction, addressee identifier) pair
     */
    bool sameKey(const PendingOperation& other) const;

    /**
     * @brief Check whether this entry is addressed to a peripheral
     */
    bool isAddressedTo(const Bytes& peripheral) const {
        return has_addressee && addressee.peripheral == peripheral;
    }

    /**
     * @brief Deliver an error to the stored callback, if any
     */
    void fail(const StackError& error) const;
};

using RegistrySnapshot = std::vector<PendingOperation>;

class BLEOperationRegistry {
public:
    BLEOperationRegistry();

    /**
     * @brief Add an operation
     *
     * @param op Operation to add
     * @return false if an entry with the same instruction and addressee is
     *         already present (INVALID_INSTRUCTION); nothing is published
     */
    bool insert(const PendingOperation& op);

    /**
     * @brief Remove the entry matching op's instruction and addressee
     *
     * Idempotent; the snapshot is published even if nothing was removed.
     * @return true if an entry was removed
     */
    bool remove(const PendingOperation& op);

    /**
     * @brief Check for an entry with the given instruction (any addressee)
     */
    bool contains(Instruction instruction) const;

    /**
     * @brief Check for an entry with the given instruction and addressee
     */
    bool contains(Instruction instruction, const Bytes& peripheral) const;

    /**
     * @brief Find the entry addressed to a peripheral
     *
     * @param peripheral Addressee identifier
     * @param instruction Instruction of the entry
     * @param out Receives a copy of the entry
     * @return false if not found
     */
    bool findAddressee(const Bytes& peripheral, Instruction instruction, PendingOperation& out) const;

    /**
     * @brief Find and remove the entry addressed to a peripheral
     * @return false if not found (nothing is published)
     */
    bool take(const Bytes& peripheral, Instruction instruction, PendingOperation& out);

    /**
     * @brief Drop every entry without invoking callbacks
     * @return Number of entries dropped
     */
    size_t clear();

    /**
     * @brief Get entry count
     */
    size_t size() const { return _entries.value().size(); }

    /**
     * @brief Observable snapshot of all entries
     */
    IObservable<RegistrySnapshot>& snapshot() { return _entries; }

private:
    static RegistrySnapshot::const_iterator find(const RegistrySnapshot& entries,
                                                 const PendingOperation& key);

    StateContainer<RegistrySnapshot> _entries;
};

}} // namespace CentralStack::BLE
