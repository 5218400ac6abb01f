/**
 * @file BLEOperationRegistry.cpp
 * @brief Pending-operation ledger implementation
 */

#include "BLEOperationRegistry.h"
#include "Log.h"

namespace CentralStack { namespace BLE {

//=============================================================================
// PendingOperation
//=============================================================================

PendingOperation PendingOperation::scanning() {
    PendingOperation op;
    op.instruction = Instruction::SCANNING;
    op.has_addressee = false;
    return op;
}

PendingOperation PendingOperation::connecting(const Bytes& peripheral, const ConnectionRoutes& routes,
                                              Callbacks::OnError on_error) {
    PendingOperation op;
    op.instruction = Instruction::CONNECTING;
    op.has_addressee = true;
    op.addressee.peripheral = peripheral;
    op.addressee.on_error = on_error;
    op.addressee.routes = routes;
    return op;
}

PendingOperation PendingOperation::disconnecting(const Bytes& peripheral, Callbacks::OnError on_error) {
    PendingOperation op;
    op.instruction = Instruction::DISCONNECTING;
    op.has_addressee = true;
    op.addressee.peripheral = peripheral;
    op.addressee.on_error = on_error;
    return op;
}

bool PendingOperation::sameKey(const PendingOperation& other) const {
    if (instruction != other.instruction || has_addressee != other.has_addressee) {
        return false;
    }
    return !has_addressee || addressee.peripheral == other.addressee.peripheral;
}

void PendingOperation::fail(const StackError& error) const {
    if (has_addressee && addressee.on_error) {
        addressee.on_error(error);
    }
}

//=============================================================================
// BLEOperationRegistry
//=============================================================================

BLEOperationRegistry::BLEOperationRegistry() {
}

RegistrySnapshot::const_iterator BLEOperationRegistry::find(const RegistrySnapshot& entries,
                                                            const PendingOperation& key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->sameKey(key)) {
            return it;
        }
    }
    return entries.end();
}

bool BLEOperationRegistry::insert(const PendingOperation& op) {
    bool inserted = _entries.update([&op](RegistrySnapshot& entries) {
        if (find(entries, op) != entries.end()) {
            return false;
        }
        entries.push_back(op);
        return true;
    });

    if (!inserted) {
        DEBUG("BLEOperationRegistry: Rejected duplicate " +
              std::string(instructionToString(op.instruction)) +
              (op.has_addressee ? " for " + identifierToString(op.addressee.peripheral) : ""));
        return false;
    }

    TRACE("BLEOperationRegistry: Inserted " + std::string(instructionToString(op.instruction)));
    return true;
}

bool BLEOperationRegistry::remove(const PendingOperation& op) {
    bool removed = false;
    _entries.update([&op, &removed](RegistrySnapshot& entries) {
        auto it = find(entries, op);
        if (it != entries.end()) {
            entries.erase(it);
            removed = true;
        }
        return true;
    });

    TRACE("BLEOperationRegistry: Remove " + std::string(instructionToString(op.instruction)) +
          (removed ? "" : " (absent)"));
    return removed;
}

bool BLEOperationRegistry::contains(Instruction instruction) const {
    RegistrySnapshot entries = _entries.value();
    for (const PendingOperation& entry : entries) {
        if (entry.instruction == instruction) {
            return true;
        }
    }
    return false;
}

bool BLEOperationRegistry::contains(Instruction instruction, const Bytes& peripheral) const {
    PendingOperation ignored;
    return findAddressee(peripheral, instruction, ignored);
}

bool BLEOperationRegistry::findAddressee(const Bytes& peripheral, Instruction instruction,
                                         PendingOperation& out) const {
    RegistrySnapshot entries = _entries.value();
    for (const PendingOperation& entry : entries) {
        if (entry.instruction == instruction && entry.isAddressedTo(peripheral)) {
            out = entry;
            return true;
        }
    }
    return false;
}

bool BLEOperationRegistry::take(const Bytes& peripheral, Instruction instruction, PendingOperation& out) {
    return _entries.update([&](RegistrySnapshot& entries) {
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->instruction == instruction && it->isAddressedTo(peripheral)) {
                out = *it;
                entries.erase(it);
                return true;
            }
        }
        return false;
    });
}

size_t BLEOperationRegistry::clear() {
    size_t dropped = 0;
    _entries.update([&dropped](RegistrySnapshot& entries) {
        dropped = entries.size();
        entries.clear();
        return true;
    });

    if (dropped > 0) {
        DEBUG("BLEOperationRegistry: Cleared " + std::to_string(dropped) + " pending operations");
    }
    return dropped;
}

}} // namespace CentralStack::BLE
