/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <android-base/macros.h>
#include <libusb.h>

#include "usbxfer/transfer.h"
#include "usbxfer/usb_backend.h"

namespace usbxfer {

// State of one running transfer. Records are heap allocated individually and never move while
// running, so libusb can carry a pointer to one as the transfer's user_data.
struct TransferRecord {
    TransferId id;

    // Not owned. libusb cannot invoke a completion callback after the owning context's
    // libusb_exit, and the context outlives its AsyncIo, so this stays valid for as long as the
    // record can be reached from libusb.
    AsyncIo* io;

    // Present except inside the completion dispatcher, between handing the buffer to the
    // callback and installing a resubmitted one.
    std::optional<std::vector<uint8_t>> buffer;

    TransferCallback callback;

    // Owned by the record from submission until the dispatcher frees it on retirement.
    libusb_transfer* transfer = nullptr;
};

// Running transfers keyed by id. Not thread-safe: AsyncIo serializes all access with its state
// lock.
class TransferTable {
  public:
    struct Allocation {
        TransferId id;
        TransferRecord* record;
        unsigned char* data;
        size_t length;
    };

    TransferTable() = default;
    ~TransferTable() = default;

    // Inserts a record for a new transfer under an id no running transfer uses. The returned
    // data pointer stays valid until the transfer completes.
    Allocation Allocate(AsyncIo* io, TransferCallback callback, std::vector<uint8_t> buffer);

    // Records the native transfer of a running entry.
    Result<void> MarkSubmitted(TransferId id, libusb_transfer* transfer);

    // Asks libusb to cancel a running transfer. Fails without calling into libusb if |id| is
    // not running.
    Result<void> Cancel(TransferId id, UsbBackend* backend);

    TransferRecord* Find(TransferId id);
    std::unique_ptr<TransferRecord> Remove(TransferId id);

    // Removes every record, for teardown.
    std::vector<std::unique_ptr<TransferRecord>> RemoveAll();

    bool Contains(TransferId id) const { return running_.count(id) != 0; }
    size_t size() const { return running_.size(); }
    bool empty() const { return running_.empty(); }

  private:
    std::unordered_map<TransferId, std::unique_ptr<TransferRecord>> running_;
    TransferId next_id_ = 0;

    DISALLOW_COPY_AND_ASSIGN(TransferTable);
};

}  // namespace usbxfer
