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

#include "usbxfer/transfer_table.h"

#include <errno.h>

#include <android-base/logging.h>

#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

TransferTable::Allocation TransferTable::Allocate(AsyncIo* io, TransferCallback callback,
                                                  std::vector<uint8_t> buffer) {
    // Probe from the rotating cursor for an id that isn't running. Ids wrap around, and there
    // can never be more running transfers than ids.
    while (running_.count(next_id_) != 0) {
        ++next_id_;
    }
    TransferId id = next_id_++;

    auto record = std::make_unique<TransferRecord>();
    record->id = id;
    record->io = io;
    record->buffer = std::move(buffer);
    record->callback = std::move(callback);

    Allocation allocation;
    allocation.id = id;
    allocation.record = record.get();
    allocation.data = record->buffer->data();
    allocation.length = record->buffer->size();

    running_.emplace(id, std::move(record));
    VLOG(TRANSFER) << "allocated transfer " << id << " with " << allocation.length
                   << " byte buffer, " << running_.size() << " running";
    return allocation;
}

Result<void> TransferTable::MarkSubmitted(TransferId id, libusb_transfer* transfer) {
    TransferRecord* record = Find(id);
    if (record == nullptr) {
        return Error(ENOENT) << "transfer " << id << " is not running";
    }
    record->transfer = transfer;
    return {};
}

Result<void> TransferTable::Cancel(TransferId id, UsbBackend* backend) {
    TransferRecord* record = Find(id);
    if (record == nullptr) {
        return Error(ENOENT) << "transfer " << id << " is not running";
    }
    if (record->transfer == nullptr) {
        return Error(EINVAL) << "transfer " << id << " has not been submitted";
    }

    int rc = backend->CancelTransfer(record->transfer);
    if (rc != 0) {
        return UsbError(rc) << "failed to cancel transfer " << id << " ("
                            << libusb_error_name(rc) << ")";
    }
    VLOG(TRANSFER) << "requested cancellation of transfer " << id;
    return {};
}

TransferRecord* TransferTable::Find(TransferId id) {
    auto it = running_.find(id);
    if (it == running_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::unique_ptr<TransferRecord> TransferTable::Remove(TransferId id) {
    auto it = running_.find(id);
    if (it == running_.end()) {
        return nullptr;
    }
    std::unique_ptr<TransferRecord> record = std::move(it->second);
    running_.erase(it);
    return record;
}

std::vector<std::unique_ptr<TransferRecord>> TransferTable::RemoveAll() {
    std::vector<std::unique_ptr<TransferRecord>> result;
    for (auto& entry : running_) {
        result.push_back(std::move(entry.second));
    }
    running_.clear();
    return result;
}

}  // namespace usbxfer
