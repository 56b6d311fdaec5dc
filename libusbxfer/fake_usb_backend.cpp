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

#include "fake_usb_backend.h"

#include <stdlib.h>

#include <algorithm>

#include <android-base/logging.h>

namespace usbxfer {

FakeUsbBackend::FakeUsbBackend() = default;

FakeUsbBackend::~FakeUsbBackend() {
    for (libusb_transfer* transfer : live_) {
        free(transfer);
    }
}

libusb_transfer* FakeUsbBackend::AllocTransfer(int iso_packets) {
    if (fail_next_alloc_) {
        fail_next_alloc_ = false;
        return nullptr;
    }
    size_t size = sizeof(libusb_transfer) + sizeof(libusb_iso_packet_descriptor) * iso_packets;
    libusb_transfer* transfer = static_cast<libusb_transfer*>(calloc(1, size));
    CHECK(transfer != nullptr);
    transfer->num_iso_packets = iso_packets;
    live_.insert(transfer);
    return transfer;
}

void FakeUsbBackend::FreeTransfer(libusb_transfer* transfer) {
    CHECK_EQ(1u, live_.erase(transfer)) << "freeing a transfer that is not live";
    // Teardown may free transfers that never completed.
    in_flight_.erase(std::remove(in_flight_.begin(), in_flight_.end(), transfer), in_flight_.end());
    queued_.erase(std::remove_if(queued_.begin(), queued_.end(),
                                 [transfer](const QueuedCompletion& completion) {
                                     return completion.transfer == transfer;
                                 }),
                  queued_.end());
    free(transfer);
}

int FakeUsbBackend::SubmitTransfer(libusb_transfer* transfer) {
    ++submit_calls_;
    CHECK(live_.count(transfer)) << "submitting a transfer that is not live";
    if (fail_next_submit_ != 0) {
        int rc = fail_next_submit_;
        fail_next_submit_ = 0;
        return rc;
    }
    if (std::find(in_flight_.begin(), in_flight_.end(), transfer) != in_flight_.end()) {
        return LIBUSB_ERROR_BUSY;
    }
    in_flight_.push_back(transfer);
    return 0;
}

int FakeUsbBackend::CancelTransfer(libusb_transfer* transfer) {
    ++cancel_calls_;
    if (fail_next_cancel_ != 0) {
        int rc = fail_next_cancel_;
        fail_next_cancel_ = 0;
        return rc;
    }
    if (std::find(in_flight_.begin(), in_flight_.end(), transfer) == in_flight_.end()) {
        return LIBUSB_ERROR_NOT_FOUND;
    }
    QueueCompletion(transfer, LIBUSB_TRANSFER_CANCELLED, 0);
    return 0;
}

int FakeUsbBackend::TryLockEvents() {
    ++try_lock_calls_;
    if (try_lock_failures_ > 0) {
        --try_lock_failures_;
        return 1;
    }
    if (events_locked_) {
        return 1;
    }
    events_locked_ = true;
    return 0;
}

void FakeUsbBackend::UnlockEvents() {
    ++unlock_calls_;
    CHECK(events_locked_) << "unlocking events that are not locked";
    events_locked_ = false;
}

bool FakeUsbBackend::EventHandlingOk() {
    if (not_ok_count_ > 0) {
        --not_ok_count_;
        return false;
    }
    return true;
}

int FakeUsbBackend::HandleEventsLocked(timeval*) {
    ++handle_events_calls_;
    CHECK(events_locked_) << "handling events without the events lock";
    if (fail_next_handle_events_ != 0) {
        int rc = fail_next_handle_events_;
        fail_next_handle_events_ = 0;
        return rc;
    }

    // Completions may resubmit, which queues nothing, so one pass is enough.
    std::vector<QueuedCompletion> queued;
    queued.swap(queued_);
    for (const QueuedCompletion& completion : queued) {
        CompleteNow(completion.transfer, completion.status, completion.actual_length);
    }
    return 0;
}

void FakeUsbBackend::CompleteNow(libusb_transfer* transfer, libusb_transfer_status status,
                                 int actual_length) {
    auto it = std::find(in_flight_.begin(), in_flight_.end(), transfer);
    CHECK(it != in_flight_.end()) << "completing a transfer that is not in flight";
    in_flight_.erase(it);

    transfer->status = status;
    transfer->actual_length = actual_length;
    for (int i = 0; i < transfer->num_iso_packets; ++i) {
        libusb_iso_packet_descriptor& packet = transfer->iso_packet_desc[i];
        packet.status = status;
        packet.actual_length = status == LIBUSB_TRANSFER_COMPLETED ? packet.length : 0;
    }
    transfer->callback(transfer);
}

void FakeUsbBackend::QueueCompletion(libusb_transfer* transfer, libusb_transfer_status status,
                                     int actual_length) {
    queued_.push_back({transfer, status, actual_length});
}

}  // namespace usbxfer
