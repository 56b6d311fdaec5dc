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

#include <sys/time.h>

#include <set>
#include <vector>

#include <android-base/macros.h>
#include <libusb.h>

#include "usbxfer/usb_backend.h"

namespace usbxfer {

// In-memory UsbBackend for tests. Transfers are never sent anywhere: a test decides when each
// submitted transfer completes, either immediately with CompleteNow() or on the next
// HandleEventsLocked() with QueueCompletion(). Not thread-safe.
class FakeUsbBackend : public UsbBackend {
  public:
    FakeUsbBackend();
    ~FakeUsbBackend() override;

    libusb_transfer* AllocTransfer(int iso_packets) override;
    void FreeTransfer(libusb_transfer* transfer) override;
    int SubmitTransfer(libusb_transfer* transfer) override;
    int CancelTransfer(libusb_transfer* transfer) override;

    int TryLockEvents() override;
    void UnlockEvents() override;
    bool EventHandlingOk() override;
    int HandleEventsLocked(timeval* tv) override;

    std::vector<libusb_pollfd> GetPollFds() override { return pollfds_; }
    bool PollFdsHandleTimeouts() override { return true; }

    void SetPollFds(std::vector<libusb_pollfd> pollfds) { pollfds_ = std::move(pollfds); }

    // Invokes the completion callback of an in-flight transfer right away. Isochronous packets
    // are all reported complete.
    void CompleteNow(libusb_transfer* transfer, libusb_transfer_status status,
                     int actual_length);
    // Like CompleteNow(), but from within the next HandleEventsLocked().
    void QueueCompletion(libusb_transfer* transfer, libusb_transfer_status status,
                         int actual_length);

    void FailNextAlloc() { fail_next_alloc_ = true; }
    void FailNextSubmit(int libusb_error) { fail_next_submit_ = libusb_error; }
    void FailNextHandleEvents(int libusb_error) { fail_next_handle_events_ = libusb_error; }
    void FailNextCancel(int libusb_error) { fail_next_cancel_ = libusb_error; }
    // The next |count| TryLockEvents() calls fail.
    void FailTryLockEvents(int count) { try_lock_failures_ = count; }
    // The next |count| EventHandlingOk() calls return false.
    void SetEventHandlingNotOk(int count) { not_ok_count_ = count; }

    // Transfers submitted and not yet completed, oldest first.
    const std::vector<libusb_transfer*>& in_flight() const { return in_flight_; }
    libusb_transfer* last_in_flight() const {
        return in_flight_.empty() ? nullptr : in_flight_.back();
    }
    // Transfers allocated and not yet freed.
    size_t live_transfers() const { return live_.size(); }
    bool events_locked() const { return events_locked_; }

    int submit_calls() const { return submit_calls_; }
    int cancel_calls() const { return cancel_calls_; }
    int handle_events_calls() const { return handle_events_calls_; }
    int try_lock_calls() const { return try_lock_calls_; }
    int unlock_calls() const { return unlock_calls_; }

  private:
    struct QueuedCompletion {
        libusb_transfer* transfer;
        libusb_transfer_status status;
        int actual_length;
    };

    std::vector<libusb_pollfd> pollfds_;
    std::set<libusb_transfer*> live_;
    std::vector<libusb_transfer*> in_flight_;
    std::vector<QueuedCompletion> queued_;

    bool events_locked_ = false;
    bool fail_next_alloc_ = false;
    int fail_next_submit_ = 0;
    int fail_next_handle_events_ = 0;
    int fail_next_cancel_ = 0;
    int try_lock_failures_ = 0;
    int not_ok_count_ = 0;

    int submit_calls_ = 0;
    int cancel_calls_ = 0;
    int handle_events_calls_ = 0;
    int try_lock_calls_ = 0;
    int unlock_calls_ = 0;

    DISALLOW_COPY_AND_ASSIGN(FakeUsbBackend);
};

}  // namespace usbxfer
