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

#include "usbxfer/usb_backend.h"

#include <libusb.h>

namespace usbxfer {

LibusbBackend::LibusbBackend(libusb_context* context) : context_(context) {}

libusb_transfer* LibusbBackend::AllocTransfer(int iso_packets) {
    return libusb_alloc_transfer(iso_packets);
}

void LibusbBackend::FreeTransfer(libusb_transfer* transfer) {
    libusb_free_transfer(transfer);
}

int LibusbBackend::SubmitTransfer(libusb_transfer* transfer) {
    return libusb_submit_transfer(transfer);
}

int LibusbBackend::CancelTransfer(libusb_transfer* transfer) {
    return libusb_cancel_transfer(transfer);
}

int LibusbBackend::TryLockEvents() {
    return libusb_try_lock_events(context_);
}

void LibusbBackend::UnlockEvents() {
    libusb_unlock_events(context_);
}

bool LibusbBackend::EventHandlingOk() {
    return libusb_event_handling_ok(context_) != 0;
}

int LibusbBackend::HandleEventsLocked(timeval* tv) {
    return libusb_handle_events_locked(context_, tv);
}

std::vector<libusb_pollfd> LibusbBackend::GetPollFds() {
    std::vector<libusb_pollfd> result;
    const libusb_pollfd** pollfds = libusb_get_pollfds(context_);
    if (pollfds == nullptr) {
        return result;
    }
    for (const libusb_pollfd** it = pollfds; *it != nullptr; ++it) {
        result.push_back(**it);
    }
    libusb_free_pollfds(pollfds);
    return result;
}

bool LibusbBackend::PollFdsHandleTimeouts() {
    return libusb_pollfds_handle_timeouts(context_) != 0;
}

}  // namespace usbxfer
