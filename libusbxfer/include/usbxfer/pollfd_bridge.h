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

#include <chrono>
#include <optional>
#include <ostream>
#include <vector>

#include <android-base/macros.h>

#include "usbxfer/event_loop.h"
#include "usbxfer/usb_backend.h"

namespace usbxfer {

// A file descriptor libusb wants monitored, with USBXFER_EVENT_* readiness flags.
struct PollFd {
    int fd;
    unsigned events;
};

inline bool operator==(const PollFd& lhs, const PollFd& rhs) {
    return lhs.fd == rhs.fd && lhs.events == rhs.events;
}

inline bool operator!=(const PollFd& lhs, const PollFd& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(const PollFd& lhs, const PollFd& rhs) {
    return lhs.fd < rhs.fd || (lhs.fd == rhs.fd && lhs.events < rhs.events);
}

std::ostream& operator<<(std::ostream& os, const PollFd& pollfd);

// Keeps an EventLoop's registrations in sync with libusb's pollfd set.
//
// While registered, the bridge holds libusb's events lock on behalf of the thread running the
// event loop. libusb's events lock is a mutex, so Register, Reconcile and Deregister must all
// be called from that thread. Not thread-safe; AsyncIo serializes access.
class PollFdBridge {
  public:
    struct Registration {
        Token token;
        std::vector<PollFd> fds;
    };

    PollFdBridge(UsbBackend* backend, std::chrono::milliseconds spin_interval);
    ~PollFdBridge();

    // libusb's current pollfd set translated to event loop flags, sorted by fd. Entries with an
    // invalid fd or no readiness of interest are dropped.
    std::vector<PollFd> CurrentDescriptorSet();

    // Takes the events lock and registers every pollfd with |token|. Registering twice without
    // an intervening Deregister is fatal.
    Result<void> Register(EventLoop* loop, Token token);

    // Unregisters every pollfd and releases the events lock. Fatal if not registered.
    Result<void> Deregister(EventLoop* loop);

    // Brings the event loop registrations in line with libusb's current pollfd set. Only the
    // pollfds that changed are unregistered or registered.
    Result<void> Reconcile(EventLoop* loop);

    // Busy-waits, sleeping |spin_interval| between attempts, until the events lock is held and
    // libusb reports that event handling is ok.
    void SpinUntilLockedAndOkToHandleEvents();

    bool registered() const { return registration_.has_value(); }
    const std::optional<Registration>& registration() const { return registration_; }

  private:
    UsbBackend* backend_;
    const std::chrono::milliseconds spin_interval_;
    std::optional<Registration> registration_;

    DISALLOW_COPY_AND_ASSIGN(PollFdBridge);
};

}  // namespace usbxfer
