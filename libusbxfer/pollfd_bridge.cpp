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

#include "usbxfer/pollfd_bridge.h"

#include <poll.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <thread>

#include <android-base/logging.h>

#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

std::ostream& operator<<(std::ostream& os, const PollFd& pollfd) {
    os << pollfd.fd << ":";
    if (pollfd.events & USBXFER_EVENT_READ) os << "r";
    if (pollfd.events & USBXFER_EVENT_WRITE) os << "w";
    return os;
}

static std::ostream& operator<<(std::ostream& os, const std::vector<PollFd>& pollfds) {
    os << "[";
    for (size_t i = 0; i < pollfds.size(); ++i) {
        if (i != 0) os << ", ";
        os << pollfds[i];
    }
    return os << "]";
}

PollFdBridge::PollFdBridge(UsbBackend* backend, std::chrono::milliseconds spin_interval)
    : backend_(backend), spin_interval_(spin_interval) {}

PollFdBridge::~PollFdBridge() {
    if (registration_) {
        LOG(WARNING) << "libusb pollfds still registered with token " << registration_->token
                     << " at teardown";
    }
}

std::vector<PollFd> PollFdBridge::CurrentDescriptorSet() {
    std::vector<PollFd> result;
    for (const libusb_pollfd& pollfd : backend_->GetPollFds()) {
        unsigned events = 0;
        if (pollfd.events & POLLIN) events |= USBXFER_EVENT_READ;
        if (pollfd.events & POLLOUT) events |= USBXFER_EVENT_WRITE;
        if (pollfd.fd < 0 || events == 0) {
            LOG(WARNING) << "ignoring libusb pollfd " << pollfd.fd << " with events " << std::hex
                         << std::showbase << pollfd.events;
            continue;
        }
        result.push_back({pollfd.fd, events});
    }

    std::sort(result.begin(), result.end());

    // An fd can only be registered once, so merge duplicate entries.
    std::vector<PollFd> merged;
    for (const PollFd& pollfd : result) {
        if (!merged.empty() && merged.back().fd == pollfd.fd) {
            merged.back().events |= pollfd.events;
        } else {
            merged.push_back(pollfd);
        }
    }

    VLOG(POLLFD) << "libusb pollfds: " << merged;
    return merged;
}

void PollFdBridge::SpinUntilLockedAndOkToHandleEvents() {
    while (true) {
        if (backend_->TryLockEvents() == 0) {
            if (backend_->EventHandlingOk()) {
                return;
            }
            backend_->UnlockEvents();
            LOG(WARNING) << "libusb event handling is not ok, retrying in "
                         << spin_interval_.count() << "ms";
        } else {
            LOG(WARNING) << "could not acquire the libusb events lock, retrying in "
                         << spin_interval_.count() << "ms";
        }
        std::this_thread::sleep_for(spin_interval_);
    }
}

Result<void> PollFdBridge::Register(EventLoop* loop, Token token) {
    if (registration_) {
        LOG(FATAL) << "libusb pollfds are already registered with token " << registration_->token
                   << ", they may only be registered once";
    }

    SpinUntilLockedAndOkToHandleEvents();

    std::vector<PollFd> fds = CurrentDescriptorSet();
    for (size_t i = 0; i < fds.size(); ++i) {
        auto result = loop->Register(fds[i].fd, token, fds[i].events);
        if (!result) {
            while (i-- > 0) {
                auto undo = loop->Unregister(fds[i].fd);
                if (!undo) {
                    LOG(ERROR) << "failed to roll back registration of " << fds[i] << ": "
                               << undo.error();
                }
            }
            backend_->UnlockEvents();
            return Error() << "failed to register libusb pollfd: " << result.error();
        }
    }

    VLOG(POLLFD) << "registered libusb pollfds " << fds << " with token " << token;
    registration_ = Registration{token, std::move(fds)};
    return {};
}

Result<void> PollFdBridge::Deregister(EventLoop* loop) {
    if (!registration_) {
        LOG(FATAL) << "unable to deregister libusb pollfds when they are not registered";
    }

    std::string first_error;
    for (const PollFd& pollfd : registration_->fds) {
        auto unregistered = loop->Unregister(pollfd.fd);
        if (!unregistered && first_error.empty()) {
            first_error = unregistered.error().message();
        }
    }

    backend_->UnlockEvents();
    VLOG(POLLFD) << "deregistered libusb pollfds " << registration_->fds;
    registration_.reset();
    if (!first_error.empty()) {
        return Error() << "failed to unregister libusb pollfd: " << first_error;
    }
    return {};
}

Result<void> PollFdBridge::Reconcile(EventLoop* loop) {
    CHECK(registration_) << "reconciling libusb pollfds without a registration";

    std::vector<PollFd> current = CurrentDescriptorSet();
    std::vector<PollFd>& registered = registration_->fds;
    if (current == registered) {
        return {};
    }

    std::vector<PollFd> stale;
    std::set_difference(registered.begin(), registered.end(), current.begin(), current.end(),
                        std::back_inserter(stale));
    std::vector<PollFd> added;
    std::set_difference(current.begin(), current.end(), registered.begin(), registered.end(),
                        std::back_inserter(added));
    VLOG(POLLFD) << "libusb pollfds changed from " << registered << " to " << current;

    // Whatever fails to change stays out of sync and is retried on the next reconcile.
    std::string first_error;
    std::vector<PollFd> now_registered;
    for (const PollFd& pollfd : registered) {
        if (!std::binary_search(stale.begin(), stale.end(), pollfd)) {
            now_registered.push_back(pollfd);
            continue;
        }
        auto unregistered = loop->Unregister(pollfd.fd);
        if (!unregistered) {
            now_registered.push_back(pollfd);
            if (first_error.empty()) first_error = unregistered.error().message();
        }
    }
    for (const PollFd& pollfd : added) {
        auto result = loop->Register(pollfd.fd, registration_->token, pollfd.events);
        if (!result) {
            if (first_error.empty()) first_error = result.error().message();
            continue;
        }
        now_registered.push_back(pollfd);
    }

    std::sort(now_registered.begin(), now_registered.end());
    registered = std::move(now_registered);
    if (!first_error.empty()) {
        return Error() << "failed to update libusb pollfd registration: " << first_error;
    }
    return {};
}

}  // namespace usbxfer
