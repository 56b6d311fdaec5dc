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

#include "usbxfer/epoll_loop.h"

#if defined(__linux__)

#include <errno.h>
#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>

#include <android-base/logging.h>

#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

static uint32_t calculate_epoll_events(unsigned events) {
    uint32_t result = 0;
    if (events & USBXFER_EVENT_READ) {
        result |= EPOLLIN;
    }
    if (events & USBXFER_EVENT_WRITE) {
        result |= EPOLLOUT;
    }
    if (events & USBXFER_EVENT_ERROR) {
        result |= EPOLLERR;
    }
    return result;
}

EpollLoop::EpollLoop() {
    epoll_fd_.reset(epoll_create1(EPOLL_CLOEXEC));
    if (epoll_fd_.get() == -1) {
        PLOG(FATAL) << "failed to create epoll instance";
    }

    wake_fd_.reset(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
    if (wake_fd_.get() == -1) {
        PLOG(FATAL) << "failed to create epoll wake eventfd";
    }

    epoll_event ev = {};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_.get();
    if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, wake_fd_.get(), &ev) != 0) {
        PLOG(FATAL) << "failed to register wake eventfd with epoll";
    }
}

EpollLoop::~EpollLoop() {
    std::lock_guard<std::mutex> lock(registered_mutex_);
    if (!registered_.empty()) {
        LOG(WARNING) << "destroying epoll loop with " << registered_.size()
                     << " fds still registered";
    }
}

Result<void> EpollLoop::Register(int fd, Token token, unsigned events) {
    std::lock_guard<std::mutex> lock(registered_mutex_);
    if (fd == wake_fd_.get() || registered_.count(fd) != 0) {
        return Error(EEXIST) << "fd " << fd << " is already registered";
    }

    epoll_event ev = {};
    ev.events = calculate_epoll_events(events);
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &ev) != 0) {
        return ErrnoError() << "failed to register fd " << fd << " with epoll";
    }
    registered_[fd] = token;
    VLOG(EVENT) << "registered fd " << fd << " with token " << token << ", events " << std::hex
                << std::showbase << events;
    return {};
}

Result<void> EpollLoop::Unregister(int fd) {
    std::lock_guard<std::mutex> lock(registered_mutex_);
    auto it = registered_.find(fd);
    if (it == registered_.end()) {
        return Error(ENOENT) << "fd " << fd << " is not registered";
    }

    registered_.erase(it);
    if (epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
        return ErrnoError() << "failed to unregister fd " << fd << " with epoll";
    }
    VLOG(EVENT) << "unregistered fd " << fd;
    return {};
}

Result<void> EpollLoop::Poll(std::vector<Event>* events,
                             std::optional<std::chrono::milliseconds> timeout) {
    events->clear();

    size_t capacity;
    {
        std::lock_guard<std::mutex> lock(registered_mutex_);
        capacity = std::max<size_t>(registered_.size() + 1, 16);
    }
    std::vector<epoll_event> epoll_events(capacity);

    int timeout_ms = timeout ? static_cast<int>(timeout->count()) : -1;
    int rc = epoll_wait(epoll_fd_.get(), epoll_events.data(), epoll_events.size(), timeout_ms);
    if (rc == -1) {
        if (errno == EINTR) {
            return {};
        }
        return ErrnoError() << "epoll_wait failed";
    }

    std::lock_guard<std::mutex> lock(registered_mutex_);
    for (int i = 0; i < rc; ++i) {
        int fd = epoll_events[i].data.fd;
        if (fd == wake_fd_.get()) {
            uint64_t buf;
            if (TEMP_FAILURE_RETRY(read(fd, &buf, sizeof(buf))) == -1 && errno != EAGAIN) {
                PLOG(FATAL) << "failed to read from epoll wake eventfd";
            }
            continue;
        }

        auto it = registered_.find(fd);
        if (it == registered_.end()) {
            // Unregistered by another thread after epoll_wait returned.
            continue;
        }

        unsigned ready = 0;
        if (epoll_events[i].events & EPOLLIN) {
            ready |= USBXFER_EVENT_READ;
        }
        if (epoll_events[i].events & EPOLLOUT) {
            ready |= USBXFER_EVENT_WRITE;
        }
        if (epoll_events[i].events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) {
            // We fake a read, as the rest of the code assumes that errors will
            // be detected at that point.
            ready |= USBXFER_EVENT_READ | USBXFER_EVENT_ERROR;
        }

        VLOG(EVENT) << "fd " << fd << " got events " << std::hex << std::showbase << ready;
        events->push_back({it->second, ready});
    }
    return {};
}

void EpollLoop::Wake() {
    uint64_t i = 1;
    ssize_t rc = TEMP_FAILURE_RETRY(write(wake_fd_.get(), &i, sizeof(i)));
    if (rc != sizeof(i)) {
        PLOG(FATAL) << "failed to write to epoll wake eventfd";
    }
}

size_t EpollLoop::RegisteredCount() {
    std::lock_guard<std::mutex> lock(registered_mutex_);
    return registered_.size();
}

}  // namespace usbxfer

#endif  // defined(__linux__)
