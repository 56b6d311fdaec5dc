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

#if defined(__linux__)

#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include <android-base/macros.h>
#include <android-base/thread_annotations.h>
#include <android-base/unique_fd.h>

#include "usbxfer/event_loop.h"

namespace usbxfer {

// Level-triggered epoll event loop.
class EpollLoop final : public EventLoop {
  public:
    struct Event {
        Token token;
        unsigned events;
    };

    EpollLoop();
    ~EpollLoop() override;

    Result<void> Register(int fd, Token token, unsigned events) override;
    Result<void> Unregister(int fd) override;

    // Waits for readiness, at most |timeout| if given, and replaces the contents of |events|
    // with the ready registrations. An interrupted wait yields no events.
    Result<void> Poll(std::vector<Event>* events,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Interrupt a concurrent or the next Poll. Safe to call from any thread.
    void Wake();

    size_t RegisteredCount();

  private:
    android::base::unique_fd epoll_fd_;
    android::base::unique_fd wake_fd_;

    std::mutex registered_mutex_;
    std::unordered_map<int, Token> registered_ GUARDED_BY(registered_mutex_);

    DISALLOW_COPY_AND_ASSIGN(EpollLoop);
};

}  // namespace usbxfer

#endif  // defined(__linux__)
