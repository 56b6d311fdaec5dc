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

#include <errno.h>

#include <map>
#include <set>
#include <utility>
#include <vector>

#include "usbxfer/event_loop.h"

namespace usbxfer {

// EventLoop that only records registrations, failing the way EpollLoop does on duplicate or
// unknown fds.
class FakeEventLoop : public EventLoop {
  public:
    struct Registration {
        Token token;
        unsigned events;
    };

    Result<void> Register(int fd, Token token, unsigned events) override {
        register_calls_.push_back(fd);
        if (fail_register_.count(fd)) {
            return Error(EPERM) << "refusing to register fd " << fd;
        }
        if (registered_.count(fd)) {
            return Error(EEXIST) << "fd " << fd << " is already registered";
        }
        registered_[fd] = Registration{token, events};
        return {};
    }

    Result<void> Unregister(int fd) override {
        unregister_calls_.push_back(fd);
        if (registered_.erase(fd) == 0) {
            return Error(ENOENT) << "fd " << fd << " is not registered";
        }
        return {};
    }

    void FailRegister(int fd) { fail_register_.insert(fd); }
    void AllowRegister(int fd) { fail_register_.erase(fd); }

    const std::map<int, Registration>& registered() const { return registered_; }
    bool IsRegistered(int fd) const { return registered_.count(fd) != 0; }

    const std::vector<int>& register_calls() const { return register_calls_; }
    const std::vector<int>& unregister_calls() const { return unregister_calls_; }
    void ClearCalls() {
        register_calls_.clear();
        unregister_calls_.clear();
    }

  private:
    std::map<int, Registration> registered_;
    std::set<int> fail_register_;
    std::vector<int> register_calls_;
    std::vector<int> unregister_calls_;
};

}  // namespace usbxfer
