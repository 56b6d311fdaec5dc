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

#include <stdint.h>

#include "usbxfer/error.h"

namespace usbxfer {

// Events that may be observed
#define USBXFER_EVENT_READ 0x0001
#define USBXFER_EVENT_WRITE 0x0002
#define USBXFER_EVENT_ERROR 0x0004

// Opaque value handed back by the event loop when a registered fd is ready.
using Token = uint64_t;

// Readiness registration interface of the event loop hosting a Context.
// Registrations are level triggered.
class EventLoop {
  public:
    virtual ~EventLoop() = default;

    virtual Result<void> Register(int fd, Token token, unsigned events) = 0;
    virtual Result<void> Unregister(int fd) = 0;
};

}  // namespace usbxfer
