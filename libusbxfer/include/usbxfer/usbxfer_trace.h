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

#include <string>

#include <android-base/logging.h>
#include <android-base/macros.h>

namespace usbxfer {

// IMPORTANT: if you change the following list, don't forget to update the
// corresponding table in TraceMaskFromString().
enum Trace {
    TRANSFER = 0,
    POLLFD,
    EVENT,
    DEVICE,
    LIBUSB,
};

extern int trace_mask;

// Parses a space or comma separated list of trace tags. "1" and "all" enable
// every tag. Unknown tags are logged and ignored.
int TraceMaskFromString(const std::string& setting);

// Initializes android-base logging to stderr and reads the trace mask from
// the USBXFER_TRACE environment variable.
void trace_init(char** argv);
void trace_enable(Trace tag);

}  // namespace usbxfer

#define VLOG_IS_ON(TAG) ((::usbxfer::trace_mask & (1 << (TAG))) != 0)

#define VLOG(TAG)                 \
    if (LIKELY(!VLOG_IS_ON(TAG))) \
        ;                         \
    else                          \
        LOG(INFO)
