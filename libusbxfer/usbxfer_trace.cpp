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

#include "usbxfer/usbxfer_trace.h"

#include <stdlib.h>

#include <string>
#include <unordered_map>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

namespace usbxfer {

int trace_mask;

static std::string get_trace_setting_from_env() {
    const char* setting = getenv("USBXFER_TRACE");
    if (setting == nullptr) {
        setting = "";
    }

    return std::string(setting);
}

int TraceMaskFromString(const std::string& setting) {
    static const auto& trace_flags = *new std::unordered_map<std::string, int>({
            {"1", -1},
            {"all", -1},
            {"transfer", TRANSFER},
            {"pollfd", POLLFD},
            {"event", EVENT},
            {"device", DEVICE},
            {"libusb", LIBUSB},
    });

    int mask = 0;
    for (const auto& elem : android::base::Split(setting, " ,")) {
        if (elem.empty()) {
            continue;
        }

        const auto& flag = trace_flags.find(elem);
        if (flag == trace_flags.end()) {
            LOG(ERROR) << "Unknown trace flag: " << elem;
            continue;
        }

        if (flag->second == -1) {
            return ~0;
        }
        mask |= 1 << flag->second;
    }
    return mask;
}

void trace_init(char** argv) {
    android::base::InitLogging(argv, &android::base::StderrLogger);
    trace_mask |= TraceMaskFromString(get_trace_setting_from_env());
}

void trace_enable(Trace tag) {
    trace_mask |= (1 << tag);
}

}  // namespace usbxfer
