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

#include <android-base/result.h>

namespace usbxfer {

using android::base::ErrnoError;
using android::base::Error;
using android::base::Result;

// Maps a negative libusb_error code onto the closest errno value, so that
// Result errors produced by this library can be inspected with code().
int LibusbErrorToErrno(int libusb_error);

// Returns an Error carrying the errno equivalent of |libusb_error|. The
// message gets the strerror() text appended, in the manner of ErrnoError():
//
//   int rc = libusb_claim_interface(handle, 0);
//   if (rc != 0) return UsbError(rc) << "failed to claim interface 0";
inline auto UsbError(int libusb_error) {
    return Error(LibusbErrorToErrno(libusb_error));
}

}  // namespace usbxfer
