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

#include "usbxfer/error.h"

#include <errno.h>
#include <string.h>

#include <gtest/gtest.h>

#include <libusb.h>

using namespace usbxfer;

static Result<void> claim(int rc) {
    if (rc != 0) {
        return UsbError(rc) << "failed to claim interface 0";
    }
    return {};
}

TEST(UsbError, errno_mapping) {
    ASSERT_EQ(0, LibusbErrorToErrno(LIBUSB_SUCCESS));
    ASSERT_EQ(EIO, LibusbErrorToErrno(LIBUSB_ERROR_IO));
    ASSERT_EQ(EINVAL, LibusbErrorToErrno(LIBUSB_ERROR_INVALID_PARAM));
    ASSERT_EQ(EACCES, LibusbErrorToErrno(LIBUSB_ERROR_ACCESS));
    ASSERT_EQ(ENODEV, LibusbErrorToErrno(LIBUSB_ERROR_NO_DEVICE));
    ASSERT_EQ(ENOENT, LibusbErrorToErrno(LIBUSB_ERROR_NOT_FOUND));
    ASSERT_EQ(EBUSY, LibusbErrorToErrno(LIBUSB_ERROR_BUSY));
    ASSERT_EQ(ETIMEDOUT, LibusbErrorToErrno(LIBUSB_ERROR_TIMEOUT));
    ASSERT_EQ(EOVERFLOW, LibusbErrorToErrno(LIBUSB_ERROR_OVERFLOW));
    ASSERT_EQ(EPIPE, LibusbErrorToErrno(LIBUSB_ERROR_PIPE));
    ASSERT_EQ(EINTR, LibusbErrorToErrno(LIBUSB_ERROR_INTERRUPTED));
    ASSERT_EQ(ENOMEM, LibusbErrorToErrno(LIBUSB_ERROR_NO_MEM));
    ASSERT_EQ(EOPNOTSUPP, LibusbErrorToErrno(LIBUSB_ERROR_NOT_SUPPORTED));
    ASSERT_EQ(EIO, LibusbErrorToErrno(LIBUSB_ERROR_OTHER));
    ASSERT_EQ(EIO, LibusbErrorToErrno(-1000));
}

TEST(UsbError, result) {
    ASSERT_TRUE(claim(0).has_value());

    auto result = claim(LIBUSB_ERROR_BUSY);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EBUSY, result.error().code());
    ASSERT_EQ(std::string("failed to claim interface 0: ") + strerror(EBUSY),
              result.error().message());
}
