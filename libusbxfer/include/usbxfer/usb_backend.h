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

#include <sys/time.h>

#include <vector>

#include <android-base/macros.h>
#include <libusb.h>

namespace usbxfer {

// The subset of libusb that the asynchronous transfer core depends on. Return
// values follow the libusb conventions of the wrapped calls.
class UsbBackend {
  public:
    virtual ~UsbBackend() = default;

    virtual libusb_transfer* AllocTransfer(int iso_packets) = 0;
    virtual void FreeTransfer(libusb_transfer* transfer) = 0;
    virtual int SubmitTransfer(libusb_transfer* transfer) = 0;
    virtual int CancelTransfer(libusb_transfer* transfer) = 0;

    // Returns 0 if the events lock was obtained, 1 otherwise.
    virtual int TryLockEvents() = 0;
    virtual void UnlockEvents() = 0;
    virtual bool EventHandlingOk() = 0;

    // Must be called with the events lock held.
    virtual int HandleEventsLocked(timeval* tv) = 0;

    virtual std::vector<libusb_pollfd> GetPollFds() = 0;
    virtual bool PollFdsHandleTimeouts() = 0;
};

// UsbBackend forwarding to libusb for a single libusb_context.
class LibusbBackend : public UsbBackend {
  public:
    explicit LibusbBackend(libusb_context* context);
    ~LibusbBackend() override = default;

    libusb_transfer* AllocTransfer(int iso_packets) override;
    void FreeTransfer(libusb_transfer* transfer) override;
    int SubmitTransfer(libusb_transfer* transfer) override;
    int CancelTransfer(libusb_transfer* transfer) override;

    int TryLockEvents() override;
    void UnlockEvents() override;
    bool EventHandlingOk() override;
    int HandleEventsLocked(timeval* tv) override;

    std::vector<libusb_pollfd> GetPollFds() override;
    bool PollFdsHandleTimeouts() override;

  private:
    libusb_context* context_;

    DISALLOW_COPY_AND_ASSIGN(LibusbBackend);
};

}  // namespace usbxfer
