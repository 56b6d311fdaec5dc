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

#include <stddef.h>
#include <stdint.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include <android-base/macros.h>
#include <android-base/thread_annotations.h>
#include <libusb.h>

#include "usbxfer/event_loop.h"
#include "usbxfer/pollfd_bridge.h"
#include "usbxfer/transfer.h"
#include "usbxfer/transfer_table.h"
#include "usbxfer/usb_backend.h"

namespace usbxfer {

constexpr std::chrono::milliseconds kDefaultSpinInterval(10);

// Asynchronous transfer I/O for one libusb context, driven by an external event loop.
//
// Transfers may be submitted and cancelled from any thread. The event loop thread registers
// the context with Register(), calls Pump() whenever one of the registered fds is ready, and
// finally calls Deregister(). Pump() must not be called concurrently for the same context.
//
// Each transfer goes through Allocated -> Submitted -> {Completed, Cancelled}, looping back to
// Submitted under the same id when its callback resubmits it. Retired transfers are reported
// through the completion list filled in by Pump().
class AsyncIo {
  public:
    AsyncIo(UsbBackend* backend, std::chrono::milliseconds spin_interval = kDefaultSpinInterval);
    ~AsyncIo();

    // The buffer must start with room for the setup packet, which is filled in here, followed
    // by at least |length| bytes.
    Result<TransferHandle> Control(libusb_device_handle* device, uint8_t request_type,
                                   uint8_t request, uint16_t value, uint16_t index,
                                   uint16_t length, std::vector<uint8_t> buffer,
                                   std::chrono::milliseconds timeout,
                                   TransferCallback callback = nullptr);
    Result<TransferHandle> Bulk(libusb_device_handle* device, uint8_t endpoint,
                                std::vector<uint8_t> buffer, std::chrono::milliseconds timeout,
                                TransferCallback callback = nullptr);
    Result<TransferHandle> Interrupt(libusb_device_handle* device, uint8_t endpoint,
                                     std::vector<uint8_t> buffer,
                                     std::chrono::milliseconds timeout,
                                     TransferCallback callback = nullptr);
    // The buffer is split evenly between |num_iso_packets| packets.
    Result<TransferHandle> Isochronous(libusb_device_handle* device, uint8_t endpoint,
                                       int num_iso_packets, std::vector<uint8_t> buffer,
                                       std::chrono::milliseconds timeout,
                                       TransferCallback callback = nullptr);
    Result<TransferHandle> BulkStream(libusb_device_handle* device, uint8_t endpoint,
                                      uint32_t stream_id, std::vector<uint8_t> buffer,
                                      std::chrono::milliseconds timeout,
                                      TransferCallback callback = nullptr);

    Result<void> Cancel(TransferId id);
    bool IsRunning(TransferId id);
    size_t RunningCount();

    // Registers libusb's pollfds with |loop| under |token|. Calling Register twice without
    // Deregister is fatal.
    Result<void> Register(EventLoop* loop, Token token);
    Result<void> Deregister(EventLoop* loop);

    // Handles pending libusb events without blocking, then moves every completion gathered so
    // far into |out|. Entries already in |out| are discarded. The pollfd registration is
    // brought up to date even when event handling fails.
    Result<void> Pump(EventLoop* loop, CompletionList* out);

    // The pollfds currently registered, if registered.
    std::optional<std::vector<PollFd>> RegisteredDescriptors();

  private:
    using FillFunction = std::function<void(libusb_transfer* transfer, unsigned char* data,
                                            int length, libusb_transfer_cb_fn callback,
                                            void* user_data)>;

    Result<TransferHandle> Submit(const char* kind, std::vector<uint8_t> buffer,
                                  TransferCallback callback, int iso_packets,
                                  const FillFunction& fill);

    // libusb's completion callback. Never lets an exception escape into libusb.
    static void LIBUSB_CALL OnTransferComplete(libusb_transfer* transfer);
    void Dispatch(TransferRecord* record, libusb_transfer* transfer);

    UsbBackend* backend_;

    // Lock order: registration_mutex_ before state_mutex_. Pump holds the registration lock
    // while libusb dispatches completions, and Dispatch takes the state lock.
    std::mutex state_mutex_;
    TransferTable table_ GUARDED_BY(state_mutex_);
    CompletionList complete_ GUARDED_BY(state_mutex_);

    std::mutex registration_mutex_;
    PollFdBridge bridge_ GUARDED_BY(registration_mutex_);

    DISALLOW_COPY_AND_ASSIGN(AsyncIo);
};

}  // namespace usbxfer
