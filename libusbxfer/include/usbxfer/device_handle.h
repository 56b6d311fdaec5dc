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

#include <bitset>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <android-base/macros.h>
#include <libusb.h>

#include "usbxfer/descriptors.h"
#include "usbxfer/error.h"
#include "usbxfer/transfer.h"

namespace usbxfer {

class Context;

// An open USB device. Interfaces claimed through the handle are released, and the device
// closed, when the handle is destroyed.
class DeviceHandle {
  public:
    // Takes ownership of |handle|.
    DeviceHandle(std::shared_ptr<Context> context, libusb_device_handle* handle);
    ~DeviceHandle();

    Result<uint8_t> ActiveConfiguration();
    Result<void> SetActiveConfiguration(uint8_t config);
    // Puts the device in an unconfigured state.
    Result<void> Unconfigure();
    Result<void> Reset();
    Result<void> ClearHalt(uint8_t endpoint);

    // Kernel driver management is not supported on all platforms.
    Result<bool> KernelDriverActive(uint8_t iface);
    Result<void> DetachKernelDriver(uint8_t iface);
    Result<void> AttachKernelDriver(uint8_t iface);

    Result<void> ClaimInterface(uint8_t iface);
    Result<void> ReleaseInterface(uint8_t iface);
    Result<void> SetAlternateSetting(uint8_t iface, uint8_t setting);

    // Blocking transfers. Each returns the number of bytes transferred, and fails with EINVAL
    // if the endpoint or request type points the wrong way.
    Result<size_t> ReadInterrupt(uint8_t endpoint, void* data, size_t length,
                                 std::chrono::milliseconds timeout);
    Result<size_t> WriteInterrupt(uint8_t endpoint, const void* data, size_t length,
                                  std::chrono::milliseconds timeout);
    Result<size_t> ReadBulk(uint8_t endpoint, void* data, size_t length,
                            std::chrono::milliseconds timeout);
    Result<size_t> WriteBulk(uint8_t endpoint, const void* data, size_t length,
                             std::chrono::milliseconds timeout);
    Result<size_t> ReadControl(uint8_t request_type, uint8_t request, uint16_t value,
                               uint16_t index, void* data, size_t length,
                               std::chrono::milliseconds timeout);
    Result<size_t> WriteControl(uint8_t request_type, uint8_t request, uint16_t value,
                                uint16_t index, const void* data, size_t length,
                                std::chrono::milliseconds timeout);

    // Reads the languages supported by the device's string descriptors.
    Result<std::vector<Language>> ReadLanguages(std::chrono::milliseconds timeout);
    Result<std::string> ReadStringDescriptor(Language language, uint8_t index,
                                             std::chrono::milliseconds timeout);
    Result<std::string> ReadManufacturerString(Language language, const DeviceDescriptor& device,
                                               std::chrono::milliseconds timeout);
    Result<std::string> ReadProductString(Language language, const DeviceDescriptor& device,
                                          std::chrono::milliseconds timeout);
    Result<std::string> ReadSerialNumberString(Language language, const DeviceDescriptor& device,
                                               std::chrono::milliseconds timeout);
    Result<std::string> ReadConfigurationString(Language language,
                                                const ConfigDescriptor& configuration,
                                                std::chrono::milliseconds timeout);
    Result<std::string> ReadInterfaceString(Language language,
                                            const InterfaceDescriptor& interface,
                                            std::chrono::milliseconds timeout);

    // Asynchronous transfers, submitted through the context's AsyncIo.
    Result<TransferHandle> Control(uint8_t request_type, uint8_t request, uint16_t value,
                                   uint16_t index, uint16_t length, std::vector<uint8_t> buffer,
                                   std::chrono::milliseconds timeout,
                                   TransferCallback callback = nullptr);
    Result<TransferHandle> Bulk(uint8_t endpoint, std::vector<uint8_t> buffer,
                                std::chrono::milliseconds timeout,
                                TransferCallback callback = nullptr);
    Result<TransferHandle> Interrupt(uint8_t endpoint, std::vector<uint8_t> buffer,
                                     std::chrono::milliseconds timeout,
                                     TransferCallback callback = nullptr);
    Result<TransferHandle> Isochronous(uint8_t endpoint, int num_iso_packets,
                                       std::vector<uint8_t> buffer,
                                       std::chrono::milliseconds timeout,
                                       TransferCallback callback = nullptr);
    Result<TransferHandle> BulkStream(uint8_t endpoint, uint32_t stream_id,
                                      std::vector<uint8_t> buffer,
                                      std::chrono::milliseconds timeout,
                                      TransferCallback callback = nullptr);

    libusb_device_handle* native_handle() const { return handle_; }

  private:
    Result<size_t> InterruptOrBulk(uint8_t endpoint, unsigned char* data, size_t length,
                                   std::chrono::milliseconds timeout, bool interrupt);
    Result<size_t> ControlMessage(uint8_t request_type, uint8_t request, uint16_t value,
                                  uint16_t index, unsigned char* data, size_t length,
                                  std::chrono::milliseconds timeout);
    Result<std::string> ReadStringAt(Language language, std::optional<uint8_t> index,
                                     std::chrono::milliseconds timeout);

    // Ties a transfer submitted through this handle to the lifetime of its context.
    Result<TransferHandle> RetainContext(Result<TransferHandle> submitted);

    std::shared_ptr<Context> context_;
    libusb_device_handle* handle_;
    std::bitset<256> interfaces_;

    DISALLOW_COPY_AND_ASSIGN(DeviceHandle);
};

}  // namespace usbxfer
