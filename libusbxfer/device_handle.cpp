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

#include "usbxfer/device_handle.h"

#include <errno.h>
#include <limits.h>

#include <android-base/logging.h>

#include "usbxfer/context.h"
#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

static unsigned int timeout_millis(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return 0;
    }
    if (timeout.count() > UINT_MAX) {
        return UINT_MAX;
    }
    return static_cast<unsigned int>(timeout.count());
}

static bool endpoint_is_input(uint8_t endpoint) {
    return (endpoint & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN;
}

DeviceHandle::DeviceHandle(std::shared_ptr<Context> context, libusb_device_handle* handle)
    : context_(std::move(context)), handle_(handle) {}

DeviceHandle::~DeviceHandle() {
    for (size_t iface = 0; iface < interfaces_.size(); ++iface) {
        if (interfaces_.test(iface)) {
            int rc = libusb_release_interface(handle_, static_cast<int>(iface));
            if (rc != 0) {
                LOG(WARNING) << "failed to release interface " << iface << ": "
                             << libusb_error_name(rc);
            }
        }
    }
    libusb_close(handle_);
}

Result<uint8_t> DeviceHandle::ActiveConfiguration() {
    int config = 0;
    int rc = libusb_get_configuration(handle_, &config);
    if (rc != 0) {
        return UsbError(rc) << "failed to get active configuration";
    }
    return static_cast<uint8_t>(config);
}

Result<void> DeviceHandle::SetActiveConfiguration(uint8_t config) {
    int rc = libusb_set_configuration(handle_, config);
    if (rc != 0) {
        return UsbError(rc) << "failed to set configuration " << static_cast<unsigned>(config);
    }
    return {};
}

Result<void> DeviceHandle::Unconfigure() {
    int rc = libusb_set_configuration(handle_, -1);
    if (rc != 0) {
        return UsbError(rc) << "failed to unconfigure device";
    }
    return {};
}

Result<void> DeviceHandle::Reset() {
    int rc = libusb_reset_device(handle_);
    if (rc != 0) {
        return UsbError(rc) << "failed to reset device";
    }
    return {};
}

Result<void> DeviceHandle::ClearHalt(uint8_t endpoint) {
    int rc = libusb_clear_halt(handle_, endpoint);
    if (rc != 0) {
        return UsbError(rc) << "failed to clear halt on endpoint " << std::hex << std::showbase
                            << static_cast<unsigned>(endpoint);
    }
    return {};
}

Result<bool> DeviceHandle::KernelDriverActive(uint8_t iface) {
    int rc = libusb_kernel_driver_active(handle_, iface);
    if (rc < 0) {
        return UsbError(rc) << "failed to query kernel driver of interface "
                            << static_cast<unsigned>(iface);
    }
    return rc == 1;
}

Result<void> DeviceHandle::DetachKernelDriver(uint8_t iface) {
    int rc = libusb_detach_kernel_driver(handle_, iface);
    if (rc != 0) {
        return UsbError(rc) << "failed to detach kernel driver from interface "
                            << static_cast<unsigned>(iface);
    }
    return {};
}

Result<void> DeviceHandle::AttachKernelDriver(uint8_t iface) {
    int rc = libusb_attach_kernel_driver(handle_, iface);
    if (rc != 0) {
        return UsbError(rc) << "failed to attach kernel driver to interface "
                            << static_cast<unsigned>(iface);
    }
    return {};
}

Result<void> DeviceHandle::ClaimInterface(uint8_t iface) {
    int rc = libusb_claim_interface(handle_, iface);
    if (rc != 0) {
        return UsbError(rc) << "failed to claim interface " << static_cast<unsigned>(iface) << " ("
                            << libusb_error_name(rc) << ")";
    }
    interfaces_.set(iface);
    VLOG(DEVICE) << "claimed interface " << static_cast<unsigned>(iface);
    return {};
}

Result<void> DeviceHandle::ReleaseInterface(uint8_t iface) {
    int rc = libusb_release_interface(handle_, iface);
    if (rc != 0) {
        return UsbError(rc) << "failed to release interface " << static_cast<unsigned>(iface);
    }
    interfaces_.reset(iface);
    return {};
}

Result<void> DeviceHandle::SetAlternateSetting(uint8_t iface, uint8_t setting) {
    int rc = libusb_set_interface_alt_setting(handle_, iface, setting);
    if (rc != 0) {
        return UsbError(rc) << "failed to set alternate setting " << static_cast<unsigned>(setting)
                            << " on interface " << static_cast<unsigned>(iface);
    }
    return {};
}

Result<size_t> DeviceHandle::InterruptOrBulk(uint8_t endpoint, unsigned char* data,
                                             size_t length, std::chrono::milliseconds timeout,
                                             bool interrupt) {
    if (length > INT_MAX) {
        return Error(EINVAL) << "transfer of " << length << " bytes is too large";
    }

    int transferred = 0;
    int rc;
    if (interrupt) {
        rc = libusb_interrupt_transfer(handle_, endpoint, data, static_cast<int>(length),
                                       &transferred, timeout_millis(timeout));
    } else {
        rc = libusb_bulk_transfer(handle_, endpoint, data, static_cast<int>(length), &transferred,
                                  timeout_millis(timeout));
    }

    if (rc == 0 || (rc == LIBUSB_ERROR_INTERRUPTED && transferred > 0)) {
        return static_cast<size_t>(transferred);
    }
    return UsbError(rc) << (interrupt ? "interrupt" : "bulk") << " transfer on endpoint "
                        << std::hex << std::showbase << static_cast<unsigned>(endpoint)
                        << " failed (" << libusb_error_name(rc) << ")";
}

Result<size_t> DeviceHandle::ReadInterrupt(uint8_t endpoint, void* data, size_t length,
                                           std::chrono::milliseconds timeout) {
    if (!endpoint_is_input(endpoint)) {
        return Error(EINVAL) << "endpoint " << std::hex << std::showbase
                             << static_cast<unsigned>(endpoint) << " is not an IN endpoint";
    }
    return InterruptOrBulk(endpoint, static_cast<unsigned char*>(data), length, timeout, true);
}

Result<size_t> DeviceHandle::WriteInterrupt(uint8_t endpoint, const void* data, size_t length,
                                            std::chrono::milliseconds timeout) {
    if (endpoint_is_input(endpoint)) {
        return Error(EINVAL) << "endpoint " << std::hex << std::showbase
                             << static_cast<unsigned>(endpoint) << " is not an OUT endpoint";
    }
    return InterruptOrBulk(endpoint,
                           static_cast<unsigned char*>(const_cast<void*>(data)), length,
                           timeout, true);
}

Result<size_t> DeviceHandle::ReadBulk(uint8_t endpoint, void* data, size_t length,
                                      std::chrono::milliseconds timeout) {
    if (!endpoint_is_input(endpoint)) {
        return Error(EINVAL) << "endpoint " << std::hex << std::showbase
                             << static_cast<unsigned>(endpoint) << " is not an IN endpoint";
    }
    return InterruptOrBulk(endpoint, static_cast<unsigned char*>(data), length, timeout, false);
}

Result<size_t> DeviceHandle::WriteBulk(uint8_t endpoint, const void* data, size_t length,
                                       std::chrono::milliseconds timeout) {
    if (endpoint_is_input(endpoint)) {
        return Error(EINVAL) << "endpoint " << std::hex << std::showbase
                             << static_cast<unsigned>(endpoint) << " is not an OUT endpoint";
    }
    return InterruptOrBulk(endpoint,
                           static_cast<unsigned char*>(const_cast<void*>(data)), length,
                           timeout, false);
}

Result<size_t> DeviceHandle::ControlMessage(uint8_t request_type, uint8_t request, uint16_t value,
                                            uint16_t index, unsigned char* data, size_t length,
                                            std::chrono::milliseconds timeout) {
    if (length > UINT16_MAX) {
        return Error(EINVAL) << "control transfer of " << length << " bytes is too large";
    }

    int rc = libusb_control_transfer(handle_, request_type, request, value, index, data,
                                     static_cast<uint16_t>(length), timeout_millis(timeout));
    if (rc < 0) {
        return UsbError(rc) << "control request " << std::hex << std::showbase
                            << static_cast<unsigned>(request) << " failed ("
                            << libusb_error_name(rc) << ")";
    }
    return static_cast<size_t>(rc);
}

Result<size_t> DeviceHandle::ReadControl(uint8_t request_type, uint8_t request, uint16_t value,
                                         uint16_t index, void* data, size_t length,
                                         std::chrono::milliseconds timeout) {
    if (!endpoint_is_input(request_type)) {
        return Error(EINVAL) << "request type " << std::hex << std::showbase
                             << static_cast<unsigned>(request_type) << " is not device-to-host";
    }
    return ControlMessage(request_type, request, value, index,
                          static_cast<unsigned char*>(data), length, timeout);
}

Result<size_t> DeviceHandle::WriteControl(uint8_t request_type, uint8_t request, uint16_t value,
                                          uint16_t index, const void* data, size_t length,
                                          std::chrono::milliseconds timeout) {
    if (endpoint_is_input(request_type)) {
        return Error(EINVAL) << "request type " << std::hex << std::showbase
                             << static_cast<unsigned>(request_type) << " is not host-to-device";
    }
    return ControlMessage(request_type, request, value, index,
                          static_cast<unsigned char*>(const_cast<void*>(data)), length, timeout);
}

Result<std::vector<Language>> DeviceHandle::ReadLanguages(std::chrono::milliseconds timeout) {
    uint8_t buf[256];
    auto length = ReadControl(request_type(Direction::kIn, RequestType::kStandard,
                                           Recipient::kDevice),
                              LIBUSB_REQUEST_GET_DESCRIPTOR, LIBUSB_DT_STRING << 8, 0, buf,
                              sizeof(buf), timeout);
    if (!length) {
        return Error() << "failed to read languages: " << length.error();
    }
    return DecodeLanguages(buf, *length);
}

Result<std::string> DeviceHandle::ReadStringDescriptor(Language language, uint8_t index,
                                                       std::chrono::milliseconds timeout) {
    uint8_t buf[256];
    auto length = ReadControl(request_type(Direction::kIn, RequestType::kStandard,
                                           Recipient::kDevice),
                              LIBUSB_REQUEST_GET_DESCRIPTOR, (LIBUSB_DT_STRING << 8) | index,
                              language.lang_id, buf, sizeof(buf), timeout);
    if (!length) {
        return Error() << "failed to read string descriptor " << static_cast<unsigned>(index)
                       << ": " << length.error();
    }
    return DecodeStringDescriptor(buf, *length);
}

Result<std::string> DeviceHandle::ReadStringAt(Language language, std::optional<uint8_t> index,
                                               std::chrono::milliseconds timeout) {
    if (!index) {
        return Error(EINVAL) << "no string descriptor";
    }
    return ReadStringDescriptor(language, *index, timeout);
}

Result<std::string> DeviceHandle::ReadManufacturerString(Language language,
                                                         const DeviceDescriptor& device,
                                                         std::chrono::milliseconds timeout) {
    return ReadStringAt(language, device.manufacturer_string_index(), timeout);
}

Result<std::string> DeviceHandle::ReadProductString(Language language,
                                                    const DeviceDescriptor& device,
                                                    std::chrono::milliseconds timeout) {
    return ReadStringAt(language, device.product_string_index(), timeout);
}

Result<std::string> DeviceHandle::ReadSerialNumberString(Language language,
                                                         const DeviceDescriptor& device,
                                                         std::chrono::milliseconds timeout) {
    return ReadStringAt(language, device.serial_number_string_index(), timeout);
}

Result<std::string> DeviceHandle::ReadConfigurationString(Language language,
                                                          const ConfigDescriptor& configuration,
                                                          std::chrono::milliseconds timeout) {
    return ReadStringAt(language, configuration.description_string_index(), timeout);
}

Result<std::string> DeviceHandle::ReadInterfaceString(Language language,
                                                      const InterfaceDescriptor& interface,
                                                      std::chrono::milliseconds timeout) {
    return ReadStringAt(language, interface.description_string_index(), timeout);
}

Result<TransferHandle> DeviceHandle::RetainContext(Result<TransferHandle> submitted) {
    if (!submitted) {
        return submitted;
    }
    return TransferHandle(&context_->io(), submitted->id(), context_);
}

Result<TransferHandle> DeviceHandle::Control(uint8_t request_type, uint8_t request,
                                             uint16_t value, uint16_t index, uint16_t length,
                                             std::vector<uint8_t> buffer,
                                             std::chrono::milliseconds timeout,
                                             TransferCallback callback) {
    return RetainContext(context_->io().Control(handle_, request_type, request, value, index,
                                                length, std::move(buffer), timeout,
                                                std::move(callback)));
}

Result<TransferHandle> DeviceHandle::Bulk(uint8_t endpoint, std::vector<uint8_t> buffer,
                                          std::chrono::milliseconds timeout,
                                          TransferCallback callback) {
    return RetainContext(context_->io().Bulk(handle_, endpoint, std::move(buffer), timeout,
                                             std::move(callback)));
}

Result<TransferHandle> DeviceHandle::Interrupt(uint8_t endpoint, std::vector<uint8_t> buffer,
                                               std::chrono::milliseconds timeout,
                                               TransferCallback callback) {
    return RetainContext(context_->io().Interrupt(handle_, endpoint, std::move(buffer), timeout,
                                                  std::move(callback)));
}

Result<TransferHandle> DeviceHandle::Isochronous(uint8_t endpoint, int num_iso_packets,
                                                 std::vector<uint8_t> buffer,
                                                 std::chrono::milliseconds timeout,
                                                 TransferCallback callback) {
    return RetainContext(context_->io().Isochronous(handle_, endpoint, num_iso_packets,
                                                    std::move(buffer), timeout,
                                                    std::move(callback)));
}

Result<TransferHandle> DeviceHandle::BulkStream(uint8_t endpoint, uint32_t stream_id,
                                                std::vector<uint8_t> buffer,
                                                std::chrono::milliseconds timeout,
                                                TransferCallback callback) {
    return RetainContext(context_->io().BulkStream(handle_, endpoint, stream_id,
                                                   std::move(buffer), timeout,
                                                   std::move(callback)));
}

}  // namespace usbxfer
