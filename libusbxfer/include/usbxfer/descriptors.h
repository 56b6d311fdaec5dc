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

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <libusb.h>

#include "usbxfer/error.h"

namespace usbxfer {

enum class Speed {
    kUnknown,
    kLow,
    kFull,
    kHigh,
    kSuper,
    kSuperPlus,
};

enum class TransferType {
    kControl,
    kIsochronous,
    kBulk,
    kInterrupt,
};

enum class SyncType {
    kNoSync,
    kAsynchronous,
    kAdaptive,
    kSynchronous,
};

enum class UsageType {
    kData,
    kFeedback,
    kFeedbackData,
    kReserved,
};

enum class Direction {
    kIn,
    kOut,
};

enum class RequestType {
    kStandard,
    kClass,
    kVendor,
    kReserved,
};

enum class Recipient {
    kDevice,
    kInterface,
    kEndpoint,
    kOther,
};

Speed DecodeSpeed(int libusb_speed);
const char* SpeedName(Speed speed);

// Builds the bmRequestType field of a control request.
uint8_t request_type(Direction direction, RequestType type, Recipient recipient);

// A version number decoded from a binary-coded decimal field, such as bcdUSB.
struct Version {
    uint8_t major;
    uint8_t minor;
    uint8_t sub_minor;

    static Version FromBcd(uint16_t bcd);
};

inline bool operator==(const Version& lhs, const Version& rhs) {
    return lhs.major == rhs.major && lhs.minor == rhs.minor && lhs.sub_minor == rhs.sub_minor;
}

std::ostream& operator<<(std::ostream& os, const Version& version);

class DeviceDescriptor {
  public:
    explicit DeviceDescriptor(const libusb_device_descriptor& descriptor)
        : descriptor_(descriptor) {}

    Version usb_version() const { return Version::FromBcd(descriptor_.bcdUSB); }
    Version device_version() const { return Version::FromBcd(descriptor_.bcdDevice); }

    uint8_t class_code() const { return descriptor_.bDeviceClass; }
    uint8_t sub_class_code() const { return descriptor_.bDeviceSubClass; }
    uint8_t protocol_code() const { return descriptor_.bDeviceProtocol; }

    uint16_t vendor_id() const { return descriptor_.idVendor; }
    uint16_t product_id() const { return descriptor_.idProduct; }
    uint8_t max_packet_size() const { return descriptor_.bMaxPacketSize0; }

    std::optional<uint8_t> manufacturer_string_index() const;
    std::optional<uint8_t> product_string_index() const;
    std::optional<uint8_t> serial_number_string_index() const;

    uint8_t num_configurations() const { return descriptor_.bNumConfigurations; }

  private:
    libusb_device_descriptor descriptor_;
};

// Views into a ConfigDescriptor's allocation; they must not outlive it.
class EndpointDescriptor {
  public:
    explicit EndpointDescriptor(const libusb_endpoint_descriptor* descriptor)
        : descriptor_(descriptor) {}

    uint8_t address() const { return descriptor_->bEndpointAddress; }
    uint8_t number() const { return descriptor_->bEndpointAddress & 0x0f; }
    Direction direction() const;
    TransferType transfer_type() const;
    // Only meaningful for isochronous endpoints.
    SyncType sync_type() const;
    UsageType usage_type() const;
    uint16_t max_packet_size() const { return descriptor_->wMaxPacketSize; }
    uint8_t interval() const { return descriptor_->bInterval; }

  private:
    const libusb_endpoint_descriptor* descriptor_;
};

class InterfaceDescriptor {
  public:
    explicit InterfaceDescriptor(const libusb_interface_descriptor* descriptor)
        : descriptor_(descriptor) {}

    uint8_t interface_number() const { return descriptor_->bInterfaceNumber; }
    uint8_t setting_number() const { return descriptor_->bAlternateSetting; }
    uint8_t class_code() const { return descriptor_->bInterfaceClass; }
    uint8_t sub_class_code() const { return descriptor_->bInterfaceSubClass; }
    uint8_t protocol_code() const { return descriptor_->bInterfaceProtocol; }
    std::optional<uint8_t> description_string_index() const;
    uint8_t num_endpoints() const { return descriptor_->bNumEndpoints; }
    std::vector<EndpointDescriptor> endpoint_descriptors() const;

  private:
    const libusb_interface_descriptor* descriptor_;
};

// An interface and its alternate settings.
class Interface {
  public:
    explicit Interface(const libusb_interface* interface) : interface_(interface) {}

    // The interface number of the first alternate setting.
    uint8_t number() const;
    std::vector<InterfaceDescriptor> descriptors() const;

  private:
    const libusb_interface* interface_;
};

struct ConfigDescriptorDeleter {
    void operator()(libusb_config_descriptor* desc) { libusb_free_config_descriptor(desc); }
};

using unique_config_descriptor = std::unique_ptr<libusb_config_descriptor, ConfigDescriptorDeleter>;

class ConfigDescriptor {
  public:
    explicit ConfigDescriptor(unique_config_descriptor descriptor)
        : descriptor_(std::move(descriptor)) {}

    uint8_t number() const { return descriptor_->bConfigurationValue; }
    // In milliamps.
    uint16_t max_power() const { return static_cast<uint16_t>(descriptor_->MaxPower) * 2; }
    bool self_powered() const { return (descriptor_->bmAttributes & 0x40) != 0; }
    bool remote_wakeup() const { return (descriptor_->bmAttributes & 0x20) != 0; }
    std::optional<uint8_t> description_string_index() const;
    uint8_t num_interfaces() const { return descriptor_->bNumInterfaces; }
    std::vector<Interface> interfaces() const;

  private:
    unique_config_descriptor descriptor_;
};

// A language of the string descriptors, as a LANGID.
struct Language {
    uint16_t lang_id;

    uint16_t primary_language() const { return lang_id & 0x03ff; }
    uint16_t sub_language() const { return lang_id >> 10; }
};

// Decodes the LANGID array of string descriptor zero.
std::vector<Language> DecodeLanguages(const uint8_t* data, size_t length);

// Decodes a UTF-16LE string descriptor, including its two byte header, into UTF-8.
Result<std::string> DecodeStringDescriptor(const uint8_t* data, size_t length);

}  // namespace usbxfer
