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

#include "usbxfer/descriptors.h"

#include <errno.h>

namespace usbxfer {

static std::optional<uint8_t> string_index(uint8_t index) {
    if (index == 0) {
        return std::nullopt;
    }
    return index;
}

Speed DecodeSpeed(int libusb_speed) {
    switch (libusb_speed) {
        case LIBUSB_SPEED_LOW:
            return Speed::kLow;
        case LIBUSB_SPEED_FULL:
            return Speed::kFull;
        case LIBUSB_SPEED_HIGH:
            return Speed::kHigh;
        case LIBUSB_SPEED_SUPER:
            return Speed::kSuper;
        case LIBUSB_SPEED_SUPER_PLUS:
            return Speed::kSuperPlus;
        default:
            return Speed::kUnknown;
    }
}

const char* SpeedName(Speed speed) {
    switch (speed) {
        case Speed::kLow:
            return "1.5 Mbit/s";
        case Speed::kFull:
            return "12 Mbit/s";
        case Speed::kHigh:
            return "480 Mbit/s";
        case Speed::kSuper:
            return "5 Gbit/s";
        case Speed::kSuperPlus:
            return "10 Gbit/s";
        case Speed::kUnknown:
            break;
    }
    return "unknown speed";
}

uint8_t request_type(Direction direction, RequestType type, Recipient recipient) {
    uint8_t value = 0;
    if (direction == Direction::kIn) value |= LIBUSB_ENDPOINT_IN;

    switch (type) {
        case RequestType::kStandard:
            value |= LIBUSB_REQUEST_TYPE_STANDARD;
            break;
        case RequestType::kClass:
            value |= LIBUSB_REQUEST_TYPE_CLASS;
            break;
        case RequestType::kVendor:
            value |= LIBUSB_REQUEST_TYPE_VENDOR;
            break;
        case RequestType::kReserved:
            value |= LIBUSB_REQUEST_TYPE_RESERVED;
            break;
    }

    switch (recipient) {
        case Recipient::kDevice:
            value |= LIBUSB_RECIPIENT_DEVICE;
            break;
        case Recipient::kInterface:
            value |= LIBUSB_RECIPIENT_INTERFACE;
            break;
        case Recipient::kEndpoint:
            value |= LIBUSB_RECIPIENT_ENDPOINT;
            break;
        case Recipient::kOther:
            value |= LIBUSB_RECIPIENT_OTHER;
            break;
    }
    return value;
}

Version Version::FromBcd(uint16_t bcd) {
    Version version;
    version.major = static_cast<uint8_t>(((bcd >> 12) & 0x0f) * 10 + ((bcd >> 8) & 0x0f));
    version.minor = (bcd >> 4) & 0x0f;
    version.sub_minor = bcd & 0x0f;
    return version;
}

std::ostream& operator<<(std::ostream& os, const Version& version) {
    return os << static_cast<unsigned>(version.major) << "." << static_cast<unsigned>(version.minor)
              << "." << static_cast<unsigned>(version.sub_minor);
}

std::optional<uint8_t> DeviceDescriptor::manufacturer_string_index() const {
    return string_index(descriptor_.iManufacturer);
}

std::optional<uint8_t> DeviceDescriptor::product_string_index() const {
    return string_index(descriptor_.iProduct);
}

std::optional<uint8_t> DeviceDescriptor::serial_number_string_index() const {
    return string_index(descriptor_.iSerialNumber);
}

Direction EndpointDescriptor::direction() const {
    if ((descriptor_->bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN) {
        return Direction::kIn;
    }
    return Direction::kOut;
}

TransferType EndpointDescriptor::transfer_type() const {
    switch (descriptor_->bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) {
        case LIBUSB_TRANSFER_TYPE_CONTROL:
            return TransferType::kControl;
        case LIBUSB_TRANSFER_TYPE_ISOCHRONOUS:
            return TransferType::kIsochronous;
        case LIBUSB_TRANSFER_TYPE_BULK:
            return TransferType::kBulk;
        default:
            return TransferType::kInterrupt;
    }
}

SyncType EndpointDescriptor::sync_type() const {
    switch ((descriptor_->bmAttributes & LIBUSB_ISO_SYNC_TYPE_MASK) >> 2) {
        case LIBUSB_ISO_SYNC_TYPE_NONE:
            return SyncType::kNoSync;
        case LIBUSB_ISO_SYNC_TYPE_ASYNC:
            return SyncType::kAsynchronous;
        case LIBUSB_ISO_SYNC_TYPE_ADAPTIVE:
            return SyncType::kAdaptive;
        default:
            return SyncType::kSynchronous;
    }
}

UsageType EndpointDescriptor::usage_type() const {
    switch ((descriptor_->bmAttributes & LIBUSB_ISO_USAGE_TYPE_MASK) >> 4) {
        case LIBUSB_ISO_USAGE_TYPE_DATA:
            return UsageType::kData;
        case LIBUSB_ISO_USAGE_TYPE_FEEDBACK:
            return UsageType::kFeedback;
        case LIBUSB_ISO_USAGE_TYPE_IMPLICIT:
            return UsageType::kFeedbackData;
        default:
            return UsageType::kReserved;
    }
}

std::optional<uint8_t> InterfaceDescriptor::description_string_index() const {
    return string_index(descriptor_->iInterface);
}

std::vector<EndpointDescriptor> InterfaceDescriptor::endpoint_descriptors() const {
    std::vector<EndpointDescriptor> result;
    for (uint8_t i = 0; i < descriptor_->bNumEndpoints; ++i) {
        result.emplace_back(&descriptor_->endpoint[i]);
    }
    return result;
}

uint8_t Interface::number() const {
    if (interface_->num_altsetting <= 0) {
        return 0;
    }
    return interface_->altsetting[0].bInterfaceNumber;
}

std::vector<InterfaceDescriptor> Interface::descriptors() const {
    std::vector<InterfaceDescriptor> result;
    for (int i = 0; i < interface_->num_altsetting; ++i) {
        result.emplace_back(&interface_->altsetting[i]);
    }
    return result;
}

std::optional<uint8_t> ConfigDescriptor::description_string_index() const {
    return string_index(descriptor_->iConfiguration);
}

std::vector<Interface> ConfigDescriptor::interfaces() const {
    std::vector<Interface> result;
    for (uint8_t i = 0; i < descriptor_->bNumInterfaces; ++i) {
        result.emplace_back(&descriptor_->interface[i]);
    }
    return result;
}

std::vector<Language> DecodeLanguages(const uint8_t* data, size_t length) {
    std::vector<Language> result;
    // Skip bLength and bDescriptorType.
    for (size_t i = 2; i + 1 < length; i += 2) {
        result.push_back({static_cast<uint16_t>(data[i] | (data[i + 1] << 8))});
    }
    return result;
}

static void append_utf8(std::string* out, uint32_t code_point) {
    if (code_point < 0x80) {
        out->push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out->push_back(static_cast<char>(0xc0 | (code_point >> 6)));
        out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
    } else if (code_point < 0x10000) {
        out->push_back(static_cast<char>(0xe0 | (code_point >> 12)));
        out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
    } else {
        out->push_back(static_cast<char>(0xf0 | (code_point >> 18)));
        out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
    }
}

Result<std::string> DecodeStringDescriptor(const uint8_t* data, size_t length) {
    std::vector<uint16_t> units;
    for (size_t i = 2; i + 1 < length; i += 2) {
        units.push_back(static_cast<uint16_t>(data[i] | (data[i + 1] << 8)));
    }

    std::string result;
    for (size_t i = 0; i < units.size(); ++i) {
        uint32_t unit = units[i];
        if (unit >= 0xd800 && unit < 0xdc00) {
            if (i + 1 == units.size() || units[i + 1] < 0xdc00 || units[i + 1] >= 0xe000) {
                return Error(EILSEQ) << "unpaired high surrogate at code unit " << i;
            }
            uint32_t low = units[++i];
            append_utf8(&result, 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00));
        } else if (unit >= 0xdc00 && unit < 0xe000) {
            return Error(EILSEQ) << "unpaired low surrogate at code unit " << i;
        } else {
            append_utf8(&result, unit);
        }
    }
    return result;
}

}  // namespace usbxfer
