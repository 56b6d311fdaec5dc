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
#include <string.h>

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace usbxfer;

TEST(Descriptors, request_type) {
    ASSERT_EQ(0x80, request_type(Direction::kIn, RequestType::kStandard, Recipient::kDevice));
    ASSERT_EQ(0x00, request_type(Direction::kOut, RequestType::kStandard, Recipient::kDevice));
    ASSERT_EQ(0xc1, request_type(Direction::kIn, RequestType::kVendor, Recipient::kInterface));
    ASSERT_EQ(0x22, request_type(Direction::kOut, RequestType::kClass, Recipient::kEndpoint));
    ASSERT_EQ(0x63, request_type(Direction::kOut, RequestType::kReserved, Recipient::kOther));
}

TEST(Descriptors, version_from_bcd) {
    Version usb2 = Version::FromBcd(0x0200);
    ASSERT_EQ((Version{2, 0, 0}), usb2);

    Version version = Version::FromBcd(0x1234);
    ASSERT_EQ((Version{12, 3, 4}), version);

    std::stringstream ss;
    ss << version;
    ASSERT_EQ("12.3.4", ss.str());
}

TEST(Descriptors, device_descriptor) {
    libusb_device_descriptor raw;
    memset(&raw, 0, sizeof(raw));
    raw.bcdUSB = 0x0210;
    raw.idVendor = 0x18d1;
    raw.idProduct = 0x4ee7;
    raw.iManufacturer = 1;
    raw.iProduct = 2;
    raw.iSerialNumber = 0;
    raw.bNumConfigurations = 1;

    DeviceDescriptor descriptor(raw);
    ASSERT_EQ((Version{2, 1, 0}), descriptor.usb_version());
    ASSERT_EQ(0x18d1, descriptor.vendor_id());
    ASSERT_EQ(0x4ee7, descriptor.product_id());
    ASSERT_EQ(1, descriptor.manufacturer_string_index().value_or(0));
    ASSERT_EQ(2, descriptor.product_string_index().value_or(0));
    ASSERT_FALSE(descriptor.serial_number_string_index().has_value());
    ASSERT_EQ(1, descriptor.num_configurations());
}

TEST(Descriptors, endpoint_descriptor) {
    libusb_endpoint_descriptor raw;
    memset(&raw, 0, sizeof(raw));
    raw.bEndpointAddress = 0x83;
    raw.bmAttributes = LIBUSB_TRANSFER_TYPE_ISOCHRONOUS | (LIBUSB_ISO_SYNC_TYPE_ADAPTIVE << 2) |
                       (LIBUSB_ISO_USAGE_TYPE_FEEDBACK << 4);
    raw.wMaxPacketSize = 512;

    EndpointDescriptor endpoint(&raw);
    ASSERT_EQ(0x83, endpoint.address());
    ASSERT_EQ(3, endpoint.number());
    ASSERT_EQ(Direction::kIn, endpoint.direction());
    ASSERT_EQ(TransferType::kIsochronous, endpoint.transfer_type());
    ASSERT_EQ(SyncType::kAdaptive, endpoint.sync_type());
    ASSERT_EQ(UsageType::kFeedback, endpoint.usage_type());
    ASSERT_EQ(512, endpoint.max_packet_size());

    raw.bEndpointAddress = 0x02;
    raw.bmAttributes = LIBUSB_TRANSFER_TYPE_BULK;
    ASSERT_EQ(Direction::kOut, endpoint.direction());
    ASSERT_EQ(TransferType::kBulk, endpoint.transfer_type());
}

TEST(Descriptors, interface_descriptor) {
    libusb_endpoint_descriptor endpoints[2];
    memset(endpoints, 0, sizeof(endpoints));
    endpoints[0].bEndpointAddress = 0x81;
    endpoints[1].bEndpointAddress = 0x01;

    libusb_interface_descriptor settings[2];
    memset(settings, 0, sizeof(settings));
    settings[0].bInterfaceNumber = 4;
    settings[0].bNumEndpoints = 2;
    settings[0].endpoint = endpoints;
    settings[0].iInterface = 5;
    settings[1].bInterfaceNumber = 4;
    settings[1].bAlternateSetting = 1;

    libusb_interface raw;
    raw.altsetting = settings;
    raw.num_altsetting = 2;

    Interface interface(&raw);
    ASSERT_EQ(4, interface.number());
    auto descriptors = interface.descriptors();
    ASSERT_EQ(2u, descriptors.size());
    ASSERT_EQ(5, descriptors[0].description_string_index().value_or(0));
    ASSERT_FALSE(descriptors[1].description_string_index().has_value());
    ASSERT_EQ(1, descriptors[1].setting_number());

    auto endpoint_descriptors = descriptors[0].endpoint_descriptors();
    ASSERT_EQ(2u, endpoint_descriptors.size());
    ASSERT_EQ(Direction::kIn, endpoint_descriptors[0].direction());
    ASSERT_EQ(Direction::kOut, endpoint_descriptors[1].direction());
}

TEST(Descriptors, speed) {
    ASSERT_EQ(Speed::kHigh, DecodeSpeed(LIBUSB_SPEED_HIGH));
    ASSERT_EQ(Speed::kUnknown, DecodeSpeed(LIBUSB_SPEED_UNKNOWN));
    ASSERT_STREQ("480 Mbit/s", SpeedName(Speed::kHigh));
}

TEST(Descriptors, languages) {
    const uint8_t data[] = {6, LIBUSB_DT_STRING, 0x09, 0x04, 0x07, 0x08};
    auto languages = DecodeLanguages(data, sizeof(data));
    ASSERT_EQ(2u, languages.size());
    ASSERT_EQ(0x0409, languages[0].lang_id);
    ASSERT_EQ(0x09, languages[0].primary_language());
    ASSERT_EQ(0x01, languages[0].sub_language());
    ASSERT_EQ(0x0807, languages[1].lang_id);

    // A trailing odd byte is ignored.
    auto truncated = DecodeLanguages(data, sizeof(data) - 1);
    ASSERT_EQ(1u, truncated.size());
}

TEST(Descriptors, string_descriptor) {
    // "Azé€\U0001f600"
    const uint8_t data[] = {14,   LIBUSB_DT_STRING, 'A',  0,    'z',  0,    0xe9,
                            0x00, 0xac,             0x20, 0x3d, 0xd8, 0x00, 0xde};
    auto result = DecodeStringDescriptor(data, sizeof(data));
    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_EQ("Az\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80", *result);
}

TEST(Descriptors, string_descriptor_empty) {
    const uint8_t data[] = {2, LIBUSB_DT_STRING};
    auto result = DecodeStringDescriptor(data, sizeof(data));
    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_EQ("", *result);
}

TEST(Descriptors, string_descriptor_unpaired_surrogate) {
    const uint8_t high[] = {6, LIBUSB_DT_STRING, 0x3d, 0xd8, 'A', 0};
    auto result = DecodeStringDescriptor(high, sizeof(high));
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EILSEQ, result.error().code());

    const uint8_t low[] = {4, LIBUSB_DT_STRING, 0x00, 0xde};
    result = DecodeStringDescriptor(low, sizeof(low));
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EILSEQ, result.error().code());
}
