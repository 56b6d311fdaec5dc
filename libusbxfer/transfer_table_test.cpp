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

#include "usbxfer/transfer_table.h"

#include <errno.h>

#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "fake_usb_backend.h"

using namespace usbxfer;

TEST(TransferTable, allocate_returns_distinct_ids) {
    TransferTable table;
    std::set<TransferId> ids;
    for (int i = 0; i < 16; ++i) {
        auto allocation = table.Allocate(nullptr, nullptr, std::vector<uint8_t>(8));
        ASSERT_TRUE(ids.insert(allocation.id).second) << "duplicate id " << allocation.id;
    }
    ASSERT_EQ(16u, table.size());
}

TEST(TransferTable, allocate_after_remove_stays_distinct) {
    TransferTable table;
    auto first = table.Allocate(nullptr, nullptr, std::vector<uint8_t>(8));
    auto second = table.Allocate(nullptr, nullptr, std::vector<uint8_t>(8));
    ASSERT_NE(nullptr, table.Remove(first.id));

    auto third = table.Allocate(nullptr, nullptr, std::vector<uint8_t>(8));
    ASSERT_NE(second.id, third.id);
    ASSERT_TRUE(table.Contains(second.id));
    ASSERT_TRUE(table.Contains(third.id));
    ASSERT_EQ(2u, table.size());
}

TEST(TransferTable, allocation_points_at_record_buffer) {
    TransferTable table;
    std::vector<uint8_t> buffer = {1, 2, 3, 4};
    auto allocation = table.Allocate(nullptr, nullptr, buffer);

    TransferRecord* record = table.Find(allocation.id);
    ASSERT_EQ(allocation.record, record);
    ASSERT_EQ(allocation.id, record->id);
    ASSERT_TRUE(record->buffer.has_value());
    ASSERT_EQ(buffer, *record->buffer);
    ASSERT_EQ(record->buffer->data(), allocation.data);
    ASSERT_EQ(4u, allocation.length);
    ASSERT_EQ(nullptr, record->transfer);
}

TEST(TransferTable, mark_submitted_unknown_id) {
    TransferTable table;
    auto result = table.MarkSubmitted(42, nullptr);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(ENOENT, result.error().code());
}

TEST(TransferTable, cancel_unknown_id_does_not_reach_libusb) {
    FakeUsbBackend backend;
    TransferTable table;
    auto result = table.Cancel(7, &backend);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(ENOENT, result.error().code());
    ASSERT_EQ(0, backend.cancel_calls());
}

TEST(TransferTable, cancel_before_submission) {
    FakeUsbBackend backend;
    TransferTable table;
    auto allocation = table.Allocate(nullptr, nullptr, std::vector<uint8_t>(8));
    auto result = table.Cancel(allocation.id, &backend);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EINVAL, result.error().code());
    ASSERT_EQ(0, backend.cancel_calls());
}

TEST(TransferTable, cancel_submitted) {
    FakeUsbBackend backend;
    TransferTable table;
    auto allocation = table.Allocate(nullptr, nullptr, std::vector<uint8_t>(8));
    libusb_transfer* transfer = backend.AllocTransfer(0);
    ASSERT_TRUE(table.MarkSubmitted(allocation.id, transfer).has_value());
    ASSERT_EQ(transfer, table.Find(allocation.id)->transfer);
    ASSERT_EQ(0, backend.SubmitTransfer(transfer));

    ASSERT_TRUE(table.Cancel(allocation.id, &backend).has_value());
    ASSERT_EQ(1, backend.cancel_calls());
    // Cancellation only takes effect once libusb completes the transfer.
    ASSERT_TRUE(table.Contains(allocation.id));

    backend.FailNextCancel(LIBUSB_ERROR_NO_DEVICE);
    auto result = table.Cancel(allocation.id, &backend);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(ENODEV, result.error().code());
}

TEST(TransferTable, remove_all) {
    TransferTable table;
    table.Allocate(nullptr, nullptr, std::vector<uint8_t>(1));
    table.Allocate(nullptr, nullptr, std::vector<uint8_t>(2));
    auto records = table.RemoveAll();
    ASSERT_EQ(2u, records.size());
    ASSERT_TRUE(table.empty());
    ASSERT_EQ(nullptr, table.Remove(records[0]->id));
}
