#pragma once

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <flexdisco.hpp>

using flexdisco::AnnouncementField;
using flexdisco::DecodeErrorCode;
using flexdisco::DeviceAnnouncement;
using flexdisco::DiagnosticKind;

// Helper: Build a datagram from announcement text behind a header
// In real code, this would come from a radio on the network
inline std::vector<uint8_t> make_datagram(std::string_view text,
                                          size_t header_bytes = flexdisco::announcement_header_bytes,
                                          uint8_t header_fill = 0x00) {
    std::vector<uint8_t> datagram(header_bytes, header_fill);
    datagram.insert(datagram.end(), text.begin(), text.end());
    return datagram;
}

// Test fixture for decoder tests
class AnnouncementDecoderTest : public ::testing::Test {
protected:
    static flexdisco::DecodeResult<DeviceAnnouncement> decode(std::string_view text) {
        auto datagram = make_datagram(text);
        return flexdisco::decode_announcement(datagram);
    }

    static void expect_only(const DeviceAnnouncement& ann,
                            std::initializer_list<AnnouncementField> present) {
        for (auto field : flexdisco::all_announcement_fields) {
            bool expected_present =
                std::find(present.begin(), present.end(), field) != present.end();
            EXPECT_EQ(ann.has(field), expected_present) << flexdisco::field_name(field);
        }
    }
};
