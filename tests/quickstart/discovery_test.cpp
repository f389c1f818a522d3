// [TITLE]
// Discovering Radios
// [/TITLE]
//
// This test demonstrates listening for discovery announcements and
// reading the decoded radio record.

#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <flexdisco.hpp>
#include <flexdisco/flexdisco_io.hpp>

// Helper: Create an announcement datagram as a radio would broadcast it
// In real code, this would arrive from the network on port 4992
static std::vector<uint8_t> create_test_announcement() {
    std::string text = "discovery_protocol_version=3.0.0.2 model=FLEX-6600 "
                       "serial=1234-5678-9012-3456 version=3.4.23.11090 nickname=Shack "
                       "callsign=N0CALL ip=192.168.1.50 port=4992 status=In_Use "
                       "inuse_ip=192.168.1.20 inuse_host=shack-pc max_licensed_version=v3 "
                       "radio_license_id=00-1C-2D-05-1A-2B requires_additional_license=0 "
                       "fpc_mac= wan_connected=1";

    std::vector<uint8_t> datagram(flexdisco::announcement_header_bytes, 0x00);
    datagram.insert(datagram.end(), text.begin(), text.end());
    return datagram;
}

// [EXAMPLE]
// Decoding an Announcement
// [/EXAMPLE]

// [DESCRIPTION]
// `decode_announcement()` skips the 28-byte header and splits the rest into
// key=value tokens. Known keys become accessors returning `std::optional`;
// keys outside the schema are kept in `unrecognized_fields()` so new
// firmware never breaks decoding.
// [/DESCRIPTION]

TEST(QuickstartSnippet, DecodeAnnouncement) {
    auto datagram = create_test_announcement();

    // [SNIPPET]
    auto result = flexdisco::decode_announcement(datagram);
    if (!result) {
        FAIL() << result.error().message();
    }

    const auto& radio = *result;
    std::string model = radio.model().value_or("unknown"); // "FLEX-6600"
    bool in_use = !flexdisco::is_available(radio);          // status=In_Use
    auto port = flexdisco::control_port(radio);             // 4992 as uint16_t

    for (const auto& extra : radio.unrecognized_fields()) {
        // extra.key == "wan_connected", extra.value == "1"
        (void)extra;
    }
    // [/SNIPPET]

    EXPECT_EQ(model, "FLEX-6600");
    EXPECT_TRUE(in_use);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 4992);
    EXPECT_EQ(radio.inuse_host(), "shack-pc");
    EXPECT_EQ(radio.fpc_mac(), "");
    EXPECT_EQ(radio.recognized_field_count(), flexdisco::announcement_field_count);
    ASSERT_EQ(radio.unrecognized_fields().size(), 1u);
    EXPECT_EQ(radio.unrecognized_fields()[0].key, "wan_connected");
}

// [EXAMPLE]
// Polling with a Listener
// [/EXAMPLE]

// [DESCRIPTION]
// `DiscoveryListener` binds the discovery port and returns one announcement
// per `receive_one()` call. A timeout is not an error: the result holds
// `std::nullopt`. Malformed datagrams come back as a `ListenerError` and the
// listener keeps working.
// [/DESCRIPTION]

TEST(QuickstartSnippet, PollListener) {
    // Bind loopback on a free port instead of 0.0.0.0:4992 for the test
    flexdisco::DiscoveryListener listener("127.0.0.1", 0, std::chrono::milliseconds(200));
    flexdisco::AnnouncementBroadcaster radio("127.0.0.1", listener.socket_port());
    ASSERT_TRUE(radio.send(create_test_announcement()));

    std::vector<std::string> found;

    // [SNIPPET]
    for (int poll = 0; poll < 2; ++poll) {
        auto result = listener.receive_one();
        if (!result) {
            // Bad datagram or socket error; try again next poll
            continue;
        }
        if (!*result) {
            // Nothing arrived within the timeout
            continue;
        }
        found.push_back((*result)->serial().value_or("?"));
    }
    // [/SNIPPET]

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "1234-5678-9012-3456");
    EXPECT_EQ(listener.timeouts(), 1u);
}
