// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <cerrno>
#include <gtest/gtest.h>
#include <flexdisco/flexdisco_io.hpp>

using namespace flexdisco::utils::netio;

using flexdisco::AnnouncementField;
using flexdisco::DeviceAnnouncement;

// Test fixture for announcement broadcaster tests
class AnnouncementBroadcasterTest : public ::testing::Test {
protected:
    static constexpr const char* loopback = "127.0.0.1";

    void SetUp() override {
        listener_ = std::make_unique<DiscoveryListener>(loopback, 0,
                                                        std::chrono::milliseconds(200));
    }

    uint16_t port() const { return listener_->socket_port(); }

    std::unique_ptr<DiscoveryListener> listener_;
};

// =============================================================================
// Basic Functionality Tests
// =============================================================================

TEST_F(AnnouncementBroadcasterTest, CreateBoundBroadcaster) {
    EXPECT_NO_THROW({
        AnnouncementBroadcaster radio(loopback, port());
        EXPECT_EQ(radio.announcements_sent(), 0u);
        EXPECT_EQ(radio.bytes_sent(), 0u);
        EXPECT_TRUE(radio.transport_status().ok());
    });
}

TEST_F(AnnouncementBroadcasterTest, CreateUnboundBroadcaster) {
    EXPECT_NO_THROW({
        AnnouncementBroadcaster radio(0);
        EXPECT_EQ(radio.announcements_sent(), 0u);
        EXPECT_FALSE(radio.has_peer());
    });
}

TEST_F(AnnouncementBroadcasterTest, BoundModeHasPeer) {
    AnnouncementBroadcaster radio(loopback, port());
    EXPECT_TRUE(radio.has_peer());
    EXPECT_EQ(radio.mtu(), AnnouncementBroadcaster::default_mtu);
}

TEST_F(AnnouncementBroadcasterTest, CountsSentAnnouncements) {
    AnnouncementBroadcaster radio(loopback, port());
    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::model, "FLEX-6600").build();

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(radio.send(ann));
    }
    EXPECT_EQ(radio.announcements_sent(), 3u);
    EXPECT_EQ(radio.bytes_sent(),
              3 * (flexdisco::announcement_header_bytes + std::string("model=FLEX-6600").size()));

    for (int i = 0; i < 3; ++i) {
        auto result = listener_->receive_one();
        ASSERT_TRUE(result.has_value()) << flexdisco::utils::error_message(result.error());
        ASSERT_TRUE(result->has_value());
        EXPECT_EQ((*result)->model(), "FLEX-6600");
    }
}

// =============================================================================
// Unbound Mode Tests
// =============================================================================

TEST_F(AnnouncementBroadcasterTest, UnboundModeRequiresDestination) {
    AnnouncementBroadcaster radio(0);
    std::vector<uint8_t> bytes(flexdisco::announcement_header_bytes, 0x00);

    EXPECT_FALSE(radio.send(bytes));
    EXPECT_EQ(radio.transport_status().errno_value, ENOTCONN);
    EXPECT_EQ(radio.announcements_sent(), 0u);
}

TEST_F(AnnouncementBroadcasterTest, UnboundModeSendsToDestination) {
    AnnouncementBroadcaster radio(0);

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port());
    inet_pton(AF_INET, loopback, &dest.sin_addr);

    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::serial, "77").build();
    ASSERT_TRUE(radio.send(ann, dest));

    auto result = listener_->receive_one();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->serial(), "77");
}

// =============================================================================
// MTU Enforcement Tests
// =============================================================================

TEST_F(AnnouncementBroadcasterTest, EnforceMTU) {
    AnnouncementBroadcaster radio(loopback, port());
    radio.set_mtu(64);

    auto ann = DeviceAnnouncement::Builder{}
                   .set(AnnouncementField::nickname, std::string(100, 'n'))
                   .build();

    EXPECT_FALSE(radio.send(ann));
    EXPECT_EQ(radio.transport_status().errno_value, EMSGSIZE);
    EXPECT_EQ(radio.transport_status().state, UDPTransportStatus::State::socket_error);
}

TEST_F(AnnouncementBroadcasterTest, UnencodableAnnouncementIsRejected) {
    AnnouncementBroadcaster radio(loopback, port());
    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::nickname, "two words").build();

    EXPECT_FALSE(radio.send(ann));
    EXPECT_EQ(radio.transport_status().errno_value, EINVAL);
    EXPECT_EQ(radio.announcements_sent(), 0u);
}

TEST_F(AnnouncementBroadcasterTest, SendTimeoutCanBeSet) {
    AnnouncementBroadcaster radio(loopback, port());
    EXPECT_TRUE(radio.try_set_send_timeout(100));
}

// =============================================================================
// Move Semantics Tests
// =============================================================================

TEST_F(AnnouncementBroadcasterTest, MoveKeepsCounters) {
    AnnouncementBroadcaster radio(loopback, port());
    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::model, "FLEX-6300").build();
    ASSERT_TRUE(radio.send(ann));

    AnnouncementBroadcaster moved(std::move(radio));
    EXPECT_EQ(moved.announcements_sent(), 1u);
    EXPECT_EQ(radio.announcements_sent(), 0u);
    EXPECT_TRUE(moved.send(ann));
    EXPECT_EQ(moved.announcements_sent(), 2u);
    EXPECT_FALSE(radio.has_peer());
}

TEST_F(AnnouncementBroadcasterTest, MoveAssignmentReplacesPeer) {
    AnnouncementBroadcaster unbound(0);
    AnnouncementBroadcaster bound(loopback, port());
    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::serial, "9").build();

    unbound = std::move(bound);
    EXPECT_TRUE(unbound.has_peer());
    ASSERT_TRUE(unbound.send(ann));

    auto result = listener_->receive_one();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->serial(), "9");
}
