#include <array>
#include <string>
#include <vector>

#include "announcement_test_fixture.hpp"

namespace {

std::string body_text(const std::vector<uint8_t>& datagram, size_t header_bytes) {
    return std::string(datagram.begin() + static_cast<std::ptrdiff_t>(header_bytes),
                       datagram.end());
}

} // namespace

TEST(AnnouncementEncoderTest, WritesSchemaOrderThenExtras) {
    auto ann = DeviceAnnouncement::Builder{}
                   .set(AnnouncementField::status, "Available")
                   .set(AnnouncementField::model, "FLEX-6600")
                   .add_unrecognized("wan_connected", "1")
                   .build();

    auto bytes = flexdisco::encode_announcement(ann);
    ASSERT_TRUE(bytes.has_value());
    ASSERT_EQ(bytes->size(), flexdisco::announcement_header_bytes +
                                 std::string("model=FLEX-6600 status=Available wan_connected=1")
                                     .size());

    for (size_t i = 0; i < flexdisco::announcement_header_bytes; ++i) {
        EXPECT_EQ((*bytes)[i], 0x00);
    }
    EXPECT_EQ(body_text(*bytes, flexdisco::announcement_header_bytes),
              "model=FLEX-6600 status=Available wan_connected=1");
}

TEST(AnnouncementEncoderTest, CustomHeaderIsCopied) {
    std::array<uint8_t, 4> header{0x38, 0x51, 0x00, 0x4A};
    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::serial, "1").build();

    auto bytes = flexdisco::encode_announcement(ann, header);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ((*bytes)[0], 0x38);
    EXPECT_EQ((*bytes)[3], 0x4A);
    EXPECT_EQ(body_text(*bytes, header.size()), "serial=1");
}

TEST(AnnouncementEncoderTest, EmptyAnnouncementIsHeaderOnly) {
    auto bytes = flexdisco::encode_announcement(DeviceAnnouncement{});
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->size(), flexdisco::announcement_header_bytes);
}

TEST(AnnouncementEncoderTest, RejectsSpaceInValue) {
    auto ann = DeviceAnnouncement::Builder{}.set(AnnouncementField::nickname, "My Radio").build();

    auto bytes = flexdisco::encode_announcement(ann);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error(), flexdisco::EncodeError::value_not_encodable);
}

TEST(AnnouncementEncoderTest, RejectsSeparatorInKey) {
    auto ann = DeviceAnnouncement::Builder{}.add_unrecognized("a=b", "c").build();

    auto bytes = flexdisco::encode_announcement(ann);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error(), flexdisco::EncodeError::key_not_encodable);
    EXPECT_STREQ(flexdisco::encode_error_string(bytes.error()),
                 "Key contains a separator or names a known field");
}

TEST(AnnouncementEncoderTest, RejectsUnrecognizedKeyNamingKnownField) {
    // "model" would come back as the model field, not as an unrecognized pair
    auto ann = DeviceAnnouncement::Builder{}.add_unrecognized("model", "X").build();

    auto bytes = flexdisco::encode_announcement(ann);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error(), flexdisco::EncodeError::key_not_encodable);

    // Case differs from the schema, so the pair still survives decoding
    auto shadow = DeviceAnnouncement::Builder{}.add_unrecognized("Model", "X").build();
    auto shadow_bytes = flexdisco::encode_announcement(shadow);
    ASSERT_TRUE(shadow_bytes.has_value());
    auto decoded = flexdisco::decode_announcement(*shadow_bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, shadow);
    EXPECT_FALSE(decoded->model().has_value());
}

TEST(AnnouncementEncoderTest, DecoderReadsEncodedAnnouncement) {
    auto ann = DeviceAnnouncement::Builder{}
                   .set(AnnouncementField::model, "FLEX-6400")
                   .set(AnnouncementField::inuse_host, "shack-pc")
                   .set(AnnouncementField::fpc_mac, "")
                   .add_unrecognized("gui_client_programs", "SmartSDR-Win")
                   .build();

    auto bytes = flexdisco::encode_announcement(ann);
    ASSERT_TRUE(bytes.has_value());

    auto decoded = flexdisco::decode_announcement(*bytes);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
    EXPECT_EQ(*decoded, ann);
}
