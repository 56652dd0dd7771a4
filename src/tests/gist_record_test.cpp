#include <gtest/gtest.h>
#include "core/gist_error.hpp"
#include "store/gist_record.hpp"
#include <sstream>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace gistvault::store;

namespace {

GistRecord sample_record() {
  GistRecord record;
  record.id = "V1StGXR8_Z5j";
  record.created_at = "2025-06-07T10:00:00.000Z";
  record.updated_at = "2025-06-07T11:30:00.250Z";
  record.expires_at = "2025-06-08T10:00:00.000Z";
  record.version = 3;
  record.current_version_token = "1749295800250-0a1b2c3d";
  record.total_size = 2048;
  record.blob_count = 4;
  record.protection = PinProtection{"aGFzaA==", "c2FsdA=="};
  record.encrypted_metadata = EncryptedMetadata{"aXY=", "ZGF0YQ=="};
  record.preferences.indent_mode = IndentMode::Spaces;
  record.preferences.indent_size = 4;
  record.preferences.wrap_mode = WrapMode::Soft;
  record.preferences.theme = Theme::Dark;
  return record;
}

void expect_same_record(const GistRecord& a, const GistRecord& b) {
  EXPECT_EQ(a.id, b.id);
  EXPECT_EQ(a.created_at, b.created_at);
  EXPECT_EQ(a.updated_at, b.updated_at);
  EXPECT_EQ(a.expires_at, b.expires_at);
  EXPECT_EQ(a.version, b.version);
  EXPECT_EQ(a.current_version_token, b.current_version_token);
  EXPECT_EQ(a.total_size, b.total_size);
  EXPECT_EQ(a.blob_count, b.blob_count);
  EXPECT_EQ(a.protection_class(), b.protection_class());
  EXPECT_EQ(a.encrypted_metadata.iv, b.encrypted_metadata.iv);
  EXPECT_EQ(a.encrypted_metadata.data, b.encrypted_metadata.data);
  EXPECT_EQ(a.preferences.indent_mode, b.preferences.indent_mode);
  EXPECT_EQ(a.preferences.indent_size, b.preferences.indent_size);
  EXPECT_EQ(a.preferences.wrap_mode, b.preferences.wrap_mode);
  EXPECT_EQ(a.preferences.theme, b.preferences.theme);
}

} // namespace

TEST(GistRecordTest, PinRecordSurvivesJson) {
  GistRecord record = sample_record();
  GistRecord restored = record_from_json(record_to_json(record));

  expect_same_record(record, restored);
  ASSERT_NE(restored.pin(), nullptr);
  EXPECT_EQ(restored.pin()->hash, "aGFzaA==");
  EXPECT_EQ(restored.pin()->salt, "c2FsdA==");
}

TEST(GistRecordTest, OneTimeViewRecordSurvivesJson) {
  GistRecord record = sample_record();
  record.protection = OneTimeView{};
  record.expires_at.reset();
  record.preferences = EditorPreferences{};

  GistRecord restored = record_from_json(record_to_json(record));
  expect_same_record(record, restored);
  EXPECT_TRUE(restored.is_one_time_view());
  EXPECT_EQ(restored.pin(), nullptr);
}

TEST(GistRecordTest, StoredFieldNames) {
  GistRecord record = sample_record();
  const std::string json = record_to_json(record);
  EXPECT_NE(json.find("\"edit_pin_hash\""), std::string::npos);
  EXPECT_NE(json.find("\"edit_pin_salt\""), std::string::npos);
  EXPECT_NE(json.find("\"one_time_view\""), std::string::npos);
  EXPECT_NE(json.find("\"current_version\""), std::string::npos);
}

TEST(GistRecordTest, OneTimeViewWinsOverStrayPinFields) {
  const std::string json =
      "{\"id\":\"x\",\"created_at\":\"2025-06-07T10:00:00.000Z\","
      "\"updated_at\":\"2025-06-07T10:00:00.000Z\",\"version\":\"1\","
      "\"current_version\":\"t\",\"total_size\":\"1\",\"one_time_view\":\"true\","
      "\"edit_pin_hash\":\"h\",\"edit_pin_salt\":\"s\"}";
  GistRecord record = record_from_json(json);
  EXPECT_EQ(record.protection_class(), ProtectionClass::OneTimeView);
}

TEST(GistRecordTest, HalfPinIsUnprotected) {
  const std::string json =
      "{\"id\":\"x\",\"created_at\":\"2025-06-07T10:00:00.000Z\","
      "\"updated_at\":\"2025-06-07T10:00:00.000Z\",\"version\":\"1\","
      "\"current_version\":\"t\",\"total_size\":\"1\",\"edit_pin_hash\":\"h\"}";
  EXPECT_EQ(record_from_json(json).protection_class(), ProtectionClass::Unprotected);
}

TEST(GistRecordTest, MalformedDocumentsAreStorageErrors) {
  EXPECT_THROW(record_from_json("not json"), gistvault::core::StorageError);
  EXPECT_THROW(record_from_json("{\"id\":\"x\"}"), gistvault::core::StorageError);
  EXPECT_THROW(record_from_json(
      "{\"id\":\"x\",\"created_at\":\"a\",\"updated_at\":\"b\",\"version\":\"one\","
      "\"current_version\":\"t\",\"total_size\":\"1\"}"),
      gistvault::core::StorageError);
  EXPECT_THROW(record_from_json(
      "{\"id\":\"x\",\"created_at\":\"a\",\"updated_at\":\"b\",\"version\":\"1\","
      "\"current_version\":\"t\",\"total_size\":\"1\",\"theme\":\"neon\"}"),
      gistvault::core::StorageError);
}

TEST(GistRecordTest, PublicViewHidesSecrets) {
  GistRecord record = sample_record();
  PublicGistView view = to_public_view(record);

  EXPECT_EQ(view.id, record.id);
  EXPECT_EQ(view.version, 3u);
  EXPECT_TRUE(view.has_edit_pin);
  EXPECT_FALSE(view.one_time_view);

  const std::string json = public_view_to_json(view);
  EXPECT_EQ(json.find("aGFzaA=="), std::string::npos);
  EXPECT_EQ(json.find("c2FsdA=="), std::string::npos);
  EXPECT_EQ(json.find("ZGF0YQ=="), std::string::npos);
  EXPECT_EQ(json.find("edit_pin_hash"), std::string::npos);
  EXPECT_NE(json.find("\"has_edit_pin\":true"), std::string::npos);
}

TEST(GistRecordTest, PublicViewWritesNumbersAndBooleans) {
  const std::string json = public_view_to_json(to_public_view(sample_record()));

  EXPECT_NE(json.find("\"version\":3,"), std::string::npos);
  EXPECT_NE(json.find("\"current_version\":\"1749295800250-0a1b2c3d\""), std::string::npos);
  EXPECT_NE(json.find("\"total_size\":2048,"), std::string::npos);
  EXPECT_NE(json.find("\"blob_count\":4,"), std::string::npos);
  EXPECT_NE(json.find("\"one_time_view\":false,"), std::string::npos);
  EXPECT_NE(json.find("\"has_edit_pin\":true"), std::string::npos);
  EXPECT_NE(json.find("\"indent_size\":4"), std::string::npos);
  EXPECT_NE(json.find("\"theme\":\"dark\""), std::string::npos);

  // Still a document property_tree can read back
  boost::property_tree::ptree tree;
  std::stringstream ss(json);
  EXPECT_NO_THROW(boost::property_tree::read_json(ss, tree));
  EXPECT_EQ(tree.get<uint64_t>("total_size"), 2048u);
  EXPECT_FALSE(tree.get<bool>("one_time_view"));
}

TEST(GistRecordTest, EnumNames) {
  EXPECT_EQ(parse_indent_mode(to_string(IndentMode::Tabs)), IndentMode::Tabs);
  EXPECT_EQ(parse_wrap_mode("hard"), WrapMode::Hard);
  EXPECT_EQ(parse_theme("auto"), Theme::Auto);
  EXPECT_STREQ(to_string(ProtectionClass::PinProtected), "pin-protected");
  EXPECT_THROW(parse_indent_mode("both"), gistvault::core::InvalidInputError);
}
