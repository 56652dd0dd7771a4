#include "store/gist_record.hpp"
#include "core/gist_error.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace gistvault {
namespace store {

namespace pt = boost::property_tree;

namespace {

void write_preferences(pt::ptree& tree, const EditorPreferences& preferences) {
  if (preferences.indent_mode) tree.put("indent_mode", to_string(*preferences.indent_mode));
  if (preferences.indent_size) tree.put("indent_size", *preferences.indent_size);
  if (preferences.wrap_mode) tree.put("wrap_mode", to_string(*preferences.wrap_mode));
  if (preferences.theme) tree.put("theme", to_string(*preferences.theme));
}

EditorPreferences read_preferences(const pt::ptree& tree) {
  EditorPreferences preferences;
  if (auto value = tree.get_optional<std::string>("indent_mode")) {
    preferences.indent_mode = parse_indent_mode(*value);
  }
  if (auto value = tree.get_optional<int>("indent_size")) {
    preferences.indent_size = *value;
  }
  if (auto value = tree.get_optional<std::string>("wrap_mode")) {
    preferences.wrap_mode = parse_wrap_mode(*value);
  }
  if (auto value = tree.get_optional<std::string>("theme")) {
    preferences.theme = parse_theme(*value);
  }
  return preferences;
}

std::string write_json(const pt::ptree& tree) {
  std::stringstream ss;
  pt::write_json(ss, tree, false);
  return ss.str();
}

// property_tree writes every value as a string; strips the quotes
// around a numeric or boolean value written under key
void unquote_value(std::string& json, const std::string& key) {
  const std::string marker = "\"" + key + "\":\"";
  const std::size_t found = json.find(marker);
  if (found == std::string::npos) {
    return;
  }
  const std::size_t open = found + marker.size() - 1;
  const std::size_t close = json.find('"', open + 1);
  if (close == std::string::npos) {
    return;
  }
  json.erase(close, 1);
  json.erase(open, 1);
}

} // namespace

ProtectionClass GistRecord::protection_class() const {
  if (std::holds_alternative<PinProtection>(protection)) {
    return ProtectionClass::PinProtected;
  }
  if (std::holds_alternative<OneTimeView>(protection)) {
    return ProtectionClass::OneTimeView;
  }
  return ProtectionClass::Unprotected;
}


//==============================================
// PROJECTION
//==============================================

PublicGistView to_public_view(const GistRecord& record) {
  PublicGistView view;
  view.id = record.id;
  view.created_at = record.created_at;
  view.updated_at = record.updated_at;
  view.expires_at = record.expires_at;
  view.version = record.version;
  view.current_version_token = record.current_version_token;
  view.total_size = record.total_size;
  view.blob_count = record.blob_count;
  view.one_time_view = record.is_one_time_view();
  view.has_edit_pin = record.is_pin_protected();
  view.preferences = record.preferences;
  return view;
}


//==============================================
// SERIALIZATION
//==============================================

std::string record_to_json(const GistRecord& record) {
  pt::ptree tree;
  tree.put("id", record.id);
  tree.put("created_at", record.created_at);
  tree.put("updated_at", record.updated_at);
  if (record.expires_at) {
    tree.put("expires_at", *record.expires_at);
  }
  tree.put("version", record.version);
  tree.put("current_version", record.current_version_token);
  tree.put("total_size", record.total_size);
  tree.put("blob_count", record.blob_count);

  // Protection class is flattened to the stored field names
  tree.put("one_time_view", record.is_one_time_view());
  if (const PinProtection* pin = record.pin()) {
    tree.put("edit_pin_hash", pin->hash);
    tree.put("edit_pin_salt", pin->salt);
  }

  write_preferences(tree, record.preferences);

  tree.put("encrypted_metadata.iv", record.encrypted_metadata.iv);
  tree.put("encrypted_metadata.data", record.encrypted_metadata.data);

  return write_json(tree);
}

GistRecord record_from_json(const std::string& json) {
  pt::ptree tree;
  try {
    std::stringstream ss(json);
    pt::read_json(ss, tree);
  } catch (const pt::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Gist record: Malformed metadata document: " << e.what();
    throw core::StorageError(std::string("Malformed metadata document: ") + e.what());
  }

  try {
    GistRecord record;
    record.id = tree.get<std::string>("id");
    record.created_at = tree.get<std::string>("created_at");
    record.updated_at = tree.get<std::string>("updated_at");
    if (auto expires = tree.get_optional<std::string>("expires_at")) {
      record.expires_at = *expires;
    }
    record.version = tree.get<uint64_t>("version");
    record.current_version_token = tree.get<std::string>("current_version");
    record.total_size = tree.get<uint64_t>("total_size");
    record.blob_count = tree.get<uint32_t>("blob_count", 1);

    const bool one_time_view = tree.get<bool>("one_time_view", false);
    auto pin_hash = tree.get_optional<std::string>("edit_pin_hash");
    auto pin_salt = tree.get_optional<std::string>("edit_pin_salt");

    // One-time view wins when a document carries both markers
    if (one_time_view) {
      record.protection = OneTimeView{};
    } else if (pin_hash && pin_salt && !pin_hash->empty() && !pin_salt->empty()) {
      record.protection = PinProtection{*pin_hash, *pin_salt};
    } else {
      record.protection = Unprotected{};
    }

    record.preferences = read_preferences(tree);
    record.encrypted_metadata.iv = tree.get<std::string>("encrypted_metadata.iv", "");
    record.encrypted_metadata.data = tree.get<std::string>("encrypted_metadata.data", "");
    return record;
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Gist record: Incomplete metadata document: " << e.what();
    throw core::StorageError(std::string("Incomplete metadata document: ") + e.what());
  } catch (const core::InvalidInputError& e) {
    throw core::StorageError(std::string("Corrupt metadata document: ") + e.what());
  }
}

std::string public_view_to_json(const PublicGistView& view) {
  pt::ptree tree;
  tree.put("id", view.id);
  tree.put("created_at", view.created_at);
  tree.put("updated_at", view.updated_at);
  if (view.expires_at) {
    tree.put("expires_at", *view.expires_at);
  }
  tree.put("version", view.version);
  tree.put("current_version", view.current_version_token);
  tree.put("total_size", view.total_size);
  tree.put("blob_count", view.blob_count);
  tree.put("one_time_view", view.one_time_view);
  tree.put("has_edit_pin", view.has_edit_pin);
  write_preferences(tree, view.preferences);

  std::string json = write_json(tree);
  for (const char* key : {"version", "total_size", "blob_count", "one_time_view",
                          "has_edit_pin", "indent_size"}) {
    unquote_value(json, key);
  }
  return json;
}


//==============================================
// ENUM CONVERSIONS
//==============================================

const char* to_string(IndentMode mode) {
  switch (mode) {
    case IndentMode::Tabs: return "tabs";
    case IndentMode::Spaces: return "spaces";
  }
  return "spaces";
}

const char* to_string(WrapMode mode) {
  switch (mode) {
    case WrapMode::None: return "none";
    case WrapMode::Soft: return "soft";
    case WrapMode::Hard: return "hard";
  }
  return "soft";
}

const char* to_string(Theme theme) {
  switch (theme) {
    case Theme::Light: return "light";
    case Theme::Dark: return "dark";
    case Theme::Auto: return "auto";
  }
  return "auto";
}

const char* to_string(ProtectionClass protection) {
  switch (protection) {
    case ProtectionClass::Unprotected: return "unprotected";
    case ProtectionClass::PinProtected: return "pin-protected";
    case ProtectionClass::OneTimeView: return "one-time-view";
  }
  return "unprotected";
}

IndentMode parse_indent_mode(const std::string& text) {
  if (text == "tabs") return IndentMode::Tabs;
  if (text == "spaces") return IndentMode::Spaces;
  throw core::InvalidInputError("Unknown indent mode: " + text);
}

WrapMode parse_wrap_mode(const std::string& text) {
  if (text == "none") return WrapMode::None;
  if (text == "soft") return WrapMode::Soft;
  if (text == "hard") return WrapMode::Hard;
  throw core::InvalidInputError("Unknown wrap mode: " + text);
}

Theme parse_theme(const std::string& text) {
  if (text == "light") return Theme::Light;
  if (text == "dark") return Theme::Dark;
  if (text == "auto") return Theme::Auto;
  throw core::InvalidInputError("Unknown theme: " + text);
}

} // namespace store
} // namespace gistvault
