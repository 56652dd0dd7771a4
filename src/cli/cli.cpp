#include "cli/cli.hpp"
#include "auth/deletion_proof.hpp"
#include "core/gist_error.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gistvault {
namespace cli {

namespace {

std::string read_local_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("cannot open " + path);
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_local_file(const std::filesystem::path& path, const std::string& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("cannot create " + path.string());
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!file) {
    throw std::runtime_error("cannot write " + path.string());
  }
}

store::Bytes to_bytes(const std::string& text) {
  return store::Bytes(text.begin(), text.end());
}

// Removes "<name> <value>" from args and returns the value
std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name) {
  auto it = std::find(args.begin(), args.end(), name);
  if (it == args.end()) {
    return std::nullopt;
  }
  if (std::next(it) == args.end()) {
    throw std::invalid_argument(name + " needs a value");
  }
  std::string value = *std::next(it);
  args.erase(it, std::next(it, 2));
  return value;
}

bool take_flag(std::vector<std::string>& args, const std::string& name) {
  auto it = std::find(args.begin(), args.end(), name);
  if (it == args.end()) {
    return false;
  }
  args.erase(it);
  return true;
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(store::GistStore& store, const container::ContainerCodec& codec,
         std::istream& in, std::ostream& out)
  : store_(store)
  , codec_(codec)
  , in_(in)
  , out_(out)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting shell loop";
  out_ << "gistvault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "gistvault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Shell loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  Args args{std::istream_iterator<std::string>(iss), std::istream_iterator<std::string>()};
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const Args& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with "
                           << args.size() << " arguments";

  try {
    if (command == "pack") {
      handle_pack_command(args);
    } else if (command == "unpack") {
      handle_unpack_command(args);
    } else if (command == "create") {
      handle_create_command(args);
    } else if (command == "info") {
      handle_info_command(args);
    } else if (command == "get") {
      handle_get_command(args);
    } else if (command == "update") {
      handle_update_command(args);
    } else if (command == "delete") {
      handle_delete_command(args);
    } else if (command == "history") {
      handle_history_command(args);
    } else if (command == "proof") {
      handle_proof_command(args);
    } else if (command == "gc") {
      handle_gc_command();
    } else if (command == "help") {
      handle_help_command();
    } else {
      out_ << "Unknown command: " << command << " (try help)" << std::endl;
    }
  } catch (const core::GistError& e) {
    log_and_display_error("[" + std::to_string(core::http_status_for(e.code())) + "] " + command +
                          " failed", e.what());
  } catch (const std::exception& e) {
    log_and_display_error(command + " failed", e.what());
  }
}

void CLI::handle_pack_command(const Args& args) {
  if (args.size() < 2) {
    out_ << "Usage: pack <output> <file>..." << std::endl;
    return;
  }

  std::vector<container::File> files;
  for (auto it = std::next(args.begin()); it != args.end(); ++it) {
    std::filesystem::path path(*it);
    container::File file;
    file.name = path.filename().string();
    file.content = read_local_file(*it);
    if (path.has_extension()) {
      file.language = path.extension().string().substr(1);
    }
    files.push_back(std::move(file));
  }

  store::Bytes packed = codec_.encode(files);
  write_local_file(args[0], std::string(packed.begin(), packed.end()));
  out_ << "Packed " << files.size() << " files into " << args[0] << " (" << packed.size()
       << " bytes)" << std::endl;
}

void CLI::handle_unpack_command(const Args& args) {
  if (args.size() != 2) {
    out_ << "Usage: unpack <container> <directory>" << std::endl;
    return;
  }

  std::vector<container::File> files = codec_.decode(to_bytes(read_local_file(args[0])));
  std::filesystem::create_directories(args[1]);
  for (const auto& file : files) {
    // Only the final path component is trusted
    std::filesystem::path target = std::filesystem::path(args[1]) /
                                   std::filesystem::path(file.name).filename();
    write_local_file(target, file.content);
    out_ << "  " << file.name << " (" << file.content.size() << " bytes"
         << (file.language ? ", " + *file.language : "") << ")" << std::endl;
  }
  out_ << "Unpacked " << files.size() << " files into " << args[1] << std::endl;
}

void CLI::handle_create_command(const Args& args) {
  Args rest = args;
  store::NewGist gist;
  gist.edit_pin = take_option(rest, "--pin");
  gist.one_time_view = take_flag(rest, "--one-time");
  if (auto expiry = take_option(rest, "--expiry")) {
    gist.expiry = utils::parse_expiry_option(*expiry);
  }
  if (auto count = take_option(rest, "--files")) {
    gist.blob_count = static_cast<uint32_t>(std::stoul(*count));
  }
  if (rest.size() != 1) {
    out_ << "Usage: create <blob-file> [--pin <pin>] [--one-time] [--expiry <option>] "
            "[--files <count>]" << std::endl;
    return;
  }

  store::GistRecord record = store_.create(gist, to_bytes(read_local_file(rest[0])));
  out_ << "Created gist " << record.id << " (version " << record.version << ", "
       << store::to_string(record.protection_class()) << ")" << std::endl;
  if (record.expires_at) {
    out_ << "Expires at " << *record.expires_at << std::endl;
  }
}

void CLI::handle_info_command(const Args& args) {
  if (args.size() != 1) {
    out_ << "Usage: info <id>" << std::endl;
    return;
  }
  store::GistRecord record = store_.get_metadata(args[0]);
  out_ << store::public_view_to_json(store::to_public_view(record)) << std::endl;
}

void CLI::handle_get_command(const Args& args) {
  if (args.size() != 2 && args.size() != 3) {
    out_ << "Usage: get <id> <output> [version-token]" << std::endl;
    return;
  }

  if (args.size() == 3) {
    store::Bytes blob = store_.get_version(args[0], args[2]);
    write_local_file(args[1], std::string(blob.begin(), blob.end()));
    out_ << "Wrote " << blob.size() << " bytes to " << args[1] << std::endl;
    return;
  }

  store::GistView view = store_.get(args[0]);
  write_local_file(args[1], std::string(view.blob.begin(), view.blob.end()));
  out_ << "Wrote " << view.blob.size() << " bytes to " << args[1] << std::endl;

  // Delivered once; a failed release only leaves it for the owner's proof
  if (view.record.is_one_time_view()) {
    if (store_.release_one_time_view(view.record)) {
      out_ << "One-time gist " << args[0] << " has been deleted" << std::endl;
    } else {
      out_ << "One-time gist " << args[0] << " could not be deleted" << std::endl;
    }
  }
}

void CLI::handle_update_command(const Args& args) {
  Args rest = args;
  std::optional<std::string> pin = take_option(rest, "--pin");
  std::optional<std::string> version = take_option(rest, "--version");
  if (rest.size() != 2) {
    out_ << "Usage: update <id> <blob-file> --pin <pin> [--version <n>]" << std::endl;
    return;
  }

  const std::string& id = rest[0];
  store::Bytes blob = to_bytes(read_local_file(rest[1]));
  uint64_t expected = version ? std::stoull(*version) : store_.get_metadata(id).version;

  store::UpdateResult result = store_.update(id, store::GistUpdate{}, blob, expected, pin);
  out_ << "Updated gist " << id << " to version " << result.version << std::endl;
}

void CLI::handle_delete_command(const Args& args) {
  Args rest = args;
  store::Credential credential;
  credential.pin = take_option(rest, "--pin");
  credential.proof = take_option(rest, "--proof");
  if (rest.size() != 1) {
    out_ << "Usage: delete <id> [--pin <pin> | --proof <proof>]" << std::endl;
    return;
  }

  store::GistRecord record;
  record.id = rest[0];
  store_.delete_if_needed(record, credential);
  out_ << "Deleted gist " << rest[0] << std::endl;
}

void CLI::handle_history_command(const Args& args) {
  if (args.size() != 1) {
    out_ << "Usage: history <id>" << std::endl;
    return;
  }

  auto entries = store_.list_versions(args[0]);
  if (entries.empty()) {
    out_ << "No previous versions" << std::endl;
    return;
  }
  for (const auto& entry : entries) {
    out_ << "  " << entry.version_token << "  " << entry.created_at << "  " << entry.size
         << " bytes  " << entry.file_count << " files"
         << (entry.edited_with_pin ? "  (pin edit)" : "") << std::endl;
  }
}

void CLI::handle_proof_command(const Args& args) {
  if (args.size() != 1) {
    out_ << "Usage: proof <id>" << std::endl;
    return;
  }
  store::GistRecord record = store_.get_metadata(args[0]);
  out_ << auth::derive_deletion_proof(record.created_at, record.total_size, record.id) << std::endl;
}

void CLI::handle_gc_command() {
  store::CleanupReport report = store_.cleanup_expired();
  out_ << "Checked " << report.checked << " gists, removed " << report.deleted
       << " expired" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  pack <out> <file>...            Bundle local files into a container" << std::endl;
  out_ << "  unpack <container> <dir>        Extract a container into <dir>" << std::endl;
  out_ << "  create <blob> [options]         Store a gist (--pin, --one-time, --expiry, --files)" << std::endl;
  out_ << "  info <id>                       Show the public metadata of a gist" << std::endl;
  out_ << "  get <id> <out> [token]          Write the current or an older blob to <out>" << std::endl;
  out_ << "                                  (a one-time gist is deleted once written)" << std::endl;
  out_ << "  update <id> <blob> --pin <pin>  Replace the blob of a PIN-protected gist" << std::endl;
  out_ << "  delete <id> --pin|--proof <v>   Delete a protected gist" << std::endl;
  out_ << "  history <id>                    List retained versions, newest first" << std::endl;
  out_ << "  proof <id>                      Print the deletion proof of a gist" << std::endl;
  out_ << "  gc                              Remove expired gists" << std::endl;
  out_ << "  quit                            Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace gistvault
