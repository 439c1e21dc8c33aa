#include "beeptunnel/binary/binary_info.hpp"

#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace beeptunnel::binary {

std::string binary_info_to_json(const BinaryInfo &info) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"version\": \"" << common::json_escape(info.version) << "\",\n";
  out << "  \"file_path\": \"" << common::json_escape(info.file_path.string()) << "\",\n";
  out << "  \"file_name\": \"" << common::json_escape(info.file_name) << "\",\n";
  out << "  \"download_url\": \"" << common::json_escape(info.download_url) << "\",\n";
  out << "  \"checksum\": \"" << common::json_escape(info.checksum) << "\",\n";
  out << "  \"size\": " << info.size << ",\n";
  out << "  \"platform\": \"" << common::json_escape(info.platform) << "\",\n";
  out << "  \"last_updated\": \"" << common::format_rfc3339(info.last_updated) << "\",\n";
  out << "  \"is_validated\": " << (info.is_validated ? "true" : "false") << ",\n";
  out << "  \"is_executable\": " << (info.is_executable ? "true" : "false") << "\n";
  out << "}\n";
  return out.str();
}

common::Result<BinaryInfo> parse_binary_info(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<BinaryInfo>::failure("binary info is not a JSON object",
                                               common::ErrorCode::Io);
  }

  BinaryInfo info;
  info.version = common::json_get_string(trimmed, "version");
  info.file_path = common::json_get_string(trimmed, "file_path");
  info.file_name = common::json_get_string(trimmed, "file_name");
  info.download_url = common::json_get_string(trimmed, "download_url");
  info.checksum = common::to_lower(common::json_get_string(trimmed, "checksum"));
  info.platform = common::json_get_string(trimmed, "platform");
  info.is_validated = common::json_get_bool(trimmed, "is_validated").value_or(false);
  info.is_executable = common::json_get_bool(trimmed, "is_executable").value_or(false);

  const std::string size = common::json_get_number(trimmed, "size");
  if (!size.empty()) {
    const auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), info.size);
    if (ec != std::errc() || ptr != size.data() + size.size()) {
      return common::Result<BinaryInfo>::failure("invalid size in binary info: " + size,
                                                 common::ErrorCode::Io);
    }
  }

  const auto updated = common::parse_rfc3339(common::json_get_string(trimmed, "last_updated"));
  if (!updated.ok()) {
    return common::Result<BinaryInfo>::failure(updated.error(), common::ErrorCode::Io);
  }
  info.last_updated = updated.value();

  if (info.file_path.empty() || info.version.empty()) {
    return common::Result<BinaryInfo>::failure("binary info is missing version or file_path",
                                               common::ErrorCode::Io);
  }
  return common::Result<BinaryInfo>::success(std::move(info));
}

common::Result<BinaryInfo> load_binary_info(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<BinaryInfo>::failure_from(content);
  }
  return parse_binary_info(content.value());
}

common::Status save_binary_info(const std::filesystem::path &path, const BinaryInfo &info) {
  return common::write_file_atomic(path, binary_info_to_json(info));
}

} // namespace beeptunnel::binary
