#include "beeptunnel/binary/validator.hpp"

#include "beeptunnel/common/crypto.hpp"
#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/observability/global.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

namespace beeptunnel::binary {

namespace {

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

bool BinaryValidator::validate(const std::filesystem::path &path,
                               const std::string &expected_checksum) const {
  const std::string where = path.string();
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    observability::record_binary_check(where, "exists", false);
    return false;
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size < min_size_) {
    observability::record_binary_check(where, "size", false,
                                       ec ? ec.message() : std::to_string(size) + " bytes");
    return false;
  }

  if (!common::trim(expected_checksum).empty()) {
    const auto actual = checksum(path);
    if (!actual.ok()) {
      observability::record_binary_check(where, "checksum", false, actual.error());
      return false;
    }
    if (!common::iequals(actual.value(), common::trim(expected_checksum))) {
      observability::record_binary_check(where, "checksum", false,
                                         "expected " + expected_checksum + ", got " +
                                             actual.value());
      return false;
    }
  }

  if (!is_executable(path)) {
    observability::record_binary_check(where, "executable", false);
    return false;
  }

  observability::record_binary_check(where, "validate", true);
  return true;
}

common::Result<std::string> BinaryValidator::checksum(const std::filesystem::path &path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure("unable to open " + path.string(),
                                                common::ErrorCode::Io);
  }

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return common::Result<std::string>::failure("failed to initialize SHA-256");
  }

  std::array<char, CHUNK_SIZE> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      return common::Result<std::string>::failure("SHA-256 update failed");
    }
  }
  if (in.bad()) {
    return common::Result<std::string>::failure("read error on " + path.string(),
                                                common::ErrorCode::Io);
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    return common::Result<std::string>::failure("SHA-256 finalize failed");
  }
  return common::Result<std::string>::success(common::to_hex(digest.data(), digest_len));
}

bool BinaryValidator::is_executable(const std::filesystem::path &path) const {
#ifdef _WIN32
  return common::iequals(path.extension().string(), ".exe");
#else
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return false;
  }
  return (status.permissions() & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
#endif
}

common::Status BinaryValidator::make_executable(const std::filesystem::path &path) const {
#ifdef _WIN32
  (void)path;
  return common::Status::success();
#else
  std::error_code ec;
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add, ec);
  if (ec) {
    return common::Status::error("chmod failed for " + path.string() + ": " + ec.message(),
                                 common::ErrorCode::Io);
  }
  return common::Status::success();
#endif
}

} // namespace beeptunnel::binary
