#include "sweguard/common/hash.hpp"

#include "sweguard/common/fs.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace sweguard::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

Result<std::string> fingerprint_tree(const std::filesystem::path &root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return Result<std::string>::failure("not a directory: " + root.string());
  }

  std::vector<std::filesystem::path> entries;
  for (auto it = std::filesystem::recursive_directory_iterator(
           root, std::filesystem::directory_options::none, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) {
    return Result<std::string>::failure("failed to walk " + root.string() + ": " + ec.message());
  }
  std::sort(entries.begin(), entries.end());

  std::string manifest;
  for (const auto &entry : entries) {
    const auto status = std::filesystem::symlink_status(entry, ec);
    if (ec) {
      return Result<std::string>::failure("failed to stat " + entry.string());
    }
    const auto perms = static_cast<unsigned>(status.permissions()) & 0777U;
    manifest += entry.lexically_relative(root).string();
    manifest += " " + std::to_string(perms) + " ";

    if (std::filesystem::is_symlink(status)) {
      manifest += "-> " + std::filesystem::read_symlink(entry, ec).string();
    } else if (std::filesystem::is_regular_file(status)) {
      auto content = read_file(entry);
      if (!content.ok()) {
        return Result<std::string>::failure(content.error());
      }
      manifest += sha256_hex(content.value());
    } else {
      manifest += "dir";
    }
    manifest.push_back('\n');
  }
  return Result<std::string>::success(sha256_hex(manifest));
}

} // namespace sweguard::common
