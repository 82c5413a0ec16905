#include <hopper/vault/key_vault.hpp>

#include <fcntl.h>
#include <stdlib.h>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace hopper::vault {

namespace {

constexpr auto kPublicKeyField = std::string_view{"PUBKEY="};
constexpr auto kPrivateKeyField = std::string_view{"PRIVKEY="};
constexpr auto kKeyFileMode = mode_t{0600};

/// Closes on every exit path.
struct unique_fd final {
  int fd{-1};

  explicit unique_fd(const int value) : fd{value} {}
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(); }

  bool valid() const { return fd >= 0; }

  // Reports the close(2) result; a failed close after write may lose data.
  bool reset() {
    if (fd < 0) {
      return true;
    }
    auto ok = ::close(fd) == 0;
    fd = -1;
    return ok;
  }
};

/// Wipes a string holding secret material when it goes out of scope.
struct secret_string final {
  std::string value;

  secret_string() = default;
  secret_string(const secret_string&) = delete;
  secret_string& operator=(const secret_string&) = delete;
  ~secret_string() {
    if (!value.empty()) {
      OPENSSL_cleanse(value.data(), value.size());
    }
  }
};

std::string errno_message(const std::string_view what,
                          const std::filesystem::path& path) {
  return std::string{what} + " '" + path.string() +
         "': " + std::strerror(errno);
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         (value.back() == '\r' || value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  return value;
}

std::optional<hopper::crypto::signing_key> parse_key_file(
    const std::string_view content,
    hopper::schema::failure_t& error) {
  auto public_text = std::optional<std::string_view>{};
  auto private_text = std::optional<std::string_view>{};

  auto remaining = content;
  while (!remaining.empty()) {
    auto end = remaining.find('\n');
    auto line = trim(remaining.substr(0, end));
    remaining = end == std::string_view::npos ? std::string_view{}
                                              : remaining.substr(end + 1);
    if (line.starts_with(kPublicKeyField)) {
      public_text = line.substr(kPublicKeyField.size());
    } else if (line.starts_with(kPrivateKeyField)) {
      private_text = line.substr(kPrivateKeyField.size());
    }
  }

  error.code = hopper::schema::error_code_t::key_corrupted;
  if (!public_text || !private_text) {
    error.message = "key file is missing PUBKEY or PRIVKEY";
    return std::nullopt;
  }
  auto public_key = hopper::schema::try_make_public_key(*public_text);
  if (!public_key) {
    error.message = "PUBKEY is not a base58 32-byte key";
    return std::nullopt;
  }
  auto keypair = hopper::schema::try_from_base58(*private_text);
  if (!keypair || keypair->size() != hopper::crypto::kKeypairSize) {
    if (keypair) {
      OPENSSL_cleanse(keypair->data(), keypair->size());
    }
    error.message = "PRIVKEY is not a base58 64-byte keypair";
    return std::nullopt;
  }
  auto key = hopper::crypto::signing_key::from_keypair(
      hopper::schema::bytes_view_t{keypair->data(), keypair->size()});
  OPENSSL_cleanse(keypair->data(), keypair->size());
  if (!key) {
    error.message = "PRIVKEY does not hold a consistent ed25519 keypair";
    return std::nullopt;
  }
  if (key->public_key() != *public_key) {
    error.message = "PUBKEY does not match the key derived from PRIVKEY";
    return std::nullopt;
  }

  error = hopper::schema::failure_t{};
  return key;
}

bool format_key_file(const hopper::crypto::signing_key& key,
                     secret_string& out) {
  auto keypair = std::array<uint8_t, hopper::crypto::kKeypairSize>{};
  if (!key.export_keypair(keypair)) {
    return false;
  }
  auto encoded = hopper::schema::to_base58(keypair);
  OPENSSL_cleanse(keypair.data(), keypair.size());

  out.value.append(kPublicKeyField);
  out.value.append(hopper::schema::to_base58(key.public_key()));
  out.value.push_back('\n');
  out.value.append(kPrivateKeyField);
  out.value.append(encoded);
  out.value.push_back('\n');
  OPENSSL_cleanse(encoded.data(), encoded.size());
  return true;
}

bool write_all(const int fd, const std::string_view content) {
  auto offset = std::size_t{0};
  while (offset < content.size()) {
    auto written =
        ::write(fd, content.data() + offset, content.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

void sync_directory(const std::filesystem::path& directory) {
  auto dir = unique_fd{::open(directory.c_str(), O_RDONLY | O_DIRECTORY)};
  if (!dir.valid() || ::fsync(dir.fd) != 0) {
    spdlog::warn("Could not fsync directory '{}': {}", directory.string(),
                 std::strerror(errno));
  }
}

}  // namespace

key_vault::key_vault(vault_options options) : options_{std::move(options)} {}

bool key_vault::loaded() const {
  return key_.has_value();
}

const hopper::schema::hop_account_t& key_vault::account() const {
  return account_;
}

const std::filesystem::path& key_vault::path() const {
  return options_.path;
}

std::optional<hopper::schema::signature_t> key_vault::sign(
    const hopper::schema::bytes_view_t& message) const {
  if (!key_) {
    return std::nullopt;
  }
  return key_->sign(message);
}

std::optional<hopper::schema::hop_account_t> key_vault::load_or_create(
    hopper::schema::failure_t& error) {
  if (key_) {
    return account_;
  }

  auto ec = std::error_code{};
  auto exists = std::filesystem::exists(options_.path, ec);
  if (ec) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .message = "cannot stat key file '" + options_.path.string() +
                   "': " + ec.message()};
    return std::nullopt;
  }

  auto key = std::optional<hopper::crypto::signing_key>{};
  if (exists) {
    key = load(error);
  } else if (options_.create_if_missing) {
    key = create(error);
  } else {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .message = "key file '" + options_.path.string() + "' does not exist"};
  }
  if (!key) {
    return std::nullopt;
  }

  account_ = hopper::schema::hop_account_t{.address = key->public_key(),
                                           .key_path = options_.path.string()};
  key_ = std::move(key);
  return account_;
}

std::optional<hopper::crypto::signing_key> key_vault::load(
    hopper::schema::failure_t& error) const {
  struct stat info {};
  if (::stat(options_.path.c_str(), &info) == 0 &&
      (info.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
    spdlog::warn("Key file '{}' is accessible by group or others; restricting "
                 "it to the owner",
                 options_.path.string());
    if (::chmod(options_.path.c_str(), kKeyFileMode) != 0) {
      spdlog::warn("{}", errno_message("Could not chmod", options_.path));
    }
  }

  auto input = std::ifstream{options_.path, std::ios::binary};
  if (!input.good()) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .message = "cannot open key file '" + options_.path.string() + "'"};
    return std::nullopt;
  }
  auto content = secret_string{};
  content.value.assign(std::istreambuf_iterator<char>{input},
                       std::istreambuf_iterator<char>{});

  auto key = parse_key_file(content.value, error);
  if (!key) {
    error.message = "key file '" + options_.path.string() + "': " + error.message;
    spdlog::error("{}", error.message);
    return std::nullopt;
  }
  spdlog::info("Loaded key {} from '{}'",
               hopper::schema::to_base58(key->public_key()),
               options_.path.string());
  return key;
}

std::optional<hopper::crypto::signing_key> key_vault::create(
    hopper::schema::failure_t& error) const {
  auto fail = [&](std::string message) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .message = std::move(message)};
    spdlog::error("{}", error.message);
    return std::nullopt;
  };

  auto key = hopper::crypto::signing_key::generate();
  if (!key) {
    return fail("ed25519 key generation failed");
  }
  auto content = secret_string{};
  if (!format_key_file(*key, content)) {
    return fail("could not export generated key");
  }

  auto directory = options_.path.has_parent_path()
                       ? options_.path.parent_path()
                       : std::filesystem::path{"."};
  auto ec = std::error_code{};
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    return fail("cannot create directory '" + directory.string() +
                "': " + ec.message());
  }

  // Unique per creator, so a temp file left by a killed process never
  // blocks the next attempt.
  auto temp_name = options_.path.string() + ".tmp.XXXXXX";
  auto temp_path = std::filesystem::path{};
  {
    auto fd = unique_fd{::mkostemp(temp_name.data(), O_CLOEXEC)};
    if (!fd.valid()) {
      return fail(errno_message("cannot create temporary key file in",
                                directory));
    }
    temp_path = temp_name;
    if (::fchmod(fd.fd, kKeyFileMode) != 0) {
      auto message = errno_message("cannot restrict", temp_path);
      ::unlink(temp_path.c_str());
      return fail(std::move(message));
    }
    auto written = write_all(fd.fd, content.value) && ::fsync(fd.fd) == 0;
    auto closed = fd.reset();
    if (!written || !closed) {
      auto message = errno_message("cannot write", temp_path);
      ::unlink(temp_path.c_str());
      return fail(std::move(message));
    }
  }

  // link(2) refuses to replace an existing file, so a concurrent creator
  // cannot have its key silently overwritten.
  if (::link(temp_path.c_str(), options_.path.c_str()) != 0) {
    auto link_errno = errno;
    ::unlink(temp_path.c_str());
    if (link_errno == EEXIST) {
      spdlog::info("Key file '{}' appeared concurrently; loading it",
                   options_.path.string());
      return load(error);
    }
    errno = link_errno;
    return fail(errno_message("cannot install key file", options_.path));
  }
  ::unlink(temp_path.c_str());
  sync_directory(directory);

  spdlog::info("Generated key {} at '{}'",
               hopper::schema::to_base58(key->public_key()),
               options_.path.string());
  return key;
}

}  // namespace hopper::vault
