#include "CredentialStore.h"
#include "Hex.h"
#include "core/LoggingChannels.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <unistd.h>

namespace StenoBridge {
namespace Auth {

namespace {

std::string trim(const std::string& text)
{
    const char* whitespace = " \t\r\n";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

Result<std::vector<uint8_t>, std::string> CredentialStore::load(const std::filesystem::path& path)
{
    using R = Result<std::vector<uint8_t>, std::string>;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return R::error("Cannot open credential file: " + path.string());
    }
    std::string content(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    const std::string trimmed = trim(content);
    std::vector<uint8_t> key;
    if (auto decoded = fromHex(trimmed); decoded.has_value() && !decoded->empty()) {
        key = std::move(decoded.value());
    }
    else {
        key.assign(trimmed.begin(), trimmed.end());
    }
    OPENSSL_cleanse(content.data(), content.size());

    if (key.size() < kMinKeyBytes) {
        return R::error(
            "Credential in " + path.string() + " is too short (" + std::to_string(key.size())
            + " bytes, need at least " + std::to_string(kMinKeyBytes) + ")");
    }

    LOG_INFO(Auth, "Loaded {}-byte pre-shared key from {}", key.size(), path.string());
    return R::okay(std::move(key));
}

Result<std::vector<uint8_t>, std::string> CredentialStore::loadOrCreate(
    const std::filesystem::path& path, bool generateIfMissing)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!generateIfMissing) {
            return Result<std::vector<uint8_t>, std::string>::error(
                "Credential file not found: " + path.string());
        }
        auto created = generate(path);
        if (created.isError()) {
            return Result<std::vector<uint8_t>, std::string>::error(created.errorValue());
        }
    }
    return load(path);
}

Result<std::monostate, std::string> CredentialStore::generate(const std::filesystem::path& path)
{
    using R = Result<std::monostate, std::string>;

    std::vector<uint8_t> key(kGeneratedKeyBytes);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return R::error("Secure random source failed while generating a key");
    }
    std::string hex = toHex(key);
    OPENSSL_cleanse(key.data(), key.size());
    hex += "\n";

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return R::error("Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    // Created with owner-only permissions; O_EXCL refuses to clobber a racing writer.
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return R::error("Cannot create " + path.string() + ": " + std::strerror(errno));
    }
    const ssize_t written = ::write(fd, hex.data(), hex.size());
    const int writeErrno = errno;
    ::close(fd);
    OPENSSL_cleanse(hex.data(), hex.size());

    if (written != static_cast<ssize_t>(hex.size())) {
        std::filesystem::remove(path, ec);
        return R::error("Failed writing " + path.string() + ": " + std::strerror(writeErrno));
    }

    LOG_WARN(
        Auth,
        "Generated new pre-shared key at {}; give this file to clients",
        path.string());
    return R::okay(std::monostate{});
}

} // namespace Auth
} // namespace StenoBridge
