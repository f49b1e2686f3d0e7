#include "core/fingerprint.hpp"
#include "core/errors.hpp"

#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

void Fingerprint::require_manifest(const std::string& manifest_path) {
    std::error_code ec;
    if (!fs::is_regular_file(manifest_path, ec)) {
        throw SupervisorException(SupervisorError::ManifestNotFound,
                                  "Manifest not found: " + manifest_path);
    }
}

std::string Fingerprint::compute(const std::string& manifest_path) {
    require_manifest(manifest_path);

    std::ifstream file(manifest_path, std::ios::binary);
    if (!file.is_open()) {
        throw SupervisorException(SupervisorError::ManifestNotFound,
                                  "Cannot read manifest: " + manifest_path);
    }

    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        if (file.gcount() < static_cast<std::streamsize>(sizeof(buffer))) break;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string Fingerprint::read_record(const std::string& record_path) {
    std::ifstream in(record_path);
    if (!in.is_open()) return "";
    std::string content((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
    return trim(content);
}

bool Fingerprint::is_up_to_date(const std::string& record_path, const std::string& manifest_path) {
    std::string recorded = read_record(record_path);
    if (recorded.empty()) return false;

    try {
        return recorded == compute(manifest_path);
    } catch (const SupervisorException&) {
        return false;
    }
}

void Fingerprint::commit(const std::string& record_path, const std::string& manifest_path) {
    std::string hash = compute(manifest_path);

    auto parent = fs::path(record_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    // Readers see either the old record or the new one
    std::string tmp = record_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write fingerprint record: " + tmp);
        }
        out << hash << "\n";
        if (!out) {
            throw std::runtime_error("Cannot write fingerprint record: " + tmp);
        }
    }
    fs::rename(tmp, record_path);
}
