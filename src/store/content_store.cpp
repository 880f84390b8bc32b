#include "store/content_store.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

ContentStore::ContentStore(const std::filesystem::path& base_path, const std::string& extension)
  : base_path_(base_path)
  , extension_(extension) {
  BOOST_LOG_TRIVIAL(trace) << "Content store: Bound to " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string ContentStore::store(const std::string& data) {
  std::string hash = hash_content(data);
  put(hash, data);
  return hash;
}

bool ContentStore::put(const std::string& key, const std::string& data) {
  if (has(key)) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: Key already present, skipping write: " << key;
    return false;
  }

  check_directory_exists();

  std::filesystem::path file_path = path_for_key(key);
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  // Write beside the target then rename so a value is never seen half written
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Content store: Failed to create file: " + temp_path.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
      throw StoreError("Content store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Content store: Failed to commit file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Content store: Stored " << data.size() << " bytes with key: " << key;
  return true;
}

std::optional<std::string> ContentStore::get(const std::string& key) const {
  if (!has(key)) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: Key not found: " << key;
    return std::nullopt;
  }

  std::filesystem::path file_path = path_for_key(key);
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Content store: Failed to open file: " + file_path.string());
  }

  std::ostringstream output;
  output << file.rdbuf();
  if (file.bad()) {
    throw StoreError("Content store: Failed to read file: " + file_path.string());
  }
  return output.str();
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ContentStore::has(const std::string& key) const {
  if (key.empty() || key.find('/') != std::string::npos) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for_key(key), ec);
}

std::vector<std::string> ContentStore::keys() const {
  std::vector<std::string> result;

  std::error_code ec;
  if (!std::filesystem::exists(base_path_, ec)) {
    return result;
  }

  std::filesystem::directory_iterator it(base_path_, ec);
  if (ec) {
    throw StoreError("Content store: Failed to list " + base_path_.string() + ": " + ec.message());
  }

  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry.path().extension() != extension_) {
      continue;
    }
    result.push_back(entry.path().stem().string());
  }
  return result;
}


//==============================================
// CAS SUPPORT
//==============================================

std::string ContentStore::hash_content(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Content store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content store: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, data.data(), data.size())) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content store: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content store: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path ContentStore::path_for_key(const std::string& key) const {
  return base_path_ / (key + extension_);
}

void ContentStore::check_directory_exists() const {
  std::error_code ec;
  if (std::filesystem::is_directory(base_path_, ec)) {
    return;
  }
  std::filesystem::create_directory(base_path_, ec);
  if (ec) {
    throw StoreError("Content store: Failed to create directory " + base_path_.string() + ": " + ec.message());
  }
}

} // namespace store
} // namespace biowiki
