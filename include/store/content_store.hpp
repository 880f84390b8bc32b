#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <vector>
#include "store/store_error.hpp"

namespace biowiki {
namespace store {

// Append-only key/value layer where the key is the SHA-256 of the value.
// A value is written once; later writes of the same content are no-ops.
class ContentStore {
public:

  // ---- CONSTRUCTOR ----
  // base_path is created lazily on the first write
  ContentStore(const std::filesystem::path& base_path, const std::string& extension);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores data under its content hash and returns the hash
  std::string store(const std::string& data);
  // Writes data under key unless the key already exists; true if written
  bool put(const std::string& key, const std::string& data);
  // Retrieves the value for key, nullopt if no such key
  std::optional<std::string> get(const std::string& key) const;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  // All keys currently stored, empty when the base directory is absent
  std::vector<std::string> keys() const;


  // ---- CAS SUPPORT ----
  // SHA-256 of data as 64 lowercase hex characters
  static std::string hash_content(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::string extension_;


  // ---- UTILITY METHODS ----
  std::filesystem::path path_for_key(const std::string& key) const;
  // Ensures base directory exists, create if needed
  void check_directory_exists() const;
};

} // namespace store
} // namespace biowiki
