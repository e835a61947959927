#pragma once

#include <libtorrent/info_hash.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_status.hpp>

#include <optional>
#include <string>

namespace ft::engine {

constexpr int kSha1Bytes = static_cast<int>(libtorrent::sha1_hash::size());

inline std::string info_hash_to_hex(libtorrent::sha1_hash const &hash) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(kSha1Bytes * 2);
  for (int i = 0; i < kSha1Bytes; ++i) {
    auto byte = static_cast<unsigned char>(hash[i]);
    result.push_back(kHexDigits[byte >> 4]);
    result.push_back(kHexDigits[byte & 0x0F]);
  }
  return result;
}

inline bool hash_is_nonzero(libtorrent::sha1_hash const &hash) {
  return !hash.is_all_zeros();
}

// Hex info-hash of a live handle; nullopt while the engine has none.
inline std::optional<std::string>
hash_from_handle(libtorrent::torrent_handle const &handle) {
  if (!handle.is_valid()) {
    return std::nullopt;
  }
  auto const best = handle.info_hashes().get_best();
  if (!hash_is_nonzero(best)) {
    return std::nullopt;
  }
  return info_hash_to_hex(best);
}

} // namespace ft::engine
