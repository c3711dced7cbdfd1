
#include "sector_store.hpp"
#include "error.hpp"
#include "protocol.hpp"
#include <fstream>
#include <iterator>

namespace salvage {

Hash256 MemorySectorStore::put(std::vector<uint8_t> sector) {
  Hash256 root = sector_root(sector);
  put_as(root, std::move(sector));
  return root;
}

void MemorySectorStore::put_as(const Hash256 &root, std::vector<uint8_t> data) {
  std::lock_guard<std::mutex> lk(mtx_);
  sectors_[root] = std::move(data);
}

void MemorySectorStore::erase(const Hash256 &root) {
  std::lock_guard<std::mutex> lk(mtx_);
  sectors_.erase(root);
}

bool MemorySectorStore::get(const Hash256 &root, std::vector<uint8_t> &out) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = sectors_.find(root);
  if (it == sectors_.end())
    return false;
  out = it->second;
  return true;
}

Hash256 DirSectorStore::put(const std::vector<uint8_t> &sector) {
  Hash256 root = sector_root(sector);
  const std::string path = dir_ + "/" + hash_to_hex(root);
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  f.write((const char *)sector.data(), (std::streamsize)sector.size());
  f.flush();
  if (!f)
    throw Error(ErrorCode::Io, "failed to write " + path);
  return root;
}

bool DirSectorStore::get(const Hash256 &root, std::vector<uint8_t> &out) {
  std::ifstream f(dir_ + "/" + hash_to_hex(root), std::ios::binary);
  if (!f)
    return false;
  out.assign(std::istreambuf_iterator<char>(f),
             std::istreambuf_iterator<char>());
  return true;
}

} // namespace salvage
