#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "util.hpp"

namespace salvage {

class SectorStore {
public:
    virtual ~SectorStore() = default;
    virtual bool get(const Hash256& root, std::vector<uint8_t>& out) = 0;
};

class MemorySectorStore : public SectorStore {
public:
    // Stores sector under its Merkle root and returns the root.
    Hash256 put(std::vector<uint8_t> sector);
    // Stores data under an arbitrary root.
    void put_as(const Hash256& root, std::vector<uint8_t> data);
    void erase(const Hash256& root);
    bool get(const Hash256& root, std::vector<uint8_t>& out) override;
private:
    std::mutex mtx_;
    std::unordered_map<Hash256, std::vector<uint8_t>, Hash256Hasher> sectors_;
};

// One file per sector, named by the hex Merkle root.
class DirSectorStore : public SectorStore {
public:
    explicit DirSectorStore(std::string dir) : dir_(std::move(dir)) {}
    // Throws Error{Io}.
    Hash256 put(const std::vector<uint8_t>& sector);
    bool get(const Hash256& root, std::vector<uint8_t>& out) override;
private:
    std::string dir_;
};

} // namespace salvage
