//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/OffHeapArena.hpp
// Purpose: Fixed-capacity block arena used for objects promoted out of the
//          managed heap.
// Key invariants: usage().allocated + usage().free == usage().total at all
//                 times; block ids are never reused for a different block.
// Ownership/Lifetime: The arena owns every block buffer; callers hold ids.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace pulse::runtime
{

/// @brief Identifier of an off-heap block; 0 is never issued.
using BlockId = uint64_t;

/// @brief One carved region of the arena.
struct OffHeapBlock
{
    BlockId id = 0;
    size_t size = 0;
    std::vector<std::byte> buffer;
    bool allocated = false;
    std::chrono::steady_clock::time_point lastTouched{};
};

/// @brief Arena accounting in bytes.
struct OffHeapUsage
{
    size_t allocated = 0;     ///< Bytes in allocated blocks
    size_t free = 0;          ///< Free-list bytes plus never-carved capacity
    size_t total = 0;         ///< Arena capacity
    double fragmentation = 0; ///< 1 - largest free block / free-list bytes
};

/// @brief Free-list block allocator with first-fit reuse.
class OffHeapArena
{
  public:
    static constexpr size_t kDefaultCapacity = 512 * 1024;

    explicit OffHeapArena(size_t capacity = kDefaultCapacity);

    /// @brief Allocate @p size bytes.
    /// @details Reuses the first free block at least @p size bytes long
    ///          (keeping its id and size), otherwise carves a new block from
    ///          the uncarved remainder.
    /// @return Block id, or nullopt when neither is possible or size is 0.
    std::optional<BlockId> allocate(size_t size);

    /// @brief Return block @p id to the free list.
    /// @return False when @p id is unknown or already free.
    bool deallocate(BlockId id);

    /// @brief Copy @p length bytes at @p offset out of an allocated block.
    std::optional<std::vector<std::byte>> read(BlockId id, size_t offset, size_t length);

    /// @brief Copy @p bytes into an allocated block at @p offset.
    /// @return False when the block is unknown, free, or too small.
    bool write(BlockId id, size_t offset, std::string_view bytes);

    /// @brief Merge free blocks, smallest first, while the merged size fits.
    /// @return Number of merges performed.
    size_t defragment();

    /// @brief Current accounting.
    [[nodiscard]] OffHeapUsage usage() const;

    /// @brief Allocated bytes as a percentage of capacity.
    [[nodiscard]] double usagePercent() const;

    [[nodiscard]] size_t capacity() const
    {
        return capacity_;
    }

    /// @brief Block @p id, or null.
    const OffHeapBlock *find(BlockId id) const;

    /// @brief Number of carved blocks (allocated or free).
    [[nodiscard]] size_t blockCount() const
    {
        return blocks_.size();
    }

    /// @brief Number of blocks on the free list.
    [[nodiscard]] size_t freeBlockCount() const
    {
        return freeList_.size();
    }

    /// @brief Release every block; ids keep increasing.
    void reset();

  private:
    size_t capacity_;
    size_t carved_ = 0;
    BlockId nextId_ = 1;
    std::map<BlockId, OffHeapBlock> blocks_;
    std::vector<BlockId> freeList_;
};

} // namespace pulse::runtime
