//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/OffHeapArena.cpp
// Purpose: Block allocation, byte access and free-list compaction for the
//          off-heap arena.
// Key invariants: carved_ == sum of all block sizes <= capacity_.
//
//===----------------------------------------------------------------------===//

#include "runtime/OffHeapArena.hpp"

#include <algorithm>
#include <cstring>

namespace pulse::runtime
{

OffHeapArena::OffHeapArena(size_t capacity) : capacity_(capacity) {}

std::optional<BlockId> OffHeapArena::allocate(size_t size)
{
    if (size == 0)
        return std::nullopt;

    for (auto it = freeList_.begin(); it != freeList_.end(); ++it)
    {
        OffHeapBlock &block = blocks_.at(*it);
        if (block.size >= size)
        {
            const BlockId id = *it;
            freeList_.erase(it);
            block.allocated = true;
            block.lastTouched = std::chrono::steady_clock::now();
            std::fill(block.buffer.begin(), block.buffer.end(), std::byte{0});
            return id;
        }
    }

    if (size > capacity_ - carved_)
        return std::nullopt;

    OffHeapBlock block;
    block.id = nextId_++;
    block.size = size;
    block.buffer.assign(size, std::byte{0});
    block.allocated = true;
    block.lastTouched = std::chrono::steady_clock::now();
    carved_ += size;
    const BlockId id = block.id;
    blocks_.emplace(id, std::move(block));
    return id;
}

bool OffHeapArena::deallocate(BlockId id)
{
    auto it = blocks_.find(id);
    if (it == blocks_.end() || !it->second.allocated)
        return false;
    it->second.allocated = false;
    it->second.lastTouched = std::chrono::steady_clock::now();
    freeList_.push_back(id);
    return true;
}

std::optional<std::vector<std::byte>> OffHeapArena::read(BlockId id, size_t offset, size_t length)
{
    auto it = blocks_.find(id);
    if (it == blocks_.end() || !it->second.allocated)
        return std::nullopt;
    OffHeapBlock &block = it->second;
    if (offset > block.size || length > block.size - offset)
        return std::nullopt;
    block.lastTouched = std::chrono::steady_clock::now();
    return std::vector<std::byte>(block.buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                                  block.buffer.begin() +
                                      static_cast<std::ptrdiff_t>(offset + length));
}

bool OffHeapArena::write(BlockId id, size_t offset, std::string_view bytes)
{
    auto it = blocks_.find(id);
    if (it == blocks_.end() || !it->second.allocated)
        return false;
    OffHeapBlock &block = it->second;
    if (offset > block.size || bytes.size() > block.size - offset)
        return false;
    if (!bytes.empty())
        std::memcpy(block.buffer.data() + offset, bytes.data(), bytes.size());
    block.lastTouched = std::chrono::steady_clock::now();
    return true;
}

size_t OffHeapArena::defragment()
{
    std::sort(freeList_.begin(),
              freeList_.end(),
              [this](BlockId a, BlockId b)
              {
                  const size_t sa = blocks_.at(a).size;
                  const size_t sb = blocks_.at(b).size;
                  return sa != sb ? sa < sb : a < b;
              });

    size_t merges = 0;
    size_t i = 0;
    while (i + 1 < freeList_.size())
    {
        OffHeapBlock &current = blocks_.at(freeList_[i]);
        const OffHeapBlock &next = blocks_.at(freeList_[i + 1]);
        if (current.size + next.size > capacity_)
        {
            ++i;
            continue;
        }
        current.size += next.size;
        current.buffer.resize(current.size, std::byte{0});
        blocks_.erase(freeList_[i + 1]);
        freeList_.erase(freeList_.begin() + static_cast<std::ptrdiff_t>(i + 1));
        ++merges;
    }
    return merges;
}

OffHeapUsage OffHeapArena::usage() const
{
    OffHeapUsage u;
    size_t freeListBytes = 0;
    size_t largestFree = 0;
    for (const auto &[id, block] : blocks_)
    {
        if (block.allocated)
        {
            u.allocated += block.size;
        }
        else
        {
            freeListBytes += block.size;
            largestFree = std::max(largestFree, block.size);
        }
    }
    u.total = capacity_;
    u.free = freeListBytes + (capacity_ - carved_);
    u.fragmentation = freeListBytes == 0
                          ? 0.0
                          : 1.0 - static_cast<double>(largestFree) /
                                      static_cast<double>(freeListBytes);
    return u;
}

double OffHeapArena::usagePercent() const
{
    if (capacity_ == 0)
        return 0.0;
    return 100.0 * static_cast<double>(usage().allocated) / static_cast<double>(capacity_);
}

const OffHeapBlock *OffHeapArena::find(BlockId id) const
{
    auto it = blocks_.find(id);
    return it == blocks_.end() ? nullptr : &it->second;
}

void OffHeapArena::reset()
{
    blocks_.clear();
    freeList_.clear();
    carved_ = 0;
}

} // namespace pulse::runtime
