#ifndef CORE_FILE_CACHE_HPP
#define CORE_FILE_CACHE_HPP

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "hftypes.hpp"


namespace hf {

/* A small least-recently-used cache of parsed files, shared between threads.
 * Entries are immutable once loaded, so handed-out pointers stay valid after
 * eviction. Loading happens under the cache lock, which also serializes
 * access to non-reentrant decoding libraries.
 */
template<typename T>
class FileCache {
    struct Entry {
        std::string mFilename;
        std::shared_ptr<const T> mData;
        u64 mLastUse{};
    };

    mutable std::mutex mLock;
    std::vector<Entry> mEntries;
    usize mCapacity{};
    u64 mUseCounter{};

public:
    explicit FileCache(usize const capacity) : mCapacity{std::max(capacity, 1_uz)} { }

    template<typename F>
    auto get(const std::string &filename, F&& loader) -> std::shared_ptr<const T>
    {
        auto const lock = std::lock_guard{mLock};
        auto iter = std::ranges::lower_bound(mEntries, filename, std::less{}, &Entry::mFilename);
        if(iter != mEntries.end() && iter->mFilename == filename)
        {
            iter->mLastUse = ++mUseCounter;
            return iter->mData;
        }

        auto data = std::shared_ptr<const T>{std::forward<F>(loader)()};
        if(mEntries.size() >= mCapacity)
        {
            auto oldest = std::ranges::min_element(mEntries, std::less{}, &Entry::mLastUse);
            mEntries.erase(oldest);
            iter = std::ranges::lower_bound(mEntries, filename, std::less{}, &Entry::mFilename);
        }
        mEntries.emplace(iter, Entry{filename, data, ++mUseCounter});
        return data;
    }

    void clear()
    {
        auto const lock = std::lock_guard{mLock};
        mEntries.clear();
    }

    [[nodiscard]] auto size() const -> usize
    {
        auto const lock = std::lock_guard{mLock};
        return mEntries.size();
    }
};

} // namespace hf

#endif /* CORE_FILE_CACHE_HPP */
