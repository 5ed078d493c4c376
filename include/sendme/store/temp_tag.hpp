#pragma once

#include "sendme/store/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sendme::store {

/**
 * @brief Reference counts of live temporary tags, shared by a store and the
 *        tags it hands out
 */
class TempTagSet {
public:
    void acquire(const HashAndFormat& value);
    void release(const HashAndFormat& value);

    [[nodiscard]] std::size_t count(const HashAndFormat& value) const;
    [[nodiscard]] std::vector<HashAndFormat> live() const;

private:
    mutable std::mutex mutex_;
    std::map<HashAndFormat, std::size_t> counts_;
};

/**
 * @brief Move-only handle protecting a blob from garbage collection
 *
 * The protection ends when the tag is destroyed or release() is called.
 * A tag may outlive its store; releasing it is then a no-op.
 */
class TempTag {
public:
    TempTag() = default;
    TempTag(HashAndFormat value, const std::shared_ptr<TempTagSet>& owner);
    ~TempTag();

    TempTag(const TempTag&) = delete;
    TempTag& operator=(const TempTag&) = delete;

    TempTag(TempTag&& other) noexcept;
    TempTag& operator=(TempTag&& other) noexcept;

    [[nodiscard]] const Hash& hash() const noexcept { return value_.hash; }
    [[nodiscard]] BlobFormat format() const noexcept { return value_.format; }
    [[nodiscard]] const HashAndFormat& hash_and_format() const noexcept { return value_; }
    [[nodiscard]] bool active() const noexcept { return active_; }

    void release();

private:
    HashAndFormat value_;
    std::weak_ptr<TempTagSet> owner_;
    bool active_ = false;
};

} // namespace sendme::store
