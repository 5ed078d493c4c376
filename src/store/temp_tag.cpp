#include "sendme/store/temp_tag.hpp"

namespace sendme::store {

void TempTagSet::acquire(const HashAndFormat& value) {
    std::lock_guard lock(mutex_);
    ++counts_[value];
}

void TempTagSet::release(const HashAndFormat& value) {
    std::lock_guard lock(mutex_);
    auto it = counts_.find(value);
    if (it == counts_.end()) {
        return;
    }
    if (--it->second == 0) {
        counts_.erase(it);
    }
}

std::size_t TempTagSet::count(const HashAndFormat& value) const {
    std::lock_guard lock(mutex_);
    auto it = counts_.find(value);
    return it == counts_.end() ? 0 : it->second;
}

std::vector<HashAndFormat> TempTagSet::live() const {
    std::lock_guard lock(mutex_);
    std::vector<HashAndFormat> values;
    values.reserve(counts_.size());
    for (const auto& [value, _] : counts_) {
        values.push_back(value);
    }
    return values;
}

TempTag::TempTag(HashAndFormat value, const std::shared_ptr<TempTagSet>& owner)
    : value_(value), owner_(owner), active_(owner != nullptr) {
    if (owner) {
        owner->acquire(value_);
    }
}

TempTag::~TempTag() {
    release();
}

TempTag::TempTag(TempTag&& other) noexcept
    : value_(other.value_), owner_(std::move(other.owner_)), active_(other.active_) {
    other.active_ = false;
}

TempTag& TempTag::operator=(TempTag&& other) noexcept {
    if (this != &other) {
        release();
        value_ = other.value_;
        owner_ = std::move(other.owner_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

void TempTag::release() {
    if (!active_) {
        return;
    }
    active_ = false;
    if (auto owner = owner_.lock()) {
        owner->release(value_);
    }
    owner_.reset();
}

} // namespace sendme::store
