#pragma once

#include <mutex>
#include <optional>
#include <utility>

namespace maestro::util {

// Write-once cell. The first successful get_or_init() stores the value; later
// calls return it without running the initializer. If the initializer throws,
// the cell stays empty and the next call retries.
template <typename T>
class LazyCell {
public:
    LazyCell() = default;
    LazyCell(const LazyCell&) = delete;
    LazyCell& operator=(const LazyCell&) = delete;

    LazyCell(LazyCell&& other) {
        std::lock_guard<std::mutex> lock(other.mutex_);
        value_ = std::move(other.value_);
        other.value_.reset();
    }

    template <typename F>
    const T& get_or_init(F&& init) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!value_) {
            value_.emplace(std::forward<F>(init)());
        }
        return *value_;
    }

    bool is_initialized() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

private:
    mutable std::mutex mutex_;
    mutable std::optional<T> value_;
};

}  // namespace maestro::util
