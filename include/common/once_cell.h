// =============================================================================
// FILE: include/common/once_cell.h
// =============================================================================
#ifndef COMMON_ONCE_CELL_H
#define COMMON_ONCE_CELL_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace asterisk_live {

// Lazily populated value that can be invalidated.
//
// get_or_init() runs the initializer under an exclusive init mutex, so
// concurrent first callers issue the (remote) fetch once. Reads and reset()
// only take the value mutex and never wait for an in-flight initializer.
// reset() bumps the generation: a fetch that started before the reset is
// returned to its caller but not stored.
template <typename T>
class OnceCell {
public:
    OnceCell() = default;

    // init: () -> std::optional<T>; std::nullopt means "failed, do not cache"
    template <typename Init>
    std::optional<T> get_or_init(Init&& init) {
        {
            std::lock_guard<std::mutex> lk(value_mu_);
            if (value_) return value_;
        }

        std::lock_guard<std::mutex> init_lk(init_mu_);
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lk(value_mu_);
            if (value_) return value_;
            generation = generation_;
        }

        std::optional<T> fetched = init();
        if (!fetched) return std::nullopt;

        std::lock_guard<std::mutex> lk(value_mu_);
        if (generation == generation_) value_ = fetched;
        return fetched;
    }

    std::optional<T> get() const {
        std::lock_guard<std::mutex> lk(value_mu_);
        return value_;
    }

    bool has_value() const {
        std::lock_guard<std::mutex> lk(value_mu_);
        return value_.has_value();
    }

    void reset() {
        std::lock_guard<std::mutex> lk(value_mu_);
        value_.reset();
        ++generation_;
    }

    OnceCell(const OnceCell&) = delete;
    OnceCell& operator=(const OnceCell&) = delete;

private:
    std::mutex init_mu_;
    mutable std::mutex value_mu_;
    std::optional<T> value_;
    uint64_t generation_ = 0;
};

} // namespace asterisk_live
#endif // COMMON_ONCE_CELL_H
