#pragma once
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hybridmem {

// Fixed-capacity circular buffer. Pushing into a full buffer overwrites the
// oldest element (FIFO eviction). Index 0 is always the oldest element.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : slots_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    size_t capacity() const { return slots_.size(); }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == slots_.size(); }

    // Returns true if an element was evicted to make room.
    bool push_back(T value) {
        if (full()) {
            slots_[head_] = std::move(value);
            head_ = (head_ + 1) % slots_.size();
            return true;
        }
        slots_[(head_ + size_) % slots_.size()] = std::move(value);
        size_++;
        return false;
    }

    T& operator[](size_t i) { return slots_[(head_ + i) % slots_.size()]; }
    const T& operator[](size_t i) const { return slots_[(head_ + i) % slots_.size()]; }

    const T& back() const { return (*this)[size_ - 1]; }

    // Drop every element for which pred returns true, keeping the order of survivors.
    template <typename Pred>
    size_t remove_if(Pred pred) {
        std::vector<bool> drop(size_, false);
        size_t removed = 0;
        for (size_t i = 0; i < size_; i++) {
            if (pred(static_cast<const T&>((*this)[i]))) {
                drop[i] = true;
                removed++;
            }
        }
        if (removed == 0) return 0;

        std::vector<T> kept;
        kept.reserve(size_ - removed);
        for (size_t i = 0; i < size_; i++) {
            if (!drop[i]) kept.push_back(std::move((*this)[i]));
        }
        clear();
        for (auto& v : kept) push_back(std::move(v));
        return removed;
    }

    void clear() {
        for (auto& slot : slots_) slot = T{};
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> slots_;
    size_t head_ = 0;
    size_t size_ = 0;
};

} // namespace hybridmem
