#pragma once

#include <array>
#include <cstddef>

/**
 * RingBuffer
 * --------------------
 * Fixed-capacity FIFO of value types. Pushing onto a full buffer
 * overwrites the oldest element. Index 0 is the oldest element.
 */

template <typename T, std::size_t Capacity>
class RingBuffer
{
    static_assert(Capacity > 0, "RingBuffer needs a non-zero capacity");

public:
    static constexpr std::size_t capacity() { return Capacity; }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == Capacity; }

    void push_back(const T &value)
    {
        data_[(head_ + size_) % Capacity] = value;
        if (size_ < Capacity)
            ++size_;
        else
            head_ = (head_ + 1) % Capacity;
    }

    void clear()
    {
        head_ = 0;
        size_ = 0;
    }

    // Caller checks bounds
    const T &operator[](std::size_t index) const
    {
        return data_[(head_ + index) % Capacity];
    }

    const T &front() const { return (*this)[0]; }
    const T &back() const { return (*this)[size_ - 1]; }

private:
    std::array<T, Capacity> data_{};
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};
