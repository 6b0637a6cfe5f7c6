#pragma once

#include <stddef.h>

/*
  Fixed-capacity FIFO history.
  - Starts full of zeros, so size() is always the capacity
  - push() evicts the oldest element and appends the newest
  - at(0) is the oldest element, at(size() - 1) the newest
*/
template <typename T, size_t N>
class RollingBuffer {
public:
    RollingBuffer() : head(0) {
        clear();
    }

    void clear() {
        for (size_t i = 0; i < N; i++) {
            data[i] = T();
        }
        head = 0;
    }

    void push(T value) {
        // head is the next write index, which is also the oldest slot
        data[head] = value;
        head = (head + 1) % N;
    }

    size_t size() const { return N; }

    T at(size_t i) const {
        return data[(head + i) % N];
    }

    T last() const {
        return data[(head + N - 1) % N];
    }

    T maxValue() const {
        T m = data[0];
        for (size_t i = 1; i < N; i++) {
            if (data[i] > m) m = data[i];
        }
        return m;
    }

    T minValue() const {
        T m = data[0];
        for (size_t i = 1; i < N; i++) {
            if (data[i] < m) m = data[i];
        }
        return m;
    }

private:
    T data[N];
    size_t head;
};
