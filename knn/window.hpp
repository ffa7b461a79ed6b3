#pragma once

#include <cstddef>

#include "instances.hpp"

namespace wknn {

// Training set capped to the newest `capacity` instances; 0 means unbounded.
class TrainingWindow {
    public:
        explicit TrainingWindow(int capacity = 0);

        // Copies data, dropping instances with a missing class, and applies the cap.
        void assign(const Instances &data);
        // Appends inst and returns how many of the oldest instances were evicted.
        std::size_t add(const Instance &inst);
        std::size_t evictOldest(std::size_t count = 1);
        // Shrinking the capacity evicts immediately; returns the eviction count.
        std::size_t setCapacity(int capacity);

        int capacity() const { return this->cap; }
        std::size_t currentSize() const { return this->data.numInstances(); }
        const Instances &instances() const { return this->data; }

    private:
        std::size_t enforceCapacity();

        int cap;
        Instances data;
};

}
