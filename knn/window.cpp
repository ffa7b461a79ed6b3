#include <string>

#include "errors.hpp"
#include "window.hpp"

namespace wknn {

TrainingWindow::TrainingWindow(int capacity) : cap(0) {
    this->setCapacity(capacity);
}

void TrainingWindow::assign(const Instances &data){
    this->data = data;
    this->data.deleteWithMissingClass();
    this->enforceCapacity();
}

std::size_t TrainingWindow::add(const Instance &inst){
    this->data.add(inst);
    return this->enforceCapacity();
}

std::size_t TrainingWindow::evictOldest(std::size_t count){
    std::size_t before = this->data.numInstances();
    this->data.deleteOldest(count);
    return before - this->data.numInstances();
}

std::size_t TrainingWindow::setCapacity(int capacity){
    if (capacity < 0)
        throw ConfigurationError("Window size must not be negative, got " + std::to_string(capacity));
    this->cap = capacity;
    return this->enforceCapacity();
}

std::size_t TrainingWindow::enforceCapacity(){
    if (this->cap == 0 || this->data.numInstances() <= static_cast<std::size_t>(this->cap))
        return 0;
    return this->evictOldest(this->data.numInstances() - this->cap);
}

}
