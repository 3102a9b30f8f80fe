#include "webxfer/reorder_buffer.hpp"

#include <stdexcept>

namespace webxfer {

ReorderBuffer::ReorderBuffer(const std::uint64_t &first_index) : next_to_emit(first_index) {}

bool ReorderBuffer::put(const std::uint64_t &index, std::string data) {
    if (index < this->next_to_emit || this->chunks.contains(index)) {
        return false;
    }
    this->buffered_bytes += data.size();
    this->chunks.emplace(index, std::move(data));
    return true;
}

bool ReorderBuffer::ready() const {
    return !this->chunks.empty() && this->chunks.begin()->first == this->next_to_emit;
}

std::string ReorderBuffer::pop() {
    if (!this->ready()) {
        throw std::logic_error("reorder_buffer: chunk " + std::to_string(this->next_to_emit) + " is not buffered");
    }
    auto it = this->chunks.begin();
    std::string data = std::move(it->second);
    this->chunks.erase(it);
    this->buffered_bytes -= data.size();
    this->next_to_emit++;
    return data;
}

std::optional<std::string> ReorderBuffer::tryPop() {
    if (!this->ready()) {
        return std::nullopt;
    }
    return this->pop();
}

std::uint64_t ReorderBuffer::nextIndex() const {
    return this->next_to_emit;
}

size_t ReorderBuffer::buffered() const {
    return this->chunks.size();
}

std::uint64_t ReorderBuffer::bufferedBytes() const {
    return this->buffered_bytes;
}

void ReorderBuffer::clear() {
    this->chunks.clear();
    this->buffered_bytes = 0;
}

}
