#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace webxfer {

// Holds chunks that completed out of order until the next expected index arrives.
class ReorderBuffer {
public:
    explicit ReorderBuffer(const std::uint64_t &first_index = 0);

    // Returns false for an index that was already emitted or is already buffered.
    bool put(const std::uint64_t &index, std::string data);
    bool ready() const;
    // Pops the chunk at the cursor and advances it. Only valid when ready().
    std::string pop();
    std::optional<std::string> tryPop();

    std::uint64_t nextIndex() const;
    size_t buffered() const;
    std::uint64_t bufferedBytes() const;
    void clear();

private:
    std::map<std::uint64_t, std::string> chunks;
    std::uint64_t next_to_emit;
    std::uint64_t buffered_bytes = 0;
};

}
