#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace heartlight {

// Regroups arbitrary-length capture chunks into fixed-size sample blocks
class BlockAssembler {
public:
    using BlockHandler = std::function<void(const int16_t* block, int block_size)>;

    explicit BlockAssembler(int block_size);

    // Appends samples; calls on_block once per completed block, oldest first.
    // Returns the number of blocks completed.
    int push(const int16_t* samples, int num_samples, const BlockHandler& on_block);

    void clear() { fill_ = 0; }
    int block_size() const { return static_cast<int>(block_.size()); }
    int pending() const { return fill_; }

private:
    std::vector<int16_t> block_;
    int fill_ = 0;
};

} // namespace heartlight
