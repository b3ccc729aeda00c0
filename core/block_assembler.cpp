#include "block_assembler.hpp"
#include <algorithm>
#include <cstring>

namespace heartlight {

BlockAssembler::BlockAssembler(int block_size)
    : block_(block_size > 0 ? block_size : 1, 0) {}

int BlockAssembler::push(const int16_t* samples, int num_samples, const BlockHandler& on_block) {
    if (!samples || num_samples <= 0) return 0;
    const int size = static_cast<int>(block_.size());
    int completed = 0;
    int offset = 0;
    while (offset < num_samples) {
        const int take = std::min(size - fill_, num_samples - offset);
        std::memcpy(block_.data() + fill_, samples + offset, static_cast<size_t>(take) * sizeof(int16_t));
        fill_ += take;
        offset += take;
        if (fill_ == size) {
            if (on_block) on_block(block_.data(), size);
            fill_ = 0;
            ++completed;
        }
    }
    return completed;
}

} // namespace heartlight
