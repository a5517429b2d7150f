// Fuzz target for CBlock and AccumulatorState deserialization
// Tests block parsing from untrusted storage or peers

#include "accumulator/reed_solomon.hpp"
#include "primitives/block.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

using namespace foldchain;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::span<const uint8_t> input(data, size);

    // Deserialize should handle any input gracefully without crashing
    CBlock block;
    if (block.DeserializeBlock(input)) {
        // Accepted encodings are canonical
        auto serialized = block.SerializeBlock();
        CBlock block2;
        if (!block2.DeserializeBlock(serialized) || block2.GetHash() != block.GetHash()) {
            __builtin_trap();
        }
        (void)accumulator::IsWellFormed(block.accumulator);
    }

    accumulator::AccumulatorState state;
    size_t consumed = 0;
    if (accumulator::AccumulatorState::Deserialize(input, state, consumed)) {
        if (consumed > size || state.Serialize().size() != consumed) {
            __builtin_trap();
        }
    }

    return 0;
}
