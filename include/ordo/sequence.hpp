#pragma once

// Iteration adapter handed to the framework when it fills a tuple, a struct
// or a variable-length sequence.

namespace ordo {

// ============================================================================
// sequence_source - "next element, or exhausted"
// ============================================================================
//
// Holds nothing but a handle to the deserializer, so any number of sources
// (sequential or nested) can share one cursor: each simply sees the
// position the previous reads left behind. A successful next_element()
// advances the cursor by the flattened token count of one element.

template <typename Deserializer>
class sequence_source {
public:
    explicit sequence_source(Deserializer& d) : d_(d) {}

    // Returns false if the input is exhausted; otherwise reads one element
    // at the current position. Errors inside the element propagate.
    template <typename T>
    auto next_element(T& element) -> bool {
        if (d_.input().at_end()) {
            return false;
        }
        read(d_, element);
        return true;
    }

private:
    Deserializer& d_;
};

} // namespace ordo
