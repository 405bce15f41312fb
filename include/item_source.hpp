#pragma once
#include "sermon.hpp"
#include <optional>

// Pull-based sequence of descriptors. Not safe for concurrent callers.
class ItemSource {
public:
    virtual ~ItemSource() = default;

    virtual std::optional<ItemDescriptor> next() = 0;
};
