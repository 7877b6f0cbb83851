#pragma once

#include "polytess/contour/contour_store.h"
#include "polytess/core/types.h"
#include "polytess/output/tess_result.h"

namespace polytess {

struct TessState {
    TessState() = default;

    TessState(const TessState&) = delete;
    TessState& operator=(const TessState&) = delete;

    ContourStore contours;
    TessOptions options{};

    TessResult result{};
    TessStats stats{};
    std::uint32_t runCount{0};

    TessError lastError{TessError::Ok};
    bool disposed{false};
};

} // namespace polytess
