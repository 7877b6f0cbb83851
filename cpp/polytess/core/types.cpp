#include "polytess/core/types.h"

namespace polytess {

const char* toString(WindingRule rule) noexcept {
    switch (rule) {
        case WindingRule::Odd: return "Odd";
        case WindingRule::NonZero: return "NonZero";
        case WindingRule::Positive: return "Positive";
        case WindingRule::Negative: return "Negative";
        case WindingRule::AbsGeqTwo: return "AbsGeqTwo";
    }
    return "Unknown";
}

const char* toString(ElementType type) noexcept {
    switch (type) {
        case ElementType::Polygons: return "Polygons";
        case ElementType::ConnectedPolygons: return "ConnectedPolygons";
        case ElementType::BoundaryContours: return "BoundaryContours";
    }
    return "Unknown";
}

const char* toString(TessError error) noexcept {
    switch (error) {
        case TessError::Ok: return "OK";
        case TessError::OutOfMemory: return "OutOfMemory";
        case TessError::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}

bool isValid(WindingRule rule) noexcept {
    return static_cast<std::uint32_t>(rule) <= static_cast<std::uint32_t>(WindingRule::AbsGeqTwo);
}

bool isValid(ElementType type) noexcept {
    return static_cast<std::uint32_t>(type) <= static_cast<std::uint32_t>(ElementType::BoundaryContours);
}

} // namespace polytess
