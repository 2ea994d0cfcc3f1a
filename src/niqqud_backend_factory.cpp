#include "internal/backends/niqqud_backend.hpp"

#include <memory>
#include <vector>

#include "internal/backends/nakdimon/nakdimon_backend.hpp"

namespace niqqud {

// =============================================================================
// NiqqudBackendFactory 实现
// =============================================================================

std::unique_ptr<INiqqudBackend> NiqqudBackendFactory::create(BackendType type) {
    switch (type) {
        case BackendType::NAKDIMON:
            return std::make_unique<NakdimonBackend>();

        case BackendType::CUSTOM:
            // 由调用方通过 ModelGateway 注入
            return nullptr;

        default:
            return nullptr;
    }
}

bool NiqqudBackendFactory::isAvailable(BackendType type) {
    switch (type) {
        case BackendType::NAKDIMON:
            return true;

        default:
            return false;
    }
}

std::vector<BackendType> NiqqudBackendFactory::getAvailableBackends() {
    return {
        BackendType::NAKDIMON
    };
}

}  // namespace niqqud
