#ifndef TOKENVAULT_DETECTION_ENTITY_DETECTOR_HPP
#define TOKENVAULT_DETECTION_ENTITY_DETECTOR_HPP

#include <map>
#include <string>
#include <vector>
#include "core/entity.hpp"
#include "core/errors.hpp"

/**
 * @file entity_detector.hpp
 * @brief The consumed detection capability and the region router in front of it.
 *
 * A detector returns entities with canonical types and byte offsets into the
 * text it was given. Detectors may be slow (network calls); the engine never
 * calls them while holding the registry lock.
 */

namespace tokenvault {
namespace detection {

/**
 * @class EntityDetector
 * @brief detect(text, types) -> entities. An empty @p types means "all types".
 *
 * Implementations report failures by throwing; the engine turns any
 * exception into core::DetectionError.
 */
class EntityDetector
{
public:
    virtual ~EntityDetector() = default;

    virtual std::vector<core::Entity> detect(const std::string &text,
                                             const std::vector<std::string> &types) = 0;

    virtual std::string name() const = 0;
};

/**
 * @class DetectorRouter
 * @brief Picks the detector instance serving a region ("eu", "us", ...).
 *
 * Detectors are not owned. Regions without a dedicated detector fall back
 * to the default one.
 */
class DetectorRouter
{
public:
    DetectorRouter() = default;

    explicit DetectorRouter(EntityDetector *defaultDetector)
        : default_(defaultDetector)
    {
    }

    void setDefault(EntityDetector *detector) { default_ = detector; }

    void addRegion(const std::string &region, EntityDetector *detector) { regions_[region] = detector; }

    /**
     * @throw core::DetectionError if no detector serves the region.
     */
    EntityDetector &route(const std::string &region) const
    {
        auto it = regions_.find(region);
        if (it != regions_.end() && it->second) {
            return *it->second;
        }
        if (!default_) {
            throw core::DetectionError("DetectorRouter: no detector for region '" + region + "'");
        }
        return *default_;
    }

private:
    EntityDetector *default_ = nullptr;
    std::map<std::string, EntityDetector *> regions_;
};

} // namespace detection
} // namespace tokenvault

#endif // TOKENVAULT_DETECTION_ENTITY_DETECTOR_HPP
