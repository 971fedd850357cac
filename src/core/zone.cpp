/// @file src/core/zone.cpp
/// @brief Zone and IndicatorContext.

#include "zonal/zone.hpp"
#include "zonal/errors.hpp"
#include "zonal/features.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace zonal {

std::string IndicatorContext::to_string() const {
    return fmt::format("IndicatorContext{{indicator={}, strategy={}, signal_line={}, rules={}}}",
                       detection_indicator.value_or("null"),
                       detection_strategy.value_or("null"),
                       signal_line.value_or("null"),
                       zonal::to_string(detection_rules));
}

Zone::Zone(int id,
           ZoneType type,
           TableSlice data,
           std::shared_ptr<const IndicatorContext> context)
    : id_(id), type_(type), data_(std::move(data)), context_(std::move(context)) {
    if (!context_) {
        throw DataError(fmt::format("zone {}: indicator context must not be null", id));
    }
}

void Zone::set_features(ZoneFeatures features) {
    if (features_) {
        throw std::logic_error(fmt::format("zone {}: features are already set", id_));
    }
    features_ = std::make_shared<const ZoneFeatures>(std::move(features));
}

std::string Zone::to_string() const {
    return fmt::format("Zone{{id={}, type={}, [{}, {}], t=[{}, {}], duration={}, indicator={}}}",
                       id_, zonal::to_string(type_), start_idx(), end_idx(),
                       start_time(), end_time(), duration(),
                       primary_indicator_column().value_or("null"));
}

}  // namespace zonal
