/*
 * HwmonFanControl — TemperatureAggregator (implementation)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/TemperatureAggregator.hpp"
#include "include/Log.hpp"

#include <utility>

namespace hfc {

TemperatureAggregator::TemperatureAggregator(std::vector<std::unique_ptr<SensorSource>> sources)
: sources_(std::move(sources)),
  failing_(sources_.size(), false) {}

std::optional<double> TemperatureAggregator::combine(const std::vector<TemperatureReading>& readings,
                                                     std::string* hottest) {
    std::optional<double> best;
    for (const auto& r : readings) {
        if (!r.ok) continue;
        if (!best || r.valueC > *best) {
            best = r.valueC;
            if (hottest) *hottest = r.source;
        }
    }
    return best;
}

AggregateResult TemperatureAggregator::collect() {
    AggregateResult out;
    out.readings.reserve(sources_.size());

    for (size_t i = 0; i < sources_.size(); ++i) {
        TemperatureReading r = sources_[i]->read();

        // warn once per failure streak; keep the rest at debug
        if (!r.ok) {
            if (!failing_[i]) {
                LOG_WARN("aggregate: %s (%s) read failed: %s",
                         r.source.c_str(), sensorCategoryName(r.category), r.error.c_str());
            } else {
                LOG_DEBUG("aggregate: %s still failing: %s", r.source.c_str(), r.error.c_str());
            }
            failing_[i] = true;
        } else {
            if (failing_[i]) {
                LOG_INFO("aggregate: %s recovered (%.1f degC)", r.source.c_str(), r.valueC);
            }
            failing_[i] = false;
            LOG_DEBUG("aggregate: %s = %.1f degC", r.source.c_str(), r.valueC);
        }
        out.readings.push_back(std::move(r));
    }

    out.controlTemp = combine(out.readings, &out.hottest);
    if (!out.controlTemp) {
        LOG_WARN("aggregate: no data (all %zu sources failed)", sources_.size());
    }
    return out;
}

} // namespace hfc
