#include "../hpp/DetectionAggregator.hpp"
#include <cmath>
#include <trantor/utils/Logger.h>

// ==================== DetectionAggregator 实现 ====================
DetectionAggregator::DetectionAggregator(const AnimalFactTable& facts)
    : facts(facts) {
}

DetectionSet DetectionAggregator::build(const std::vector<RawDetection>& rawOutputs) const {
    DetectionSet result;
    result.detections.reserve(rawOutputs.size());

    for (const auto& raw : rawOutputs) {
        std::string reason;
        if (!isValid(raw, &reason)) {
            LOG_WARN << "Dropping detection '" << raw.label << "': " << reason;
            continue;
        }
        result.detections.push_back(enrich(raw));

        // 严格大于，保证并列时保留最先出现的
        const size_t idx = result.detections.size() - 1;
        if (!result.bestIndex || result.detections[idx].confidence > result.detections[*result.bestIndex].confidence) {
            result.bestIndex = idx;
        }
    }
    return result;
}

bool DetectionAggregator::isValid(const RawDetection& raw, std::string* reason) {
    auto fail = [reason](const char* why) {
        if (reason) *reason = why;
        return false;
    };
    if (raw.label.empty()) {
        return fail("empty label");
    }
    if (!std::isfinite(raw.confidence) || raw.confidence < 0.0f || raw.confidence > 1.0f) {
        return fail("confidence outside [0, 1]");
    }
    if (!std::isfinite(raw.x1) || !std::isfinite(raw.y1) || !std::isfinite(raw.x2) || !std::isfinite(raw.y2)) {
        return fail("non-finite bounding box");
    }
    if (raw.x2 < raw.x1 || raw.y2 < raw.y1) {
        return fail("inverted bounding box");
    }
    return true;
}

Detection DetectionAggregator::enrich(const RawDetection& raw) const {
    Detection det;
    det.label = raw.label;
    det.confidence = raw.confidence;
    det.bbox[0] = raw.x1;
    det.bbox[1] = raw.y1;
    det.bbox[2] = raw.x2;
    det.bbox[3] = raw.y2;
    det.details = facts.lookup(raw.label);
    return det;
}
