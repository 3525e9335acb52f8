#include "../hpp/ConfigStore.hpp"
#include "../../infer/hpp/VisionErrors.hpp"
#include <trantor/utils/Logger.h>

using json = nlohmann::json;

namespace {

constexpr int kMaxFrameDimension = 16384;

int require_int(const json& value, const std::string& key, int min_value, int max_value) {
    if (!value.is_number_integer()) {
        throw ConfigError(key + " must be an integer");
    }
    const long long v = value.get<long long>();
    if (v < min_value || v > max_value) {
        throw ConfigError(key + " must be in [" + std::to_string(min_value) + ", " +
                          std::to_string(max_value) + "]");
    }
    return static_cast<int>(v);
}

bool require_bool(const json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw ConfigError(key + " must be a boolean");
    }
    return value.get<bool>();
}

} // namespace

json config_to_json(const RealtimeConfig& config) {
    json j;
    j["frame_skip_rate"] = config.frame_skip_rate;
    j["target_fps"] = config.target_fps;
    j["conf_threshold"] = config.conf_threshold;
    j["max_frame_size"] = json::array({config.max_frame_width, config.max_frame_height});
    j["enable_thermal"] = config.enable_thermal;
    j["enable_clahe"] = config.enable_clahe;
    j["enable_blur_detection"] = config.enable_blur_detection;
    return j;
}

ConfigStore::ConfigStore(const RealtimeConfig& initial)
    : current(std::make_shared<const RealtimeConfig>(initial)) {
}

RealtimeConfig ConfigStore::get() const {
    std::shared_ptr<const RealtimeConfig> snapshot;
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        snapshot = current;
    }
    return *snapshot;
}

RealtimeConfig ConfigStore::update(const json& partial) {
    std::lock_guard<std::mutex> lock(config_mutex);
    std::vector<std::string> applied;
    auto next = std::make_shared<const RealtimeConfig>(apply(*current, partial, &applied));
    current = next;
    for (const auto& key : applied) {
        LOG_INFO << "Updated config: " << key << " = " << partial.at(key).dump();
    }
    return *next;
}

RealtimeConfig ConfigStore::apply(const RealtimeConfig& base, const json& partial,
                                  std::vector<std::string>* applied) {
    if (!partial.is_object()) {
        throw ConfigError("Configuration update must be a JSON object");
    }
    RealtimeConfig next = base;
    for (auto it = partial.begin(); it != partial.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "frame_skip_rate") {
            next.frame_skip_rate = require_int(value, key, 1, 1000);
        } else if (key == "target_fps") {
            next.target_fps = require_int(value, key, 1, 1000);
        } else if (key == "conf_threshold") {
            if (!value.is_number()) {
                throw ConfigError(key + " must be a number");
            }
            const double v = value.get<double>();
            if (!(v >= 0.0 && v <= 1.0)) {
                throw ConfigError(key + " must be in [0, 1]");
            }
            next.conf_threshold = v;
        } else if (key == "max_frame_size") {
            if (!value.is_array() || value.size() != 2) {
                throw ConfigError(key + " must be [width, height]");
            }
            next.max_frame_width = require_int(value[0], key + "[0]", 1, kMaxFrameDimension);
            next.max_frame_height = require_int(value[1], key + "[1]", 1, kMaxFrameDimension);
        } else if (key == "enable_thermal") {
            next.enable_thermal = require_bool(value, key);
        } else if (key == "enable_clahe") {
            next.enable_clahe = require_bool(value, key);
        } else if (key == "enable_blur_detection") {
            next.enable_blur_detection = require_bool(value, key);
        } else {
            continue;  // 未知键忽略
        }
        if (applied) applied->push_back(key);
    }
    return next;
}
