#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// 运行时可调参数
struct RealtimeConfig {
    int frame_skip_rate = 2;        // 每 N 帧处理一帧
    int target_fps = 15;            // 仅作参考，不强制
    double conf_threshold = 0.25;   // 保持提交时的精度，调用检测器时再转 float
    int max_frame_width = 1280;
    int max_frame_height = 720;
    bool enable_thermal = true;
    bool enable_clahe = true;
    bool enable_blur_detection = true;
};

nlohmann::json config_to_json(const RealtimeConfig& config);

// 进程级配置存储。读取返回完整副本，写入整体替换（copy-on-write）
class ConfigStore {
public:
    explicit ConfigStore(const RealtimeConfig& initial = RealtimeConfig());

    RealtimeConfig get() const;

    // 只应用已识别的键，未知键忽略；任一已识别键的值非法时抛 ConfigError，配置保持不变
    RealtimeConfig update(const nlohmann::json& partial);

    // 纯函数版本，applied 返回实际生效的键
    static RealtimeConfig apply(const RealtimeConfig& base,
                                const nlohmann::json& partial,
                                std::vector<std::string>* applied = nullptr);

private:
    mutable std::mutex config_mutex;
    std::shared_ptr<const RealtimeConfig> current;
};

#endif // CONFIG_STORE_HPP
