#ifndef SKIP_POLICY_HPP
#define SKIP_POLICY_HPP

// 流式接口的跳帧策略：只处理 frameIndex 能被 skipRate 整除的帧
struct SkipPolicy {
    static bool shouldProcess(long long frameIndex, int skipRate) {
        if (skipRate <= 1) {
            return true;
        }
        return frameIndex % skipRate == 0;
    }
};

#endif // SKIP_POLICY_HPP
