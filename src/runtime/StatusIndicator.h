#pragma once
#include <string>
#include <mutex>
#include <functional>
#include "backend/BackendStatus.h"
#include "utils/ObserverList.h"

enum class IndicatorState {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* toString(IndicatorState state);

struct IndicatorView {
    IndicatorState state = IndicatorState::Disconnected;
    std::string text;
    std::string tooltip;
    std::string detail;
};

/**
 * @brief 状态栏模型
 *
 * 由后端状态与启动进度驱动,只在显示内容变化时通知订阅者。
 */
class StatusIndicator {
public:
    using ChangeCallback = std::function<void(const IndicatorView&)>;

    explicit StatusIndicator(Logger& logger);

    void setState(IndicatorState state, const std::string& detail = "");

    void applyStatus(const BackendStatus& status);

    /**
     * @brief 启动进度:
     *   "Scanning: 120/900" → connecting "Scanning 120/900 files"
     *   "Step ..."          → connecting, 去掉非 ASCII 字符
     *   "Waiting ..."       → connecting "Starting backend..."
     */
    void applyProgress(const std::string& message);

    IndicatorView current() const;
    std::string render() const;

    ObserverList<const IndicatorView&>::Id onChange(ChangeCallback callback);

    static IndicatorView makeView(IndicatorState state, const std::string& detail);

private:
    mutable std::mutex mtx;
    IndicatorView view;
    ObserverList<const IndicatorView&> observers;
};
