#include "runtime/StatusIndicator.h"
#include <regex>

const char* toString(IndicatorState state) {
    switch (state) {
        case IndicatorState::Disconnected: return "disconnected";
        case IndicatorState::Connecting: return "connecting";
        case IndicatorState::Connected: return "connected";
        case IndicatorState::Error: return "error";
    }
    return "disconnected";
}

namespace {
std::string stripNonAscii(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (static_cast<unsigned char>(c) < 0x80) out += c;
    }
    size_t b = out.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = out.find_last_not_of(" \t\r\n");
    return out.substr(b, e - b + 1);
}
} // namespace

StatusIndicator::StatusIndicator(Logger& logger)
    : view(makeView(IndicatorState::Disconnected, "")),
      observers(logger, "StatusIndicator") {}

IndicatorView StatusIndicator::makeView(IndicatorState state, const std::string& detail) {
    IndicatorView v;
    v.state = state;
    v.detail = detail;
    switch (state) {
        case IndicatorState::Disconnected:
            v.text = "Engine Off";
            v.tooltip = "Engine: Disconnected. Run 'start' to launch.";
            break;
        case IndicatorState::Connecting:
            v.text = "Engine...";
            v.tooltip = "Engine: Connecting...";
            break;
        case IndicatorState::Connected:
            v.text = "Engine";
            v.tooltip = "Engine: Connected";
            break;
        case IndicatorState::Error:
            v.text = "Engine Error";
            v.tooltip = "Engine: Error";
            break;
    }
    if (!detail.empty()) {
        if (state == IndicatorState::Connecting) {
            v.tooltip = "Engine: " + detail;
        } else {
            v.tooltip += " - " + detail;
        }
    }
    return v;
}

void StatusIndicator::setState(IndicatorState state, const std::string& detail) {
    IndicatorView next = makeView(state, detail);
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (view.state == next.state && view.detail == next.detail) return;
        view = next;
    }
    observers.notify(next);
}

void StatusIndicator::applyStatus(const BackendStatus& status) {
    switch (status.health) {
        case BackendHealth::Healthy:
            if (status.running) {
                setState(IndicatorState::Connected, status.connectedToExternal ? "external backend" : "");
            } else {
                setState(IndicatorState::Disconnected);
            }
            break;
        case BackendHealth::Starting:
            // 已有启动进度文本时保留
            if (current().state != IndicatorState::Connecting) {
                setState(IndicatorState::Connecting);
            }
            break;
        case BackendHealth::Unhealthy:
            setState(IndicatorState::Error, "Backend unhealthy");
            break;
        case BackendHealth::Stopped:
            setState(IndicatorState::Disconnected);
            break;
    }
}

void StatusIndicator::applyProgress(const std::string& message) {
    if (message.find("Scanning:") != std::string::npos) {
        static const std::regex counts(R"((\d+)/(\d+))");
        std::smatch match;
        if (std::regex_search(message, match, counts)) {
            setState(IndicatorState::Connecting, "Scanning " + match[1].str() + "/" + match[2].str() + " files");
        }
    } else if (message.find("Step ") != std::string::npos) {
        setState(IndicatorState::Connecting, stripNonAscii(message));
    } else if (message.find("Waiting") != std::string::npos) {
        setState(IndicatorState::Connecting, "Starting backend...");
    }
}

IndicatorView StatusIndicator::current() const {
    std::lock_guard<std::mutex> lock(mtx);
    return view;
}

std::string StatusIndicator::render() const {
    IndicatorView v = current();
    if (v.state == IndicatorState::Connecting && !v.detail.empty()) {
        return v.text + " " + v.detail;
    }
    return v.text;
}

ObserverList<const IndicatorView&>::Id StatusIndicator::onChange(ChangeCallback callback) {
    return observers.add(std::move(callback));
}
