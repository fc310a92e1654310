#pragma once
#include <string>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <utility>
#include "utils/ObserverList.h"

/**
 * @brief 订阅句柄,析构时自动取消订阅
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release) : release(std::move(release)) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept : release(std::move(other.release)) {
        other.release = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            release = std::move(other.release);
            other.release = nullptr;
        }
        return *this;
    }
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset() {
        if (release) {
            auto fn = std::move(release);
            release = nullptr;
            fn();
        }
    }

    bool active() const { return static_cast<bool>(release); }

private:
    std::function<void()> release;
};

/**
 * @brief 编辑器文件信号来源 (保存 / 新建 / 删除 / 切换活动文件 / 重命名)
 */
class IEditorEventSource {
public:
    using PathCallback = std::function<void(const std::string&)>;
    using RenameCallback = std::function<void(const std::string& oldPath, const std::string& newPath)>;

    virtual ~IEditorEventSource() = default;

    virtual Subscription onFileSaved(PathCallback cb) = 0;
    virtual Subscription onFileCreated(PathCallback cb) = 0;
    virtual Subscription onFileDeleted(PathCallback cb) = 0;
    virtual Subscription onActiveFileChanged(PathCallback cb) = 0;
    virtual Subscription onFileRenamed(RenameCallback cb) = 0;
};

/**
 * @brief 进程内的信号中转: 宿主调用 fileSaved() 等方法,订阅者同步收到通知
 *
 * Subscription 可能比 hub 活得更久,所以注册表放在 shared_ptr 中。
 */
class EditorSignalHub : public IEditorEventSource {
public:
    explicit EditorSignalHub(Logger& logger)
        : channels(std::make_shared<Channels>(logger)) {}

    Subscription onFileSaved(PathCallback cb) override { return subscribe(&Channels::saved, std::move(cb)); }
    Subscription onFileCreated(PathCallback cb) override { return subscribe(&Channels::created, std::move(cb)); }
    Subscription onFileDeleted(PathCallback cb) override { return subscribe(&Channels::deleted, std::move(cb)); }
    Subscription onActiveFileChanged(PathCallback cb) override { return subscribe(&Channels::opened, std::move(cb)); }
    Subscription onFileRenamed(RenameCallback cb) override { return subscribe(&Channels::renamed, std::move(cb)); }

    void fileSaved(const std::string& path) { channels->saved.notify(path); }
    void fileCreated(const std::string& path) { channels->created.notify(path); }
    void fileDeleted(const std::string& path) { channels->deleted.notify(path); }
    void activeFileChanged(const std::string& path) { channels->opened.notify(path); }
    void fileRenamed(const std::string& oldPath, const std::string& newPath) {
        channels->renamed.notify(oldPath, newPath);
    }

    size_t subscriberCount() const {
        return channels->saved.size() + channels->created.size() + channels->deleted.size() +
               channels->opened.size() + channels->renamed.size();
    }

private:
    struct Channels {
        explicit Channels(Logger& logger)
            : saved(logger, "EditorSignals"), created(logger, "EditorSignals"),
              deleted(logger, "EditorSignals"), opened(logger, "EditorSignals"),
              renamed(logger, "EditorSignals") {}

        ObserverList<const std::string&> saved;
        ObserverList<const std::string&> created;
        ObserverList<const std::string&> deleted;
        ObserverList<const std::string&> opened;
        ObserverList<const std::string&, const std::string&> renamed;
    };

    std::shared_ptr<Channels> channels;

    template <typename List, typename Cb>
    Subscription subscribe(List Channels::*list, Cb cb) {
        auto id = ((*channels).*list).add(std::move(cb));
        std::weak_ptr<Channels> weak = channels;
        return Subscription([weak, list, id]() {
            if (auto ch = weak.lock()) ((*ch).*list).remove(id);
        });
    }
};
