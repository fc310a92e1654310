#include "runtime/EventStream.h"
#include "utils/Logger.h"

EventStream::EventStream(IEditorEventSource& source,
                         IBranchProvider& branches,
                         Logger& logger,
                         std::chrono::milliseconds branchPollInterval,
                         SourceFileFilter filter)
    : source(source),
      branches(branches),
      logger(logger),
      branchPollInterval(branchPollInterval),
      filter(std::move(filter)),
      listeners(logger, "EventStream") {}

EventStream::~EventStream() {
    stop();
}

void EventStream::start(const std::string& workspace) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (running) return;
        running = true;
        workspacePath = workspace;
    }

    std::vector<Subscription> subs;
    subs.push_back(source.onFileSaved([this](const std::string& p) { emit(p, ChangeType::Saved); }));
    subs.push_back(source.onFileCreated([this](const std::string& p) { emit(p, ChangeType::Created); }));
    subs.push_back(source.onFileDeleted([this](const std::string& p) { emit(p, ChangeType::Deleted); }));
    subs.push_back(source.onActiveFileChanged([this](const std::string& p) { emit(p, ChangeType::Opened); }));
    subs.push_back(source.onFileRenamed([this](const std::string& oldPath, const std::string& newPath) {
        emit(newPath, ChangeType::Renamed, {{"old_path", oldPath}});
    }));
    {
        std::lock_guard<std::mutex> lock(mtx);
        subscriptions = std::move(subs);
    }

    branchPoll.startPeriodic(branchPollInterval, [this]() { pollGitBranch(); }, true);

    logger.info("[EventStream] Started - capturing file events");
}

void EventStream::stop() {
    std::vector<Subscription> subs;
    bool wasRunning;
    {
        std::lock_guard<std::mutex> lock(mtx);
        wasRunning = running;
        running = false;
        subs = std::move(subscriptions);
        subscriptions.clear();
    }
    // Subscription 析构时退订,不持有 mtx
    subs.clear();
    branchPoll.cancel();
    if (wasRunning) {
        logger.info("[EventStream] Stopped");
    }
}

ObserverList<const ChangeEvent&>::Id EventStream::onEvent(EventCallback callback) {
    return listeners.add(std::move(callback));
}

void EventStream::removeListener(ObserverList<const ChangeEvent&>::Id id) {
    listeners.remove(id);
}

EventStream::Stats EventStream::getStats() const {
    std::lock_guard<std::mutex> lock(mtx);
    Stats stats;
    stats.running = running;
    stats.eventCount = eventCount;
    stats.gitBranch = gitBranch;
    return stats;
}

bool EventStream::isRunning() const {
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}

void EventStream::emit(const std::string& filePath, ChangeType type, nlohmann::json metadata) {
    if (!filter.accepts(filePath)) return;

    ChangeEvent event;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running) return;
        ++eventCount;
        event.workspacePath = workspacePath;
        event.gitBranch = gitBranch;
    }
    event.filePath = filePath;
    event.changeType = type;
    event.timestampMillis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    event.metadata = std::move(metadata);

    logger.debug(std::string("[EventStream] ") + toString(type) + " " + filePath);
    listeners.notify(event);
}

void EventStream::pollGitBranch() {
    std::string workspace;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running) return;
        workspace = workspacePath;
    }

    std::string branch;
    try {
        branch = branches.currentBranch(workspace);
    } catch (const std::exception& e) {
        logger.debug(std::string("[EventStream] Branch lookup failed: ") + e.what());
        return;
    }

    std::string previous;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (branch == gitBranch) return;
        previous = gitBranch;
        gitBranch = branch;
    }
    if (!previous.empty()) {
        logger.info("[EventStream] Git branch changed: " + previous + " -> " + branch);
    }
}
