#include "backend/ProcessLauncher.h"
#include "utils/Logger.h"
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

struct SharedState {
    std::mutex mtx;
    std::condition_variable cv;
    bool exited = false;
    bool drained = false;
    int exitCode = 0;

    // 回调可能在自身内部释放句柄,所以用递归锁并调用副本
    std::recursive_mutex cbMtx;
    ProcessCallbacks callbacks;
};

bool isBlank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void deliverLine(SharedState& st, std::string line, bool isErr) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (isBlank(line)) return;
    std::lock_guard<std::recursive_mutex> lock(st.cbMtx);
    auto cb = isErr ? st.callbacks.onStderrLine : st.callbacks.onStdoutLine;
    if (cb) cb(line);
}

void emitLines(SharedState& st, std::string& buffer, bool flush, bool isErr) {
    size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
        deliverLine(st, buffer.substr(0, pos), isErr);
        buffer.erase(0, pos + 1);
    }
    if (flush && !buffer.empty()) {
        deliverLine(st, buffer, isErr);
        buffer.clear();
    }
}

void readerLoop(std::shared_ptr<SharedState> st, int outFd, int errFd) {
    int fds[2] = {outFd, errFd};
    std::string buffers[2];
    char temp[4096];

    while (fds[0] >= 0 || fds[1] >= 0) {
        pollfd pfds[2];
        int idx[2];
        nfds_t n = 0;
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[n].fd = fds[i];
            pfds[n].events = POLLIN;
            pfds[n].revents = 0;
            idx[n] = i;
            ++n;
        }

        int rc = ::poll(pfds, n, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            // 进程已退出且管道空闲 (子孙进程可能仍持有写端)
            std::lock_guard<std::mutex> lock(st->mtx);
            if (st->exited) break;
            continue;
        }

        for (nfds_t k = 0; k < n; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = idx[k];
            ssize_t r = ::read(fds[i], temp, sizeof(temp));
            if (r > 0) {
                buffers[i].append(temp, temp + r);
                emitLines(*st, buffers[i], false, i == 1);
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i]);
                fds[i] = -1;
            }
        }
    }

    for (int i = 0; i < 2; ++i) {
        emitLines(*st, buffers[i], true, i == 1);
        if (fds[i] >= 0) ::close(fds[i]);
    }
    {
        std::lock_guard<std::mutex> lock(st->mtx);
        st->drained = true;
    }
    st->cv.notify_all();
}

void waiterLoop(std::shared_ptr<SharedState> st, pid_t pid) {
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);

    int code = -1;
    if (r == pid) {
        if (WIFEXITED(status)) {
            code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            code = 128 + WTERMSIG(status);
        }
    }

    {
        std::unique_lock<std::mutex> lock(st->mtx);
        st->exited = true;
        st->exitCode = code;
        st->cv.notify_all();
        st->cv.wait_for(lock, std::chrono::seconds(1), [&] { return st->drained; });
    }

    std::lock_guard<std::recursive_mutex> lock(st->cbMtx);
    auto cb = st->callbacks.onExit;
    if (cb) cb(code);
}

class PosixProcessHandle : public IProcessHandle {
public:
    PosixProcessHandle(pid_t pid, std::shared_ptr<SharedState> st)
        : childPid(pid), st(std::move(st)) {}

    ~PosixProcessHandle() override {
        detachCallbacks();
    }

    int pid() const override { return static_cast<int>(childPid); }

    bool isRunning() const override {
        std::lock_guard<std::mutex> lock(st->mtx);
        return !st->exited;
    }

    void terminate() override { sendSignal(SIGTERM); }
    void kill() override { sendSignal(SIGKILL); }

    bool waitForExit(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(st->mtx);
        return st->cv.wait_for(lock, timeout, [&] { return st->exited; });
    }

    void detachCallbacks() override {
        std::lock_guard<std::recursive_mutex> lock(st->cbMtx);
        st->callbacks = ProcessCallbacks{};
    }

private:
    pid_t childPid;
    std::shared_ptr<SharedState> st;

    void sendSignal(int sig) {
        // 已回收的 pid 可能被复用,退出后不再发信号
        std::lock_guard<std::mutex> lock(st->mtx);
        if (!st->exited) ::kill(childPid, sig);
    }
};

void closePipe(int p[2]) {
    if (p[0] >= 0) ::close(p[0]);
    if (p[1] >= 0) ::close(p[1]);
    p[0] = p[1] = -1;
}

} // namespace

PosixProcessLauncher::PosixProcessLauncher(Logger& logger) : logger(logger) {}

std::unique_ptr<IProcessHandle> PosixProcessLauncher::launch(const LaunchSpec& spec, ProcessCallbacks callbacks) {
    if (spec.executable.empty()) {
        logger.error("[Launcher] Empty executable path");
        return nullptr;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execPipe, O_CLOEXEC) != 0) {
        logger.error(std::string("[Launcher] pipe() failed: ") + std::strerror(errno));
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(execPipe);
        return nullptr;
    }

    // fork 之后子进程只调用 async-signal-safe 函数,argv 提前准备
    std::vector<std::string> args;
    args.push_back(spec.executable);
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid == 0) {
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        if (!spec.workingDir.empty() && ::chdir(spec.workingDir.c_str()) != 0) {
            int err = errno;
            auto ignored = ::write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        auto ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    if (devNull >= 0) ::close(devNull);
    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    if (pid < 0) {
        logger.error(std::string("[Launcher] fork() failed: ") + std::strerror(errno));
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        ::close(execPipe[0]);
        return nullptr;
    }

    // exec 成功时 CLOEXEC 关闭写端,read 返回 0
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        logger.error("[Launcher] Failed to start " + spec.executable + ": " + std::strerror(childErr));
        return nullptr;
    }

    auto st = std::make_shared<SharedState>();
    st->callbacks = std::move(callbacks);

    std::thread(readerLoop, st, outPipe[0], errPipe[0]).detach();
    std::thread(waiterLoop, st, pid).detach();

    logger.debug("[Launcher] Started " + spec.executable + " (PID " + std::to_string(pid) + ")");
    return std::make_unique<PosixProcessHandle>(pid, st);
}
