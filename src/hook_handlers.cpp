#include "hooks.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace polygate {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

// A hook that exits before reading stdin must not take the gateway down with SIGPIPE
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void kill_group(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status;
    waitpid(pid, &status, 0);
}

std::vector<std::string> child_environment(const HookEvent& event) {
    std::string project = event.cwd.empty() ? current_dir() : event.cwd;
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (entry.rfind("CLAUDE_PROJECT_DIR=", 0) == 0 || entry.rfind("POLYGATE_PROJECT_DIR=", 0) == 0 ||
            entry.rfind("POLYGATE_HOOK_EVENT=", 0) == 0 || entry.rfind("POLYGATE_SESSION_ID=", 0) == 0) {
            continue;
        }
        env.push_back(std::move(entry));
    }
    env.push_back("CLAUDE_PROJECT_DIR=" + project);
    env.push_back("POLYGATE_PROJECT_DIR=" + project);
    env.push_back(std::string("POLYGATE_HOOK_EVENT=") + hook_event_key(event.kind()));
    env.push_back("POLYGATE_SESSION_ID=" + event.session_id);
    return env;
}

// Plain-text stdout on these events is context for the model, as in Claude Code
bool stdout_is_context(HookEventKind kind) {
    return kind == HookEventKind::user_prompt_submit || kind == HookEventKind::session_start;
}

} // namespace

// ── Command handler ─────────────────────────────────────────────────

CommandHookHandler::CommandHookHandler(std::string command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

HandlerOutcome CommandHookHandler::run(const HookEvent& event, const std::string& input_json) {
    ignore_sigpipe();
    auto deadline = Clock::now() + timeout_;
    HandlerOutcome outcome;

    // Everything the child touches is built before fork()
    std::vector<std::string> env_store = child_environment(event);
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);
    const char* argv[] = {"sh", "-c", command_.c_str(), nullptr};
    std::string workdir = event.cwd;

    int pipe_in[2], pipe_out[2], pipe_err[2];
    if (pipe2(pipe_in, O_CLOEXEC) != 0) {
        throw HookCrash(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(pipe_out, O_CLOEXEC) != 0) {
        close(pipe_in[0]); close(pipe_in[1]);
        throw HookCrash(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(pipe_err, O_CLOEXEC) != 0) {
        close(pipe_in[0]); close(pipe_in[1]);
        close(pipe_out[0]); close(pipe_out[1]);
        throw HookCrash(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {pipe_in[0], pipe_in[1], pipe_out[0], pipe_out[1], pipe_err[0], pipe_err[1]}) close(fd);
        throw HookCrash(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: own process group so a timeout kills the whole pipeline
        setpgid(0, 0);
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) _exit(126);
        dup2(pipe_in[0], STDIN_FILENO);
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_err[1], STDERR_FILENO);
        execve("/bin/sh", const_cast<char* const*>(argv), envp.data());
        _exit(127);
    }

    // Parent
    close(pipe_in[0]);
    close(pipe_out[1]);
    close(pipe_err[1]);
    int in_fd = pipe_in[1], out_fd = pipe_out[0], err_fd = pipe_err[0];
    for (int fd : {in_fd, out_fd, err_fd}) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);

    std::string out, err;
    size_t written = 0;
    bool timed_out = false;
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) { timed_out = true; break; }

        pollfd fds[3];
        int n = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { fds[n] = {in_fd, POLLOUT, 0}; in_idx = n++; }
        if (out_fd >= 0) { fds[n] = {out_fd, POLLIN, 0}; out_idx = n++; }
        if (err_fd >= 0) { fds[n] = {err_fd, POLLIN, 0}; err_idx = n++; }

        int ret = poll(fds, static_cast<nfds_t>(n), wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            kill_group(pid);
            for (int* fd : {&in_fd, &out_fd, &err_fd}) close_fd(*fd);
            throw HookCrash(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ret == 0) continue;

        if (in_idx >= 0 && fds[in_idx].revents) {
            ssize_t w = write(in_fd, input_json.data() + written, input_json.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            if ((w < 0 && errno != EAGAIN && errno != EINTR) || written >= input_json.size()) {
                close_fd(in_fd);  // done, or the hook stopped reading
            }
        }
        auto drain = [&buf, &fds](int idx, int& fd, std::string& sink) {
            if (idx < 0 || !fds[idx].revents) return;
            ssize_t r = read(fd, buf, sizeof(buf));
            if (r > 0) sink.append(buf, static_cast<size_t>(r));
            else if (r == 0 || (errno != EAGAIN && errno != EINTR)) close_fd(fd);
        };
        drain(out_idx, out_fd, out);
        drain(err_idx, err_fd, err);
    }
    close_fd(in_fd);

    int status = 0;
    if (!timed_out) {
        while (true) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) break;
            if (w < 0 && errno != EINTR) break;
            if (remaining_ms(deadline) == 0) { timed_out = true; break; }
            usleep(5000);
        }
    }
    if (timed_out) {
        kill_group(pid);
        close_fd(out_fd);
        close_fd(err_fd);
        outcome.status = HandlerStatus::timed_out;
        outcome.error = "killed after " + std::to_string(timeout_.count()) + " ms";
        return outcome;
    }

    if (!WIFEXITED(status)) {
        outcome.status = HandlerStatus::non_blocking_failure;
        outcome.error = "terminated by signal " + std::to_string(WIFSIGNALED(status) ? WTERMSIG(status) : 0);
        return outcome;
    }

    int code = WEXITSTATUS(status);
    std::string trimmed = trim(out);
    if (!trimmed.empty() && trimmed[0] == '{') {
        try {
            outcome.decision = HookDecision::from_json(json::parse(trimmed));
        } catch (const json::exception& e) {
            log_warn("hooks", "Ignoring unparsable output from '" + command_ + "': " + e.what());
        }
    } else if (!trimmed.empty() && code == 0 && stdout_is_context(event.kind())) {
        outcome.decision.system_message = trimmed;
    }

    if (code == 0) {
        outcome.status = HandlerStatus::ok;
    } else if (code == 2) {
        outcome.status = HandlerStatus::blocking_failure;
        outcome.error = trim(err);
    } else {
        outcome.status = HandlerStatus::non_blocking_failure;
        outcome.error = "exit " + std::to_string(code) + (err.empty() ? "" : ": " + trim(err));
    }
    return outcome;
}

// ── Prompt handler ──────────────────────────────────────────────────

static const char* kPromptHookSystem =
    "You are a lifecycle hook guarding an AI coding session. Evaluate the event against the "
    "instructions and reply with only a JSON object of the form "
    "{\"continue\": true|false, \"reason\": \"...\", \"permissionDecision\": \"allow\"|\"deny\"|\"ask\", "
    "\"systemMessage\": \"...\"}. Omit fields you do not need. No prose outside the object.";

PromptHookHandler::PromptHookHandler(std::string prompt, std::chrono::milliseconds timeout,
                                     PromptEvaluator evaluator)
    : prompt_(std::move(prompt)), timeout_(timeout), evaluator_(std::move(evaluator)) {}

HandlerOutcome PromptHookHandler::run(const HookEvent&, const std::string& input_json) {
    HandlerOutcome outcome;

    std::string user = prompt_;
    size_t pos = user.find("$ARGUMENTS");
    if (pos != std::string::npos) {
        user.replace(pos, 10, input_json);
    } else {
        user += "\n\nEvent:\n" + input_json;
    }

    std::string reply;
    try {
        reply = evaluator_(kPromptHookSystem, user);
    } catch (const std::exception& e) {
        outcome.status = HandlerStatus::non_blocking_failure;
        outcome.error = std::string("model call failed: ") + e.what();
        return outcome;
    }

    size_t brace = reply.find('{');
    size_t end = find_json_object_end(reply, brace == std::string::npos ? reply.size() : brace);
    if (end == std::string::npos) {
        outcome.status = HandlerStatus::non_blocking_failure;
        outcome.error = "model reply has no decision object";
        return outcome;
    }
    try {
        outcome.decision = HookDecision::from_json(json::parse(reply.substr(brace, end - brace + 1)));
    } catch (const json::exception& e) {
        outcome.status = HandlerStatus::non_blocking_failure;
        outcome.error = std::string("unparsable decision: ") + e.what();
    }
    return outcome;
}

} // namespace polygate
