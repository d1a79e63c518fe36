#include <cargo3ds/proc/Process.hpp>

#include <cstring>
#include <string_view>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;

namespace cargo3ds::proc {

namespace {

constexpr int k_spawn_failed_exit = 127;

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

// Copy of environ with overrides applied; `storage` owns the strings.
std::vector<char*> build_envp(const EnvOverrides& env, std::vector<std::string>& storage) {
    storage.clear();
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        const std::string_view entry(*e);
        const auto eq = entry.find('=');
        const std::string_view key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [k, _] : env) {
            if (k == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) storage.emplace_back(entry);
    }
    for (const auto& [k, v] : env) storage.push_back(k + "=" + v);

    std::vector<char*> out;
    out.reserve(storage.size() + 1);
    for (auto& s : storage) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

bool needs_quotes(std::string_view s) {
    if (s.empty()) return true;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\' || c == '$' || c == '`') return true;
    }
    return false;
}

std::string quote_arg(std::string_view s) {
    if (!needs_quotes(s)) return std::string(s);
    std::string out{"'"};
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

int run_argv(const std::vector<std::string>& argv, const EnvOverrides& env, std::string* spawn_err) {
    if (argv.empty()) {
        if (spawn_err != nullptr) *spawn_err = "empty command line";
        return k_spawn_failed_exit;
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    char** child_env = environ;
    if (!env.empty()) {
        envp = build_envp(env, env_storage);
        child_env = envp.data();
    }

    pid_t pid = -1;
    const int sp = posix_spawnp(&pid, argv[0].c_str(), nullptr, nullptr, cargs.data(), child_env);
    if (sp != 0) {
        if (spawn_err != nullptr) *spawn_err = "failed to start '" + argv[0] + "': " + std::strerror(sp);
        return k_spawn_failed_exit;
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        if (spawn_err != nullptr) *spawn_err = "failed to wait for '" + argv[0] + "'";
        return 1;
    }
    return decode_status(status);
}

bool run_argv_capture_stdout(const std::vector<std::string>& argv, std::string& out, int& exit_code) {
    out.clear();
    exit_code = 1;
    if (argv.empty()) return false;

    int pipefd[2] = {-1, -1};
    if (pipe(pipefd) != 0) return false;

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, pipefd[0]);
    posix_spawn_file_actions_addclose(&actions, pipefd[1]);

    pid_t pid = -1;
    const int sp = posix_spawnp(&pid, argv[0].c_str(), &actions, nullptr, cargs.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(pipefd[1]);

    if (sp != 0) {
        close(pipefd[0]);
        return false;
    }

    char buf[4096];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) return false;
    exit_code = decode_status(status);
    return true;
}

std::string format_command(const std::vector<std::string>& argv, const EnvOverrides& env) {
    std::string out{};
    for (const auto& [k, v] : env) {
        out += k + "=" + quote_arg(v) + " ";
    }
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out.push_back(' ');
        out += quote_arg(argv[i]);
    }
    return out;
}

} // namespace cargo3ds::proc
