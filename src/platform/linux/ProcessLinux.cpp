#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

namespace jfbak::process::detail {

    namespace {

        //---Сборка argv для execv: exe + аргументы + nullptr
        struct ArgvBuilder final {
            std::vector<std::string> storage;
            std::vector<char*> argv;

            ArgvBuilder(const fs::path& exe, const std::vector<std::string>& args)
            {
                storage.reserve(args.size() + 1);
                storage.push_back(exe.string());
                storage.insert(storage.end(), args.begin(), args.end());

                argv.reserve(storage.size() + 1);
                for (auto& s : storage) argv.push_back(s.data());
                argv.push_back(nullptr);
            }
        };

        //---Перенаправление stdin/stdout/stderr в /dev/null (для отсоединённого процесса)
        static void redirectStdioToNull()
        {
            const int fd = ::open("/dev/null", O_RDWR);
            if (fd < 0) return;
            (void)dup2(fd, STDIN_FILENO);
            (void)dup2(fd, STDOUT_FILENO);
            (void)dup2(fd, STDERR_FILENO);
            if (fd > STDERR_FILENO) ::close(fd);
        }

    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для Linux
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        //---argv собираем до fork: в дочернем процессе только exec
        ArgvBuilder argv(exe, args);

        pid_t pid = fork();
        if (pid < 0)
        {
            out.started = false;
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (pid == 0)
        {
            if (!opt.workingDir.empty())
                (void)chdir(opt.workingDir.c_str());

            execv(exe.c_str(), argv.argv.data());
            _exit(127); // exec failed
        }

        out.started = true;

        int status = 0;
        // timeoutMs здесь не реализован: архиватор и systemctl ждём до конца
        if (waitpid(pid, &status, 0) < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exitCode = 128 + WTERMSIG(status);
        else
            out.exitCode = 1;

        return true;
    }

    //---Отсоединённый запуск: двойной fork + setsid, чтобы процесс не стал зомби и пережил нас
    bool spawnDetachedPlatform(const fs::path& exe, const std::vector<std::string>& args,
        std::string* error)
    {
        if (::access(exe.c_str(), X_OK) != 0)
        {
            if (error) *error = "not executable: " + exe.string() + " (" + strerror(errno) + ")";
            return false;
        }

        ArgvBuilder argv(exe, args);

        pid_t pid = fork();
        if (pid < 0)
        {
            if (error) *error = std::string("fork() failed: ") + strerror(errno);
            return false;
        }

        if (pid == 0)
        {
            (void)setsid();

            pid_t grandchild = fork();
            if (grandchild != 0)
                _exit(grandchild < 0 ? 1 : 0);

            (void)chdir(exe.parent_path().c_str());
            redirectStdioToNull();
            execv(exe.c_str(), argv.argv.data());
            _exit(127);
        }

        int status = 0;
        if (waitpid(pid, &status, 0) < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            if (error) *error = "failed to detach process " + exe.string();
            return false;
        }
        return true;
    }

} // namespace jfbak::process::detail
#endif
