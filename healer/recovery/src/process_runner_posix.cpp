#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include "../include/process_runner.hpp"

namespace healer::recovery {

    namespace {

        void close_quietly(int fd) {
            if (fd >= 0) ::close(fd);
        }

        // Child side: wire stdio and exec. Never returns.
        [[noreturn]] void exec_child(int outFd, std::vector<char*>& args) {
            const int devnull = ::open("/dev/null", O_RDWR);
            if (devnull < 0 ||
                ::dup2(devnull, STDIN_FILENO) < 0 ||
                ::dup2(devnull, STDERR_FILENO) < 0 ||
                ::dup2(outFd, STDOUT_FILENO) < 0) {
                _exit(127);
            }
            ::execvp(args[0], args.data());
            _exit(127);
        }

        int wait_child(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1) {
                if (errno != EINTR) return -1;
            }
            return status;
        }

    } // namespace


    class PosixProcessRunner : public IProcessRunner
    {
    public:
        Expected<Bytes> run(const std::vector<std::string>& argv) override
        {
            if (argv.empty()) return Expected<Bytes>::failure("empty command line");

            std::vector<char*> args;
            args.reserve(argv.size() + 1);
            for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
            args.push_back(nullptr);

            int fds[2];
            if (::pipe(fds) < 0) {
                return Expected<Bytes>::failure(std::string("pipe: ") + std::strerror(errno));
            }

            const pid_t pid = ::fork();
            if (pid < 0) {
                const int err = errno;
                close_quietly(fds[0]);
                close_quietly(fds[1]);
                return Expected<Bytes>::failure(std::string("fork: ") + std::strerror(err));
            }
            if (pid == 0) {
                ::close(fds[0]);
                exec_child(fds[1], args);
            }

            ::close(fds[1]);

            Bytes out;
            std::uint8_t buf[64 * 1024];
            bool readFailed = false;
            for (;;) {
                const ssize_t n = ::read(fds[0], buf, sizeof(buf));
                if (n > 0) { out.insert(out.end(), buf, buf + n); continue; }
                if (n == 0) break;
                if (errno == EINTR) continue;
                readFailed = true;
                break;
            }
            ::close(fds[0]);

            const int status = wait_child(pid);
            if (status < 0) return Expected<Bytes>::failure(argv[0] + ": waitpid failed");
            if (readFailed) return Expected<Bytes>::failure(argv[0] + ": read from pipe failed");

            if (WIFSIGNALED(status)) {
                return Expected<Bytes>::failure(argv[0] + ": killed by signal " + std::to_string(WTERMSIG(status)));
            }
            if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
                const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                return Expected<Bytes>::failure(argv[0] + ": exit status " + std::to_string(code));
            }
            return Expected<Bytes>::success(std::move(out));
        }
    };


    std::shared_ptr<IProcessRunner> makePosixRunner() {
        return std::make_shared<PosixProcessRunner>();
    }

} // namespace healer::recovery
