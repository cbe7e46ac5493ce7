// POSIX implementation of subprocess management

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace mcpgate::process
{

namespace
{
std::string errno_message(int err)
{
    return std::strerror(err);
}

/// Pipe whose both ends are close-on-exec, so sibling children spawned by other
/// clients never inherit them and EOF on stdin stays observable.
void make_pipe(FileDescriptor& read_end, FileDescriptor& write_end, const char* name)
{
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0)
        throw ProcessError(std::string("Failed to create ") + name + " pipe: " +
                           errno_message(errno));
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

/// Writing to a pipe whose reader exited raises SIGPIPE; ignore it unless the
/// host application installed its own handler, so the write reports EPIPE instead.
void ignore_sigpipe_once()
{
    static const bool installed = []
    {
        struct sigaction current;
        std::memset(&current, 0, sizeof(current));
        if (::sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_DFL)
            ::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)installed;
}

std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string::npos)
                continue;
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged)
        out.push_back(key + "=" + value);
    return out;
}

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}
} // namespace

// =============================================================================
// FileDescriptor
// =============================================================================

FileDescriptor::~FileDescriptor()
{
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept
{
    if (this != &other)
        reset(other.release());
    return *this;
}

int FileDescriptor::release()
{
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::reset(int fd)
{
    if (fd_ >= 0)
        ::close(fd_);
    fd_ = fd;
}

// =============================================================================
// ReadPipe
// =============================================================================

bool ReadPipe::take_line(std::string& line)
{
    auto newline = buffer_.find('\n');
    if (newline == std::string::npos)
        return false;
    line.assign(buffer_, 0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

ReadStatus ReadPipe::read_line(std::string& line, int timeout_ms)
{
    if (take_line(line))
        return ReadStatus::Line;

    while (!eof_)
    {
        if (!fd_.valid())
            throw ProcessError("Pipe is not open");

        struct pollfd pfd;
        pfd.fd = fd_.get();
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + errno_message(errno));
        }
        if (ready == 0)
            return ReadStatus::Timeout;

        char chunk[4096];
        ssize_t n = ::read(fd_.get(), chunk, sizeof(chunk));
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            throw ProcessError("Read failed: " + errno_message(errno));
        }
        if (n == 0)
        {
            eof_ = true;
            break;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
        if (take_line(line))
            return ReadStatus::Line;
        if (buffer_.size() > kMaxLineBytes)
            throw ProcessError("Line exceeds " + std::to_string(kMaxLineBytes) + " bytes");
    }

    if (!buffer_.empty())
    {
        line = std::move(buffer_);
        buffer_.clear();
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return ReadStatus::Line;
    }
    return ReadStatus::Eof;
}

// =============================================================================
// WritePipe
// =============================================================================

WriteStatus WritePipe::write(const std::string& data, size_t& offset, int timeout_ms)
{
    if (!fd_.valid())
        throw ProcessError("Pipe is not open");

    while (offset < data.size())
    {
        ssize_t n = ::write(fd_.get(), data.data() + offset, data.size() - offset);
        if (n >= 0)
        {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            throw ProcessError("Broken pipe (process closed stdin)");
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            throw ProcessError("Write failed: " + errno_message(errno));

        // The reader is not draining the pipe; wait for room
        struct pollfd pfd;
        pfd.fd = fd_.get();
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + errno_message(errno));
        }
        if (ready == 0)
            return WriteStatus::Timeout;
    }
    return WriteStatus::Done;
}

// =============================================================================
// Process
// =============================================================================

Process::~Process()
{
    stdin_.close();
    stdout_.close();
    stderr_.close();

    if (running_)
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere; nothing left to release
        }
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (running_)
        throw ProcessError("Process already running");

    ignore_sigpipe_once();

    FileDescriptor stdin_read, stdin_write;
    FileDescriptor stdout_read, stdout_write;
    FileDescriptor stderr_read, stderr_write;
    FileDescriptor error_read, error_write;
    make_pipe(stdin_read, stdin_write, "stdin");
    make_pipe(stdout_read, stdout_write, "stdout");
    make_pipe(stderr_read, stderr_write, "stderr");
    // Error pipe for detecting exec failures; closes on successful exec
    make_pipe(error_read, error_write, "error");

    // Everything the child needs is prepared before fork: after fork only
    // async-signal-safe calls are made.
    std::vector<std::string> env_strings = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_strings;
    argv_strings.reserve(args.size() + 1);
    argv_strings.push_back(executable);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_strings.size() + 1);
    for (auto& arg : argv_strings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_message(errno));

    if (pid == 0)
    {
        // Child process
        int err_fd = error_write.get();
        if (::dup2(stdin_read.get(), STDIN_FILENO) < 0 ||
            ::dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
            ::dup2(stderr_write.get(), STDERR_FILENO) < 0)
            child_fail(err_fd);

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            child_fail(err_fd);

        environ = envp.data();
        ::execvp(executable.c_str(), argv.data());
        child_fail(err_fd);
    }

    // Parent process
    error_write.reset();
    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();

    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_read.get(), &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        std::string where = options.working_directory.empty()
                                ? std::string()
                                : " (working directory '" + options.working_directory + "')";
        throw ProcessError("Failed to execute '" + executable + "'" + where + ": " +
                           errno_message(child_errno));
    }

    // Writes wait in poll() so a child that stops reading cannot block the caller
    int flags = ::fcntl(stdin_write.get(), F_GETFL);
    if (flags >= 0)
        ::fcntl(stdin_write.get(), F_SETFL, flags | O_NONBLOCK);
    stdin_ = WritePipe(std::move(stdin_write));
    stdout_ = ReadPipe(std::move(stdout_read));
    stderr_ = ReadPipe(std::move(stderr_read));
    pid_ = pid;
    running_ = true;
    exit_code_.reset();
}

int Process::record_status(int status)
{
    if (WIFEXITED(status))
        exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        exit_code_ = 128 + WTERMSIG(status);
    else
        exit_code_ = -1;
    running_ = false;
    return *exit_code_;
}

bool Process::is_running()
{
    return running_ && !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_)
        return record_status(status);
    if (result == 0)
        return std::nullopt;
    throw ProcessError("waitpid failed: " + errno_message(errno));
}

int Process::wait()
{
    if (!running_)
        return exit_code_.value_or(-1);

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
        return record_status(status);
    running_ = false;
    throw ProcessError("waitpid failed: " + errno_message(errno));
}

void Process::terminate()
{
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGTERM);
}

void Process::kill()
{
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGKILL);
}

void Process::kill_pid(int pid)
{
    if (pid > 0)
        ::kill(pid, SIGKILL);
}

} // namespace mcpgate::process
