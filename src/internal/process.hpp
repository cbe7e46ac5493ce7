// POSIX subprocess management for the stdio client

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate::process
{

/// Exception thrown when process operations fail. Translated to TransportError
/// before it leaves the library.
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Owning file descriptor; closes on destruction
class FileDescriptor
{
  public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const
    {
        return fd_;
    }
    bool valid() const
    {
        return fd_ >= 0;
    }
    int release();
    void reset(int fd = -1);

  private:
    int fd_{-1};
};

enum class WriteStatus
{
    Done,
    Timeout
};

enum class ReadStatus
{
    Line,
    Timeout,
    Eof
};

/// Buffered, line-oriented reader over the read end of a pipe. Bytes of a line
/// that is still incomplete when a read times out stay buffered for the next call.
class ReadPipe
{
  public:
    ReadPipe() = default;
    explicit ReadPipe(FileDescriptor fd) : fd_(std::move(fd)) {}

    /// Wait up to @p timeout_ms (negative: forever) for one '\n'-terminated line.
    /// The terminator (and a preceding '\r') is stripped from @p line.
    /// A final unterminated line before EOF is returned as a Line.
    ReadStatus read_line(std::string& line, int timeout_ms);

    void close()
    {
        fd_.reset();
    }
    bool is_open() const
    {
        return fd_.valid();
    }

    static constexpr size_t kMaxLineBytes = 64 * 1024 * 1024;

  private:
    bool take_line(std::string& line);

    FileDescriptor fd_;
    std::string buffer_;
    bool eof_{false};
};

class WritePipe
{
  public:
    WritePipe() = default;
    explicit WritePipe(FileDescriptor fd) : fd_(std::move(fd)) {}

    /// Write @p data starting at @p offset, waiting up to @p timeout_ms (negative:
    /// forever) for the pipe to accept more bytes. @p offset advances past what was
    /// written, so a Timeout can be resumed. Throws ProcessError on a closed or
    /// broken pipe.
    WriteStatus write(const std::string& data, size_t& offset, int timeout_ms);

    void close()
    {
        fd_.reset();
    }
    bool is_open() const
    {
        return fd_.valid();
    }

  private:
    FileDescriptor fd_;
};

struct ProcessOptions
{
    std::string working_directory;
    /// Added to (or overriding) the inherited environment
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
};

/// Child process with stdin, stdout and stderr redirected to pipes.
/// The destructor kills and reaps a child that is still running.
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Fork and exec @p executable (resolved through PATH). Exec failures such as
    /// a missing binary or bad working directory are reported here as ProcessError.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe()
    {
        return stdin_;
    }
    ReadPipe& stdout_pipe()
    {
        return stdout_;
    }
    ReadPipe& stderr_pipe()
    {
        return stderr_;
    }

    bool is_running();

    /// Non-blocking reap; exit code (128 + signal for signalled children) once exited
    std::optional<int> try_wait();

    /// Blocking reap
    int wait();

    void terminate();
    void kill();

    int pid() const
    {
        return pid_;
    }
    std::optional<int> exit_code() const
    {
        return exit_code_;
    }

    /// SIGKILL by pid without touching the object's state. Usable from another
    /// thread while the owner is blocked on a pipe.
    static void kill_pid(int pid);

  private:
    int record_status(int status);

    int pid_{0};
    bool running_{false};
    std::optional<int> exit_code_;
    WritePipe stdin_;
    ReadPipe stdout_;
    ReadPipe stderr_;
};

} // namespace mcpgate::process
