#include "core/encoder_command.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace
{
    const size_t STDERR_TAIL_LINES = 20;

    std::optional<double> parseDouble(const std::string &text)
    {
        if (text.empty() || text == "N/A")
            return std::nullopt;
        try
        {
            return std::stod(text);
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    void closeFd(int &fd)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }

    std::string joinArguments(const std::vector<std::string> &args)
    {
        std::string cli;
        for (const auto &arg : args)
        {
            if (!cli.empty())
                cli += " ";
            cli += arg;
        }
        return cli;
    }
}

FfmpegProgressParser::FfmpegProgressParser(double expected_duration)
    : expected_duration_(expected_duration)
{
}

bool FfmpegProgressParser::feed(const std::string &line)
{
    auto eq = line.find('=');
    if (eq == std::string::npos)
        return false;

    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    while (!value.empty() && (value.back() == '\r' || value.back() == ' '))
        value.pop_back();
    while (!value.empty() && value.front() == ' ')
        value.erase(0, 1);

    if (key == "out_time_us" || key == "out_time_ms")
    {
        // Both keys carry microseconds
        if (auto us = parseDouble(value))
            progress_.processed_seconds = std::max(0.0, *us / 1000000.0);
    }
    else if (key == "speed")
    {
        if (!value.empty() && value.back() == 'x')
            value.pop_back();
        if (auto speed = parseDouble(value))
            progress_.speed = *speed;
    }
    else if (key == "frame")
    {
        if (auto frames = parseDouble(value))
            progress_.frames = static_cast<long>(*frames);
    }
    else if (key == "bitrate")
    {
        progress_.bitrate = value;
    }
    else if (key == "progress")
    {
        progress_.finished = (value == "end");
        if (expected_duration_ > 0.0)
        {
            progress_.fraction = std::min(1.0, progress_.processed_seconds / expected_duration_);
            if (progress_.speed > 0.0)
                progress_.eta_seconds = std::max(0.0, (expected_duration_ - progress_.processed_seconds) / progress_.speed);
        }
        if (progress_.finished)
        {
            progress_.fraction = 1.0;
            progress_.eta_seconds = 0.0;
        }
        return true;
    }
    return false;
}

FfmpegCommand::FfmpegCommand(const std::string &ffmpeg_path, const std::string &source, const std::string &output,
                             double expected_duration, int kill_grace_ms)
    : ffmpeg_path_(ffmpeg_path), source_(source), output_(output), expected_duration_(expected_duration),
      kill_grace_(std::max(0, kill_grace_ms))
{
}

std::vector<std::string> FfmpegCommand::buildArguments(const EncoderOptions &options) const
{
    std::vector<std::string> args = {ffmpeg_path_, "-hide_banner", "-nostdin", "-y",
                                     "-progress", "pipe:1", "-nostats"};

    auto input_args = options.toInputArguments();
    args.insert(args.end(), input_args.begin(), input_args.end());

    args.push_back("-i");
    args.push_back(source_);

    auto output_args = options.toOutputArguments();
    args.insert(args.end(), output_args.begin(), output_args.end());

    args.push_back(output_);
    return args;
}

EncoderCommandFactory FfmpegCommand::factory(const std::string &ffmpeg_path, int kill_grace_ms)
{
    return [ffmpeg_path, kill_grace_ms](const std::string &source, const std::string &output,
                                        double expected_duration) -> EncoderCommandPtr
    {
        return std::make_shared<FfmpegCommand>(ffmpeg_path, source, output, expected_duration, kill_grace_ms);
    };
}

TranscodeResult FfmpegCommand::run(const EncoderOptions &options, const ProgressCallback &on_progress)
{
    if (started_.exchange(true))
    {
        return TranscodeResult::failure(TranscodeError::CONFLICT, "Encoder command has already been run");
    }

    auto args = buildArguments(options);
    std::vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    Logger::debug("Starting encoder: " + joinArguments(args));

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0)
    {
        std::string reason = strerror(errno);
        for (int *fds : {out_pipe, err_pipe, exec_pipe})
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return TranscodeResult::failure(TranscodeError::RESOURCE, "Failed to create encoder pipes: " + reason);
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        std::string reason = strerror(errno);
        for (int *fds : {out_pipe, err_pipe, exec_pipe})
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return TranscodeResult::failure(TranscodeError::COMMAND, "Failed to fork encoder process: " + reason);
    }

    if (pid == 0)
    {
        // Child: own process group so helper processes die with the encoder
        setpgid(0, 0);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);

        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t written = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }

    setpgid(pid, pid);
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(exec_pipe[1]);

    // Blocks until execvp succeeded (pipe closed on exec) or reported its errno
    int exec_errno = 0;
    ssize_t n;
    do
    {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        closeFd(out_pipe[0]);
        closeFd(err_pipe[0]);
        return TranscodeResult::failure(TranscodeError::COMMAND,
                                        "Failed to start " + ffmpeg_path_ + ": " + strerror(exec_errno));
    }

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        pid_ = pid;
        if (interrupted_.load())
            signalProcessLocked(SIGTERM);
    }
    Logger::debug("Encoder started with pid " + std::to_string(pid) + " for " + output_);

    std::thread stderr_reader(&FfmpegCommand::readStderr, this, err_pipe[0]);

    FfmpegProgressParser parser(expected_duration_);
    std::string pending;
    char buffer[4096];
    for (;;)
    {
        escalateIfDue();

        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 100);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            Logger::warn("Polling encoder output failed: " + std::string(strerror(errno)));
            break;
        }
        if (ready == 0)
            continue;

        ssize_t got = read(out_pipe[0], buffer, sizeof(buffer));
        if (got < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            Logger::warn("Reading encoder output failed: " + std::string(strerror(errno)));
            break;
        }
        if (got == 0)
            break;

        pending.append(buffer, static_cast<size_t>(got));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos)
        {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (parser.feed(line) && on_progress)
            {
                on_progress(parser.current());
            }
        }
    }
    closeFd(out_pipe[0]);

    int status = 0;
    bool reaped = false;
    while (!reaped)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid)
            {
                pid_ = -1;
                reaped = true;
                break;
            }
            if (r < 0 && errno != EINTR)
            {
                Logger::error("waitpid failed for encoder pid " + std::to_string(pid) + ": " + strerror(errno));
                pid_ = -1;
                break;
            }
        }
        escalateIfDue();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    stderr_reader.join();

    if (reaped && WIFEXITED(status) && WEXITSTATUS(status) == 0)
    {
        Logger::debug("Encoder finished successfully for " + output_);
        return TranscodeResult::ok();
    }

    if (interrupted_.load())
    {
        Logger::info("Encoder for " + output_ + " was interrupted");
        return TranscodeResult::failure(TranscodeError::CANCELLED, "Encoder interrupted");
    }

    std::string reason;
    if (!reaped)
        reason = "encoder exit status unavailable";
    else if (WIFEXITED(status))
        reason = "ffmpeg exited with status " + std::to_string(WEXITSTATUS(status));
    else if (WIFSIGNALED(status))
        reason = "ffmpeg terminated by signal " + std::to_string(WTERMSIG(status));
    else
        reason = "ffmpeg ended abnormally";

    std::string tail = stderrTail();
    if (!tail.empty())
        reason += ": " + tail;
    Logger::error("Encoder failed for " + output_ + ": " + reason);
    return TranscodeResult::failure(TranscodeError::COMMAND, reason);
}

void FfmpegCommand::interrupt()
{
    interrupted_.store(true);
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ > 0 && kill_deadline_ == std::chrono::steady_clock::time_point{})
    {
        signalProcessLocked(SIGTERM);
    }
}

void FfmpegCommand::signalProcessLocked(int signal_number)
{
    if (pid_ <= 0)
        return;

    if (kill(-pid_, signal_number) < 0 && kill(pid_, signal_number) < 0 && errno != ESRCH)
    {
        Logger::warn("Failed to signal encoder pid " + std::to_string(pid_) + ": " + strerror(errno));
    }

    if (signal_number == SIGTERM)
    {
        kill_deadline_ = std::chrono::steady_clock::now() + kill_grace_;
        Logger::debug("Sent SIGTERM to encoder pid " + std::to_string(pid_));
    }
    else if (signal_number == SIGKILL)
    {
        killed_ = true;
    }
}

void FfmpegCommand::escalateIfDue()
{
    if (!interrupted_.load())
        return;

    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ <= 0 || killed_ || kill_deadline_ == std::chrono::steady_clock::time_point{})
        return;

    if (std::chrono::steady_clock::now() >= kill_deadline_)
    {
        Logger::warn("Encoder pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
        signalProcessLocked(SIGKILL);
    }
}

void FfmpegCommand::readStderr(int fd)
{
    std::string pending;
    char buffer[4096];
    for (;;)
    {
        ssize_t got = read(fd, buffer, sizeof(buffer));
        if (got < 0 && errno == EINTR)
            continue;
        if (got <= 0)
            break;

        pending.append(buffer, static_cast<size_t>(got));
        size_t cut;
        while ((cut = pending.find_first_of("\r\n")) != std::string::npos)
        {
            std::string line = pending.substr(0, cut);
            pending.erase(0, cut + 1);
            if (line.empty())
                continue;
            Logger::trace("ffmpeg: " + line);
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_lines_.push_back(line);
            if (stderr_lines_.size() > STDERR_TAIL_LINES)
                stderr_lines_.pop_front();
        }
    }

    if (!pending.empty())
    {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_lines_.push_back(pending);
        if (stderr_lines_.size() > STDERR_TAIL_LINES)
            stderr_lines_.pop_front();
    }
    close(fd);
}

std::string FfmpegCommand::stderrTail() const
{
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    std::string tail;
    // The last lines carry the actual error; earlier ones are usually banner and stream info
    size_t start = stderr_lines_.size() > 3 ? stderr_lines_.size() - 3 : 0;
    for (size_t i = start; i < stderr_lines_.size(); ++i)
    {
        if (!tail.empty())
            tail += " | ";
        tail += stderr_lines_[i];
    }
    return tail;
}
