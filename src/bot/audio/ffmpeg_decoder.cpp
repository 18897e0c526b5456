#include "ffmpeg_decoder.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace audio {

namespace {

// Trailing ffmpeg stderr kept for error reports.
constexpr size_t kMaxErrorBytes = 2048;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::expected<std::vector<int16_t>, std::string>
decode_file(const std::filesystem::path& file, uint32_t sample_rate,
            const std::string& ffmpeg_bin) {
    // O_CLOEXEC: other workers fork concurrently and must not inherit our pipes
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::string rate = std::to_string(sample_rate);
    std::string input = file.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout carries PCM, stderr carries diagnostics
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::execlp(ffmpeg_bin.c_str(), ffmpeg_bin.c_str(),
                 "-nostdin", "-loglevel", "error", "-threads", "0",
                 "-i", input.c_str(),
                 "-f", "s16le", "-ac", "1", "-acodec", "pcm_s16le", "-ar", rate.c_str(),
                 "-", nullptr);
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    std::vector<uint8_t> pcm;
    std::string diag;
    char buf[65536];
    std::string io_error;

    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[2];
        nfds_t n = 0;
        if (out_fd >= 0) fds[n++] = {.fd = out_fd, .events = POLLIN, .revents = 0};
        if (err_fd >= 0) fds[n++] = {.fd = err_fd, .events = POLLIN, .revents = 0};

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            io_error = std::string("poll() failed: ") + std::strerror(errno);
            break;
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got < 0 && errno == EINTR) continue;

            bool is_out = fds[i].fd == out_fd;
            if (got <= 0) {
                close_fd(is_out ? out_fd : err_fd);
                continue;
            }
            if (is_out) {
                pcm.insert(pcm.end(), buf, buf + got);
            } else {
                diag.append(buf, static_cast<size_t>(got));
                if (diag.size() > kMaxErrorBytes) diag.erase(0, diag.size() - kMaxErrorBytes);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (!io_error.empty()) {
        return std::unexpected(io_error);
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected("failed to load audio: " + ffmpeg_bin + " not found");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        while (!diag.empty() && (diag.back() == '\n' || diag.back() == '\r')) diag.pop_back();
        return std::unexpected("failed to load audio: " + diag);
    }

    std::vector<int16_t> samples(pcm.size() / sizeof(int16_t));
    if (!samples.empty()) std::memcpy(samples.data(), pcm.data(), samples.size() * sizeof(int16_t));
    return samples;
}

std::vector<float> to_float(const std::vector<int16_t>& samples) {
    std::vector<float> out;
    out.reserve(samples.size());
    for (int16_t s : samples) out.push_back(static_cast<float>(s) / 32768.0f);
    return out;
}

} // namespace audio
