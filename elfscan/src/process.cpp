// process.cpp

#include "process.hpp"

#include <elfscan/error.hpp>
#include <elfscan/log.hpp>

#include <cerrno>
#include <sstream>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace elfscan;


namespace
{
    // exit status of a child which failed to set up or exec the command
    constexpr int exit_not_started = 127;

    std::error_code last_system_error()
    {
        return { errno, std::system_category() };
    }

    // moves a descriptor which took the slot of a closed standard stream
    // above stderr, keeping it close-on-exec
    int above_std_streams(int fd)
    {
        if (fd > STDERR_FILENO)
            return fd;
        int newfd = fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
        int errnum = errno;
        ::close(fd);
        errno = errnum;
        return newfd;
    }

    std::error_code wait_for(pid_t pid, const command& cmd)
    {
        int wait_status;
        while (waitpid(pid, &wait_status, 0) == -1)
        {
            if (errno != EINTR)
                return last_system_error();
        }
        if (WIFSIGNALED(wait_status))
        {
            std::ostringstream oss;
            oss << cmd;
            log::logline(log::warning, "'%s' terminated by signal %d",
                oss.str().c_str(), WTERMSIG(wait_status));
            return errc::tool_signaled;
        }
        int status = WEXITSTATUS(wait_status);
        if (status == exit_not_started)
        {
            log::logline(log::warning, "'%s' could not be started", cmd.path().c_str());
            return errc::tool_not_started;
        }
        if (status)
        {
            std::ostringstream oss;
            oss << cmd;
            log::logline(log::warning, "'%s' returned with status %d",
                oss.str().c_str(), status);
            return errc::tool_exit_failure;
        }
        return {};
    }
}


result<file_descriptor> file_descriptor::open(const char* path, int flags)
{
    int fd = ::open(path, flags);
    if (fd == -1 || (fd = above_std_streams(fd)) == -1)
        return nonstd::make_unexpected(last_system_error());
    return file_descriptor(fd);
}

file_descriptor::file_descriptor(int fd) :
    _fd(fd)
{}

file_descriptor::~file_descriptor()
{
    if (std::error_code ec = close())
        log::logline(log::error, "file_descriptor:close(): %s", ec.message().c_str());
}

file_descriptor::file_descriptor(file_descriptor&& other) noexcept :
    _fd(std::exchange(other._fd, -1))
{}

file_descriptor& file_descriptor::operator=(file_descriptor&& other) noexcept
{
    std::swap(_fd, other._fd);
    if (std::error_code ec = other.close())
        log::logline(log::error, "file_descriptor:close(): %s", ec.message().c_str());
    return *this;
}

int file_descriptor::get() const
{
    return _fd;
}

std::error_code file_descriptor::close()
{
    if (_fd >= 0)
    {
        int fd = std::exchange(_fd, -1);
        if (::close(fd) == -1)
            return last_system_error();
    }
    return {};
}

// async-signal-safe, may be called between fork() and exec()
std::error_code file_descriptor::redirect(int newfd) const
{
    if (_fd != newfd)
        if (dup2(_fd, newfd) == -1)
            return last_system_error();
    return {};
}

result<std::string> file_descriptor::read_all() const
{
    std::string retval;
    char buffer[4096];
    while (true)
    {
        ssize_t ret = ::read(_fd, buffer, sizeof(buffer));
        if (ret == -1)
        {
            if (errno == EINTR)
                continue;
            return nonstd::make_unexpected(last_system_error());
        }
        if (ret == 0)
            break;
        retval.append(buffer, static_cast<size_t>(ret));
    }
    return retval;
}



result<elfscan::pipe> pipe::create()
{
    int fd[2];
    if (::pipe2(fd, O_CLOEXEC) == -1)
        return nonstd::make_unexpected(last_system_error());
    // both ends are owned from here on, even if one of them fails to move
    pipe retval(above_std_streams(fd[0]), above_std_streams(fd[1]));
    if (retval.read_end().get() == -1 || retval.write_end().get() == -1)
        return nonstd::make_unexpected(last_system_error());
    return retval;
}

pipe::pipe(int read_fd, int write_fd) :
    _pipe{ file_descriptor(read_fd), file_descriptor(write_fd) }
{}

file_descriptor& pipe::read_end()
{
    return _pipe.front();
}

const file_descriptor& pipe::read_end() const
{
    return _pipe.front();
}

file_descriptor& pipe::write_end()
{
    return _pipe.back();
}

const file_descriptor& pipe::write_end() const
{
    return _pipe.back();
}



command::command(const std::vector<std::string>& args) :
    _args(args)
{}

command::command(std::vector<std::string>&& args) :
    _args(std::move(args))
{}

const std::vector<std::string>& command::values() const
{
    return _args;
}

const std::string& command::path() const
{
    return _args.front();
}

std::vector<const char*> command::argv() const
{
    std::vector<const char*> retval;
    retval.reserve(_args.size() + 1);
    for (const auto& arg : _args)
        retval.push_back(arg.c_str());
    retval.push_back(nullptr);
    return retval;
}

result<std::string> command::capture_output() const
{
    auto output = pipe::create();
    if (!output)
        return nonstd::make_unexpected(output.error());
    auto devnull = file_descriptor::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (!devnull)
        return nonstd::make_unexpected(devnull.error());

    // everything the child needs is allocated before fork()
    std::vector<const char*> args = argv();

    pid_t childpid = fork();
    if (childpid == -1)
        return nonstd::make_unexpected(last_system_error());
    if (childpid == 0)
    {
        if (output->write_end().redirect(STDOUT_FILENO) ||
            devnull->redirect(STDERR_FILENO))
            _exit(exit_not_started);
        execvp(args.front(), const_cast<char* const*>(args.data()));
        _exit(exit_not_started);
    }

    if (std::error_code ec = output->write_end().close())
        log::logline(log::error, "command:capture_output:close(): %s", ec.message().c_str());

    result<std::string> text = output->read_end().read_all();
    // the child is always reaped, even if reading its output failed
    std::error_code ec = wait_for(childpid, *this);
    if (!text)
        return text;
    if (ec)
        return nonstd::make_unexpected(ec);
    return text;
}


std::ostream& elfscan::operator<<(std::ostream& os, const command& c)
{
    for (size_t ix = 0; ix < c.values().size(); ix++)
    {
        if (ix)
            os << " ";
        os << c.values()[ix];
    }
    return os;
}
