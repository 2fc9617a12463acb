/* @file CommandRunner.cpp
 * @brief fork/execvp + pipe capture - POSIX compliant
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Hotspot headers
#include "io/CommandRunner.hpp"

using namespace hotspot::io;

std::string CommandRunner::render(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty())
      out += ' ';
    out += arg;
  }
  return out;
}

CommandResult CommandRunner::run(const std::vector<std::string>& argv) {
  CommandResult result;
  if (argv.empty())
    return result;

  int pipeFds[2];
  if (::pipe2(pipeFds, O_CLOEXEC) != 0) {
    std::cerr << "Error " << errno << " from pipe2: " << strerror(errno) << "\n";
    return result;
  }

  // build argv before fork, the child must not allocate
  std::vector<char*> cargs;
  cargs.reserve(argv.size() + 1);
  for (const auto& arg : argv)
    cargs.push_back(const_cast<char*>(arg.c_str()));
  cargs.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    std::cerr << "Error " << errno << " from fork: " << strerror(errno) << "\n";
    ::close(pipeFds[0]);
    ::close(pipeFds[1]);
    return result;
  }

  if (pid == 0) {
    ::dup2(pipeFds[1], STDOUT_FILENO);
    ::dup2(pipeFds[1], STDERR_FILENO);
    ::execvp(cargs[0], cargs.data());
    ::_exit(127); // exec failed
  }

  ::close(pipeFds[1]);

  char temp[512];
  while (true) {
    ssize_t n = ::read(pipeFds[0], temp, sizeof(temp));
    if (n > 0) {
      result.output.append(temp, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break; // EOF, child closed its end
    } else if (errno == EINTR) {
      continue; // interrupted → retry
    } else {
      std::cerr << "read: " << strerror(errno) << '\n';
      break;
    }
  }
  ::close(pipeFds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      std::cerr << "waitpid: " << strerror(errno) << '\n';
      return result;
    }
  }

  result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}
