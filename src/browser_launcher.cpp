#include "util/browser_launcher.hpp"

#if defined(_WIN32)
#include <windows.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fcntl.h>
#endif

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "common_macros.hpp"
#include "my_error_codes.hpp"

namespace fitbridge {

std::vector<std::string>
SystemBrowserLauncher::opener_command(const std::string &url) {
#if defined(_WIN32)
  return {"rundll32", "url.dll,FileProtocolHandler", url};
#elif defined(__APPLE__)
  return {"open", url};
#else
  return {"xdg-open", url};
#endif
}

#if defined(_WIN32)

namespace {

std::wstring utf8_to_wide(const std::string &input) {
  if (input.empty()) {
    return L"";
  }
  const int size_needed =
      MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
  if (size_needed <= 1) {
    return L"";
  }
  std::wstring result(static_cast<size_t>(size_needed - 1), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, result.data(),
                      size_needed);
  return result;
}

// CommandLineToArgvW rules: quote when needed, double the backslashes that
// precede a quote or the closing quote.
std::wstring quote_arg(const std::wstring &arg) {
  if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
    return arg;
  }
  std::wstring out = L"\"";
  std::size_t backslashes = 0;
  for (wchar_t c : arg) {
    if (c == L'\\') {
      ++backslashes;
      continue;
    }
    if (c == L'"') {
      out.append(backslashes * 2 + 1, L'\\');
    } else {
      out.append(backslashes, L'\\');
    }
    backslashes = 0;
    out.push_back(c);
  }
  out.append(backslashes * 2, L'\\');
  out.push_back(L'"');
  return out;
}

monad::MyVoidResult launch_failed(const std::string &what) {
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::GENERAL::BROWSER_LAUNCH_FAILED, what));
}

} // namespace

monad::MyVoidResult SystemBrowserLauncher::open(const std::string &url) {
  const auto args = opener_command(url);

  std::wstring command_line;
  for (const auto &arg : args) {
    if (!command_line.empty()) {
      command_line.push_back(L' ');
    }
    command_line += quote_arg(utf8_to_wide(arg));
  }
  std::vector<wchar_t> cmd_buffer(command_line.begin(), command_line.end());
  cmd_buffer.push_back(L'\0');

  STARTUPINFOW si;
  ZeroMemory(&si, sizeof(si));
  si.cb = sizeof(si);
  PROCESS_INFORMATION pi;
  ZeroMemory(&pi, sizeof(pi));

  if (!CreateProcessW(nullptr, cmd_buffer.data(), nullptr, nullptr, FALSE, 0,
                      nullptr, nullptr, &si, &pi)) {
    return launch_failed(fmt::format("Unable to run {}: Win32 error {}",
                                     args.front(), GetLastError()));
  }

  const DWORD wait_result = WaitForSingleObject(pi.hProcess, INFINITE);
  DWORD exit_code = 0;
  const BOOL got_code = GetExitCodeProcess(pi.hProcess, &exit_code);
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);

  if (wait_result != WAIT_OBJECT_0 || !got_code) {
    return launch_failed(fmt::format("Waiting for {} failed: Win32 error {}",
                                     args.front(), GetLastError()));
  }
  if (exit_code != 0) {
    return launch_failed(
        fmt::format("{} exited with status {}", args.front(), exit_code));
  }

  BOOST_LOG_SEV(lg_, trivial::info)
      << "Browser opened with " << args.front();
  return monad::MyVoidResult::Ok();
}

#else

monad::MyVoidResult SystemBrowserLauncher::open(const std::string &url) {
  const auto args = opener_command(url);

  // The write end is close-on-exec: if exec succeeds the parent reads EOF,
  // otherwise the child reports errno through it.
  int exec_pipe[2];
  if (pipe(exec_pipe) == -1) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::BROWSER_LAUNCH_FAILED,
        std::string("Failed to create pipe: ") + std::strerror(errno)));
  }
  fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

  pid_t pid = fork();
  if (pid == -1) {
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::BROWSER_LAUNCH_FAILED,
        std::string("fork failed while launching browser: ") +
            std::strerror(errno)));
  }

  if (pid == 0) {
    // child
    close(exec_pipe[0]);
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
      argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(exec_pipe[1]);
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(exec_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      break;
    }
  }

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::BROWSER_LAUNCH_FAILED,
        fmt::format("Unable to run {}: {}", args.front(),
                    std::strerror(child_errno))));
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::BROWSER_LAUNCH_FAILED,
        fmt::format("{} exited with status {}", args.front(),
                    WIFEXITED(status) ? WEXITSTATUS(status) : -1)));
  }

  FITBRIDGE_VERBOSE_LOG("browser launcher: " << args.front() << " exited 0");
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Browser opened with " << args.front();
  return monad::MyVoidResult::Ok();
}

#endif

} // namespace fitbridge
