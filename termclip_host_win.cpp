// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

#include <windows.h>

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace termclip {

namespace {

class Handle {
public:
  Handle() : m_handle(nullptr) {
  }

  explicit Handle(HANDLE handle)
    : m_handle(handle == INVALID_HANDLE_VALUE ? nullptr: handle) {
  }

  ~Handle() {
    reset();
  }

  void reset(HANDLE handle = nullptr) {
    if (m_handle)
      CloseHandle(m_handle);
    m_handle = handle;
  }

  HANDLE get() const { return m_handle; }

  HANDLE release() {
    HANDLE handle = m_handle;
    m_handle = nullptr;
    return handle;
  }

  bool valid() const { return m_handle != nullptr; }

private:
  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  HANDLE m_handle;
};

std::wstring to_wide(const std::string& s) {
  if (s.empty())
    return std::wstring();

  int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
  std::wstring out(n, L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), &out[0], n);
  return out;
}

// Quotes one argument following the rules of CommandLineToArgvW().
void append_argument(std::wstring& cmdline, const std::wstring& arg) {
  if (!cmdline.empty())
    cmdline.push_back(L' ');

  if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
    cmdline += arg;
    return;
  }

  cmdline.push_back(L'"');
  for (std::wstring::size_type i=0; ; ++i) {
    std::wstring::size_type backslashes = 0;
    while (i < arg.size() && arg[i] == L'\\') {
      ++i;
      ++backslashes;
    }

    if (i == arg.size()) {
      cmdline.append(backslashes * 2, L'\\');
      break;
    }
    else if (arg[i] == L'"') {
      cmdline.append(backslashes * 2 + 1, L'\\');
      cmdline.push_back(L'"');
    }
    else {
      cmdline.append(backslashes, L'\\');
      cmdline.push_back(arg[i]);
    }
  }
  cmdline.push_back(L'"');
}

bool make_pipe(Handle& read_end, Handle& write_end, bool child_reads) {
  SECURITY_ATTRIBUTES sa;
  sa.nLength = sizeof(sa);
  sa.bInheritHandle = TRUE;
  sa.lpSecurityDescriptor = nullptr;

  HANDLE r, w;
  if (!CreatePipe(&r, &w, &sa, 0))
    return false;

  read_end.reset(r);
  write_end.reset(w);

  // Our end of the pipe must not be inherited by the child
  SetHandleInformation(child_reads ? w: r, HANDLE_FLAG_INHERIT, 0);
  return true;
}

std::vector<std::wstring> executable_extensions() {
  std::vector<std::wstring> exts;
  const char* pathext = std::getenv("PATHEXT");
  std::wstring value = to_wide(pathext ? pathext: ".COM;.EXE;.BAT;.CMD");

  std::wstring::size_type begin = 0;
  while (begin <= value.size()) {
    std::wstring::size_type end = value.find(L';', begin);
    if (end == std::wstring::npos)
      end = value.size();
    if (end > begin)
      exts.push_back(value.substr(begin, end - begin));
    begin = end + 1;
  }
  return exts;
}

bool write_all(HANDLE handle, const std::string& bytes) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    DWORD n = 0;
    if (!WriteFile(handle, bytes.data() + written,
                   (DWORD)(bytes.size() - written), &n, nullptr))
      return false;
    written += n;
  }
  return true;
}

} // anonymous namespace

system_host::system_host(bool show_command_errors)
  : m_show_command_errors(show_command_errors) {
}

bool system_host::find_command(const std::string& name) const {
  if (name.empty())
    return false;

  std::wstring wname = to_wide(name);
  wchar_t buf[MAX_PATH];

  if (SearchPathW(nullptr, wname.c_str(), nullptr, MAX_PATH, buf, nullptr) > 0)
    return true;

  for (const std::wstring& ext : executable_extensions()) {
    if (SearchPathW(nullptr, wname.c_str(), ext.c_str(), MAX_PATH, buf, nullptr) > 0)
      return true;
  }
  return false;
}

run_result system_host::run(const std::vector<std::string>& argv,
                            const payload& input,
                            payload* output,
                            int timeout_ms) {
  run_result result;
  if (argv.empty())
    return result;

  Handle in_read, in_write, out_read, out_write;
  if (!make_pipe(in_read, in_write, true) ||
      (output && !make_pipe(out_read, out_write, false))) {
    details::logger()->debug("cannot create pipes (error {})", GetLastError());
    return result;
  }

  SECURITY_ATTRIBUTES sa;
  sa.nLength = sizeof(sa);
  sa.bInheritHandle = TRUE;
  sa.lpSecurityDescriptor = nullptr;
  Handle null_device(CreateFileW(L"NUL", GENERIC_READ | GENERIC_WRITE,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE,
                                 &sa, OPEN_EXISTING, 0, nullptr));

  STARTUPINFOW si;
  ZeroMemory(&si, sizeof(si));
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = in_read.get();
  si.hStdOutput = (output ? out_write.get(): null_device.get());
  si.hStdError = (m_show_command_errors ? GetStdHandle(STD_ERROR_HANDLE):
                                          null_device.get());

  std::wstring cmdline;
  for (const std::string& arg : argv)
    append_argument(cmdline, to_wide(arg));

  // CreateProcessW() needs a writable command line
  std::vector<wchar_t> mutable_cmdline(cmdline.begin(), cmdline.end());
  mutable_cmdline.push_back(L'\0');

  PROCESS_INFORMATION pi;
  ZeroMemory(&pi, sizeof(pi));
  if (!CreateProcessW(nullptr, &mutable_cmdline[0],
                      nullptr, nullptr, TRUE,
                      CREATE_NO_WINDOW, nullptr, nullptr,
                      &si, &pi)) {
    DWORD err = GetLastError();
    details::logger()->debug("cannot execute {} (error {})", argv[0], err);
    if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND)
      result.status = RunStatus::NotFound;
    return result;
  }

  Handle process(pi.hProcess);
  Handle thread(pi.hThread);
  in_read.reset();
  out_write.reset();

  // Pipes are fed/drained from threads so a command that doesn't
  // read its stdin cannot block us after the timeout. The writer
  // closes stdin when it finishes so the command receives EOF.
  bool input_written = false;
  HANDLE in_handle = in_write.release();
  std::thread writer(
    [&input, &input_written, in_handle]{
      input_written = write_all(in_handle, input);
      CloseHandle(in_handle);
    });

  HANDLE out_handle = out_read.get();
  std::thread reader;
  if (output) {
    reader = std::thread(
      [output, out_handle]{
        char buf[4096];
        DWORD n = 0;
        while (ReadFile(out_handle, buf, sizeof(buf), &n, nullptr) && n > 0)
          output->append(buf, n);
      });
  }

  DWORD wait = WaitForSingleObject(process.get(), (DWORD)timeout_ms);
  if (wait != WAIT_OBJECT_0) {
    // A terminated process closes its pipe ends, which unblocks the
    // writer and reader threads.
    TerminateProcess(process.get(), 1);
    WaitForSingleObject(process.get(), INFINITE);
  }

  writer.join();
  if (reader.joinable())
    reader.join();

  if (wait != WAIT_OBJECT_0) {
    result.status = (wait == WAIT_TIMEOUT ? RunStatus::TimedOut: RunStatus::Failed);
    return result;
  }

  DWORD exit_code = 1;
  GetExitCodeProcess(process.get(), &exit_code);
  result.exit_code = (int)exit_code;
  result.status = (exit_code == 0 && input_written ? RunStatus::Ok:
                                                     RunStatus::Failed);
  return result;
}

bool system_host::display_reachable(const std::string& display) const {
  return false;
}

bool tty_sink::write(const std::string& bytes) {
  // CONOUT$ is the console even when stdout is redirected
  Handle console(CreateFileW(L"CONOUT$", GENERIC_READ | GENERIC_WRITE,
                             FILE_SHARE_READ | FILE_SHARE_WRITE,
                             nullptr, OPEN_EXISTING, 0, nullptr));
  if (!console.valid())
    return false;

  DWORD mode = 0;
  if (GetConsoleMode(console.get(), &mode))
    SetConsoleMode(console.get(), mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);

  return write_all(console.get(), bytes);
}

} // namespace termclip
