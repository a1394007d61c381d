// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#ifndef TERMCLIP_H_INCLUDED
#define TERMCLIP_H_INCLUDED
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Generic helper definitions for shared library support
#if defined _WIN32 || defined __CYGWIN__
	#define TERMCLIP_HELPER_DLL_IMPORT __declspec(dllimport)
	#define TERMCLIP_HELPER_DLL_EXPORT __declspec(dllexport)
	#define TERMCLIP_HELPER_DLL_LOCAL
#else
	#if __GNUC__ >= 4
		#define TERMCLIP_HELPER_DLL_IMPORT __attribute__ ((visibility ("default")))
		#define TERMCLIP_HELPER_DLL_EXPORT __attribute__ ((visibility ("default")))
		#define TERMCLIP_HELPER_DLL_LOCAL  __attribute__ ((visibility ("hidden")))
	#else
		#define TERMCLIP_HELPER_DLL_IMPORT
		#define TERMCLIP_HELPER_DLL_EXPORT
		#define TERMCLIP_HELPER_DLL_LOCAL
	#endif
#endif

// TERMCLIP_API is used for the public API symbols. It either DLL
// imports or DLL exports (or does nothing for static build).
// TERMCLIP_LOCAL is used for non-api symbols.

#ifdef TERMCLIP_DLL // defined if the package is compiled as a DLL
	#ifdef TERMCLIP_DLL_EXPORTS // defined if we are building the package as a DLL (instead of using it)
		#define TERMCLIP_API TERMCLIP_HELPER_DLL_EXPORT
	#else
		#define TERMCLIP_API TERMCLIP_HELPER_DLL_IMPORT
	#endif // TERMCLIP_DLL_EXPORTS
	#define TERMCLIP_LOCAL TERMCLIP_HELPER_DLL_LOCAL
#else // TERMCLIP_DLL is not defined: this means the package is a static lib.
	#define TERMCLIP_API
	#define TERMCLIP_LOCAL
#endif // TERMCLIP_DLL

#define TERMCLIP_VERSION "1.0.0"

namespace termclip {

  // Bytes to copy or bytes retrieved from the clipboard. std::string
  // is used as a binary-safe container (it can contain null chars).
  typedef std::string payload;

  // Snapshot of the environment variables that we recognize.
  typedef std::map<std::string, std::string> environment;

  // ======================================================================
  // Environment
  // ======================================================================

  // Operating system that the library was compiled for.
  enum class HostOS {
    MacOS,
    Windows,
    Unix,
  };

  // Detected OS family/display server. It decides which native
  // clipboard commands are available.
  enum class Platform {
    MacOS,
    Windows,
    X11,
    Wayland,
    Unknown,
  };

  enum class Multiplexer {
    None,
    Tmux,
    Screen,
  };

  enum class Direction {
    Copy,
    Paste,
  };

  enum class Capability {
    Copy,
    Paste,
    Both,
  };

  // Default ceiling for the base64 text of an OSC 52 sequence. Many
  // terminals drop longer sequences.
  const std::size_t kOsc52DefaultMaxB64 = 75000;

  // GNU screen drops device control strings longer than this (framing
  // included), so longer sequences are sent in chunks.
  const std::size_t kScreenChunkLimit = 768;

  // Time (in milliseconds) that we wait for a clipboard command to
  // finish before killing it.
  const int kDefaultCommandTimeout = 3000;

  // Overrides read from the environment once at startup.
  struct config {
    bool force_osc52 = false;
    bool force_native = false;
    std::size_t osc52_max_b64 = kOsc52DefaultMaxB64;
    int command_timeout_ms = kDefaultCommandTimeout;
    bool debug = false;
  };

  struct environment_context {
    Platform platform = Platform::Unknown;
    Multiplexer multiplexer = Multiplexer::None;

    // True when we are running inside the Windows Subsystem for
    // Linux, so Windows clipboard commands (clip.exe) can be used.
    bool wsl = false;

    // X11 display name (DISPLAY), used to check that the X server is
    // alive before running X11 clipboard commands.
    std::string display;

    config overrides;
  };

  TERMCLIP_API HostOS host_os();

  // Returns the recognized variables from the process environment.
  TERMCLIP_API environment snapshot_environment();

  TERMCLIP_API config read_config(const environment& env);

  // Pure function of its arguments, it doesn't touch the process
  // environment.
  TERMCLIP_API environment_context probe_environment(HostOS os,
                                                     const environment& env);

  TERMCLIP_API const char* platform_name(Platform platform);
  TERMCLIP_API const char* multiplexer_name(Multiplexer multiplexer);

  // ======================================================================
  // Error handling
  // ======================================================================

  enum class ErrorCode {
    None,
    NoCommandFound,
    CommandTimeout,
    CommandFailed,
    PayloadTooLarge,
    UnsupportedDirection,
    AllTransportsExhausted,
    NoTerminal,
    DisplayUnavailable,
  };

  TERMCLIP_API const char* error_code_name(ErrorCode code);

  // Called each time that a transport candidate fails (the failure
  // is recovered trying the next candidate).
  typedef void (*error_handler)(ErrorCode code, const char* transport_name);

  TERMCLIP_API void set_error_handler(error_handler f);
  TERMCLIP_API error_handler get_error_handler();

  // One failed try of a transport candidate.
  struct attempt {
    std::string transport;
    ErrorCode code;
    std::string detail;
  };

  // A transport is never partially successful: "ok" is true only if
  // the whole payload was handed to the clipboard destination.
  struct result {
    bool ok = false;
    std::size_t bytes = 0;
    std::string transport;      // Committed transport (when ok)
    ErrorCode code = ErrorCode::None;
    std::string detail;

    // Causes of each failed candidate (in the order they were tried)
    std::vector<attempt> attempts;

    static result success(const std::string& transport, std::size_t bytes);
    static result failure(ErrorCode code, const std::string& detail);
  };

  // ======================================================================
  // Side effects (replaceable in tests)
  // ======================================================================

  enum class RunStatus {
    Ok,
    NotFound,
    Failed,
    TimedOut,
  };

  struct run_result {
    RunStatus status = RunStatus::Failed;
    int exit_code = -1;
  };

  // Access to the system to find/run clipboard commands.
  class TERMCLIP_API host {
  public:
    virtual ~host() { }

    // Returns true if the command is in the PATH.
    virtual bool find_command(const std::string& name) const = 0;

    // Runs argv[0] with the given "input" in its stdin. If "output"
    // is not null, the command stdout is stored there. The command is
    // killed if it doesn't finish in "timeout_ms" milliseconds.
    virtual run_result run(const std::vector<std::string>& argv,
                           const payload& input,
                           payload* output,
                           int timeout_ms) = 0;

    // Returns true if we can connect to the given X11 display.
    virtual bool display_reachable(const std::string& display) const = 0;
  };

  class TERMCLIP_API system_host : public host {
  public:
    system_host(bool show_command_errors = false);

    bool find_command(const std::string& name) const override;
    run_result run(const std::vector<std::string>& argv,
                   const payload& input,
                   payload* output,
                   int timeout_ms) override;
    bool display_reachable(const std::string& display) const override;

  private:
    bool m_show_command_errors;
  };

  // Output device for OSC 52 sequences. These sequences must reach
  // the terminal even if our stdout is redirected.
  class TERMCLIP_API terminal_sink {
  public:
    virtual ~terminal_sink() { }

    // Writes all bytes in one go, returns false if there is no
    // terminal to write to.
    virtual bool write(const std::string& bytes) = 0;
  };

  // Writes to the controlling terminal (/dev/tty or CONOUT$), or to
  // stdout only if it's a terminal too.
  class TERMCLIP_API tty_sink : public terminal_sink {
  public:
    bool write(const std::string& bytes) override;
  };

  class TERMCLIP_API memory_sink : public terminal_sink {
  public:
    memory_sink(bool available = true);

    bool write(const std::string& bytes) override;

    const std::string& data() const { return m_data; }
    int writes() const { return m_writes; }

  private:
    bool m_available;
    std::string m_data;
    int m_writes;
  };

  // ======================================================================
  // Transports
  // ======================================================================

  // One strategy to deliver/retrieve clipboard content (a native
  // clipboard command, or the OSC 52 escape sequence).
  class TERMCLIP_API transport {
  public:
    virtual ~transport() { }

    virtual const char* name() const = 0;
    virtual Capability capability() const = 0;

    bool can(Direction direction) const;

    virtual result copy(const payload& data) = 0;

    // Default implementation fails with UnsupportedDirection.
    virtual result paste(payload& output);
  };

  typedef std::unique_ptr<transport> transport_ptr;
  typedef std::vector<transport_ptr> transport_list;

  // ======================================================================
  // OSC 52
  // ======================================================================

  // Standard alphabet, with padding, without line wrapping.
  TERMCLIP_API std::string base64_encode(const payload& data);
  TERMCLIP_API bool base64_decode(const std::string& text, payload& data);

  // Creates the "ESC ] 52 ; c ; <base64> BEL" sequence wrapped for
  // the given multiplexer. Returns ErrorCode::PayloadTooLarge (and
  // leaves "sequence" empty) if the base64 text is longer than
  // "max_b64".
  TERMCLIP_API ErrorCode encode_osc52(const payload& data,
                                      Multiplexer multiplexer,
                                      std::size_t max_b64,
                                      std::string& sequence);

  // Strips the multiplexer framing of a sequence generated by
  // encode_osc52() and returns the base64 text.
  TERMCLIP_API bool extract_osc52_base64(const std::string& sequence,
                                         std::string& b64);

  // ======================================================================
  // Transport selection
  // ======================================================================

  // Ordered list of candidates to try for the given context and
  // direction. The host and tty must outlive the returned list.
  TERMCLIP_API transport_list resolve(const environment_context& ctx,
                                      Direction direction,
                                      host& system,
                                      terminal_sink& tty);

  // Tries each candidate in order until one copies the data.
  TERMCLIP_API result execute(const transport_list& list,
                              const payload& data);

  // Tries each paste-capable candidate in order until one retrieves
  // the clipboard content.
  TERMCLIP_API result execute_paste(const transport_list& list,
                                    payload& output);

  TERMCLIP_API std::vector<std::string> candidate_names(const transport_list& list);

  // ======================================================================
  // High-level API
  // ======================================================================

  TERMCLIP_API result copy(const environment_context& ctx,
                           const payload& data,
                           host& system,
                           terminal_sink& tty);
  TERMCLIP_API result paste(const environment_context& ctx,
                            payload& output,
                            host& system);

  // Uses the process environment, the system host and the terminal.
  TERMCLIP_API result copy(const payload& data);
  TERMCLIP_API result paste(payload& output);

  // ======================================================================
  // Logging
  // ======================================================================

  // Creates the "termclip" logger (stderr). With "debug" each
  // transport attempt is logged.
  TERMCLIP_API void init_logging(bool debug);

} // namespace termclip

#endif // TERMCLIP_H_INCLUDED
